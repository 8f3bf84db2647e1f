/**
 * @file test_notification_hub.cpp
 * @brief Unit tests for BLENotificationHub.h/cpp - Subscriber arena and fan-out
 */

#include <unity.h>
#include "BLENotificationHub.h"

#include <chrono>
#include <thread>

using namespace BLEC;

using SubscriberId = BLENotificationHub::SubscriberId;

static BLENotificationHub* hub = nullptr;

static NotificationEvent notification(const std::string& characteristic, uint8_t value,
                                      uint32_t generation = 1) {
    NotificationEvent event;
    event.characteristic = normalizeUUID(characteristic);
    event.value = Bytes(&value, 1);
    event.generation = generation;
    return event;
}

static CentralEvent state_event(ConnectionState state) {
    CentralEvent event;
    event.type = CentralEventType::CONNECTION_STATE_CHANGED;
    event.state = state;
    return event;
}

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
    hub = new BLENotificationHub(4);
    hub->setGeneration(1);
}

void tearDown(void) {
    delete hub;
    hub = nullptr;
}

// =============================================================================
// SUBSCRIBE TESTS
// =============================================================================

void test_subscribe_returns_valid_id(void) {
    SubscriberId id = hub->subscribe("2a37");
    TEST_ASSERT_TRUE(id != BLENotificationHub::INVALID_SUBSCRIBER);
    TEST_ASSERT_TRUE(hub->isOpen(id));
    TEST_ASSERT_EQUAL_STRING(normalizeUUID("2a37").c_str(), hub->characteristicOf(id).c_str());
    TEST_ASSERT_EQUAL_size_t(1, hub->subscriberCount("2A37"));
}

void test_subscribe_malformed_rejected(void) {
    TEST_ASSERT_EQUAL_UINT32(BLENotificationHub::INVALID_SUBSCRIBER, hub->subscribe("heart-rate"));
    TEST_ASSERT_EQUAL_size_t(0, hub->subscriberCount());
}

void test_arena_full_rejects(void) {
    for (size_t i = 0; i < Limits::MAX_SUBSCRIBERS; i++) {
        TEST_ASSERT_TRUE(hub->subscribeEvents() != BLENotificationHub::INVALID_SUBSCRIBER);
    }
    TEST_ASSERT_EQUAL_UINT32(BLENotificationHub::INVALID_SUBSCRIBER, hub->subscribe("2a37"));
}

void test_unsubscribe_frees_slot_and_invalidates_id(void) {
    SubscriberId first = hub->subscribe("2a37");
    TEST_ASSERT_TRUE(hub->unsubscribe(first));
    TEST_ASSERT_FALSE(hub->unsubscribe(first));

    // Same slot, new serial
    SubscriberId second = hub->subscribe("2a37");
    TEST_ASSERT_TRUE(first != second);
    TEST_ASSERT_EQUAL_UINT32(first & 0xFFFF, second & 0xFFFF);

    hub->publishNotification(notification("2a37", 1));
    CentralEvent event;
    TEST_ASSERT_FALSE(hub->poll(first, event));
    TEST_ASSERT_TRUE(hub->poll(second, event));
}

void test_subscribed_characteristics(void) {
    hub->subscribe("2a37");
    hub->subscribe("2a37");
    hub->subscribe("2a19");
    hub->subscribeEvents();

    std::set<std::string> characteristics = hub->subscribedCharacteristics();
    TEST_ASSERT_EQUAL_size_t(2, characteristics.size());
    TEST_ASSERT_EQUAL_size_t(4, hub->subscriberCount());
}

// =============================================================================
// FAN-OUT TESTS
// =============================================================================

void test_every_subscriber_receives_each_notification_once(void) {
    SubscriberId a = hub->subscribe("2a37");
    SubscriberId b = hub->subscribe("2a37");

    TEST_ASSERT_EQUAL_size_t(2, hub->publishNotification(notification("2a37", 72)));

    CentralEvent event;
    TEST_ASSERT_TRUE(hub->poll(a, event));
    TEST_ASSERT_EQUAL(CentralEventType::NOTIFICATION, event.type);
    TEST_ASSERT_EQUAL_UINT8(72, event.notification.value.data()[0]);
    TEST_ASSERT_FALSE(hub->poll(a, event));

    TEST_ASSERT_TRUE(hub->poll(b, event));
    TEST_ASSERT_EQUAL_UINT8(72, event.notification.value.data()[0]);
    TEST_ASSERT_FALSE(hub->poll(b, event));
}

void test_other_characteristic_not_delivered(void) {
    SubscriberId battery = hub->subscribe("2a19");
    TEST_ASSERT_EQUAL_size_t(0, hub->publishNotification(notification("2a37", 72)));
    TEST_ASSERT_EQUAL_size_t(0, hub->pending(battery));
}

void test_events_go_to_event_subscribers_only(void) {
    SubscriberId events = hub->subscribeEvents();
    SubscriberId heart = hub->subscribe("2a37");

    TEST_ASSERT_EQUAL_size_t(1, hub->publishEvent(state_event(ConnectionState::CONNECTING)));
    hub->publishNotification(notification("2a37", 72));

    TEST_ASSERT_EQUAL_size_t(1, hub->pending(events));
    TEST_ASSERT_EQUAL_size_t(1, hub->pending(heart));

    CentralEvent event;
    TEST_ASSERT_TRUE(hub->poll(events, event));
    TEST_ASSERT_EQUAL(ConnectionState::CONNECTING, event.state);
}

void test_full_mailbox_drops_for_that_subscriber_only(void) {
    SubscriberId slow = hub->subscribe("2a37", 2);
    SubscriberId fast = hub->subscribe("2a37");

    CentralEvent event;
    for (uint8_t i = 0; i < 4; i++) {
        hub->publishNotification(notification("2a37", i));
        TEST_ASSERT_TRUE(hub->poll(fast, event));
        TEST_ASSERT_EQUAL_UINT8(i, event.notification.value.data()[0]);
    }

    TEST_ASSERT_EQUAL_size_t(2, hub->pending(slow));
    TEST_ASSERT_EQUAL_UINT32(2, hub->droppedCount(slow));
    TEST_ASSERT_EQUAL_UINT32(0, hub->droppedCount(fast));

    // Oldest events are kept
    TEST_ASSERT_TRUE(hub->poll(slow, event));
    TEST_ASSERT_EQUAL_UINT8(0, event.notification.value.data()[0]);
}

// =============================================================================
// GENERATION TESTS
// =============================================================================

void test_stale_generation_discarded(void) {
    SubscriberId id = hub->subscribe("2a37");
    hub->setGeneration(2);

    TEST_ASSERT_EQUAL_size_t(0, hub->publishNotification(notification("2a37", 1, 1)));
    TEST_ASSERT_EQUAL_size_t(1, hub->publishNotification(notification("2a37", 2, 2)));
    TEST_ASSERT_EQUAL_UINT32(1, hub->staleDiscarded());
    TEST_ASSERT_EQUAL_size_t(1, hub->pending(id));
}

void test_close_keeps_pending_then_releases(void) {
    SubscriberId heart = hub->subscribe("2a37");
    SubscriberId events = hub->subscribeEvents();
    hub->publishNotification(notification("2a37", 72));

    TEST_ASSERT_EQUAL_size_t(1, hub->closeCharacteristicSubscribers());
    TEST_ASSERT_FALSE(hub->isOpen(heart));
    TEST_ASSERT_TRUE(hub->isOpen(events));
    TEST_ASSERT_EQUAL_size_t(0, hub->subscriberCount("2a37"));

    // Nothing new after close
    TEST_ASSERT_EQUAL_size_t(0, hub->publishNotification(notification("2a37", 73)));

    CentralEvent event;
    TEST_ASSERT_TRUE(hub->poll(heart, event));
    TEST_ASSERT_EQUAL_UINT8(72, event.notification.value.data()[0]);
    TEST_ASSERT_FALSE(hub->poll(heart, event));

    // Drained: slot released
    TEST_ASSERT_EQUAL_size_t(1, hub->subscriberCount());
    TEST_ASSERT_FALSE(hub->unsubscribe(heart));
}

void test_close_twice_counts_once(void) {
    hub->subscribe("2a37");
    TEST_ASSERT_EQUAL_size_t(1, hub->closeCharacteristicSubscribers());
    TEST_ASSERT_EQUAL_size_t(0, hub->closeCharacteristicSubscribers());
}

// =============================================================================
// WAIT TESTS
// =============================================================================

void test_wait_times_out_when_empty(void) {
    SubscriberId id = hub->subscribeEvents();
    CentralEvent event;
    TEST_ASSERT_FALSE(hub->wait(id, event, 20));
}

void test_wait_returns_queued_event_immediately(void) {
    SubscriberId id = hub->subscribeEvents();
    hub->publishEvent(state_event(ConnectionState::CONNECTED));
    CentralEvent event;
    TEST_ASSERT_TRUE(hub->wait(id, event, 0));
    TEST_ASSERT_EQUAL(ConnectionState::CONNECTED, event.state);
}

void test_wait_woken_by_publisher_thread(void) {
    SubscriberId id = hub->subscribe("2a37");

    std::thread publisher([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        hub->publishNotification(notification("2a37", 99));
    });

    CentralEvent event;
    bool received = hub->wait(id, event, 2000);
    publisher.join();

    TEST_ASSERT_TRUE(received);
    TEST_ASSERT_EQUAL_UINT8(99, event.notification.value.data()[0]);
}

void test_wait_woken_by_unsubscribe(void) {
    SubscriberId id = hub->subscribe("2a37");

    std::thread remover([id]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        hub->unsubscribe(id);
    });

    CentralEvent event;
    auto started = std::chrono::steady_clock::now();
    bool received = hub->wait(id, event, 5000);
    auto waited = std::chrono::steady_clock::now() - started;
    remover.join();

    TEST_ASSERT_FALSE(received);
    TEST_ASSERT_TRUE(waited < std::chrono::seconds(4));
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Subscribe Tests
    RUN_TEST(test_subscribe_returns_valid_id);
    RUN_TEST(test_subscribe_malformed_rejected);
    RUN_TEST(test_arena_full_rejects);
    RUN_TEST(test_unsubscribe_frees_slot_and_invalidates_id);
    RUN_TEST(test_subscribed_characteristics);

    // Fan-out Tests
    RUN_TEST(test_every_subscriber_receives_each_notification_once);
    RUN_TEST(test_other_characteristic_not_delivered);
    RUN_TEST(test_events_go_to_event_subscribers_only);
    RUN_TEST(test_full_mailbox_drops_for_that_subscriber_only);

    // Generation Tests
    RUN_TEST(test_stale_generation_discarded);
    RUN_TEST(test_close_keeps_pending_then_releases);
    RUN_TEST(test_close_twice_counts_once);

    // Wait Tests
    RUN_TEST(test_wait_times_out_when_empty);
    RUN_TEST(test_wait_returns_queued_event_immediately);
    RUN_TEST(test_wait_woken_by_publisher_thread);
    RUN_TEST(test_wait_woken_by_unsubscribe);

    return UNITY_END();
}
