/**
 * @file BLENotificationHub.h
 * @brief Fan-out of characteristic notifications and connection events
 *
 * Subscribers live in a fixed arena of slots and are addressed by
 * SubscriberId tokens (slot index plus a serial), never by pointers back into
 * the hub. Each slot owns a bounded mailbox: publishing appends to every
 * matching mailbox without blocking, and a full mailbox drops the event for
 * that subscriber only, counting the drop.
 *
 * The subscriber set is guarded by one lock; delivery into a mailbox only
 * takes that mailbox's own lock, so a slow reader never stalls publishers.
 */
#pragma once

#include "BLETypes.h"
#include "BLEServiceMap.h"
#include "BLEDeviceRegistry.h"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace BLEC {

/**
 * @brief Value pushed by the peripheral for a subscribed characteristic
 */
struct NotificationEvent {
    std::string characteristic;         // Normalized characteristic UUID
    Bytes value;
    uint32_t generation = 0;            // Connection generation it arrived on
};

/**
 * @brief Event kinds surfaced to the host application
 */
enum class CentralEventType : uint8_t {
    DEVICE_DISCOVERED,
    CONNECTION_STATE_CHANGED,
    READY,
    CONNECTION_FAILED,
    NOTIFICATION,
    SCAN_COMPLETE
};

/**
 * @brief Host-visible event
 *
 * Only the fields relevant to the event type are populated.
 */
struct CentralEvent {
    CentralEventType type = CentralEventType::CONNECTION_STATE_CHANGED;
    uint32_t generation = 0;
    BLEAddress address;
    ConnectionState state = ConnectionState::DISCONNECTED;   // CONNECTION_STATE_CHANGED
    OperationResult reason = OperationResult::SUCCESS;        // CONNECTION_FAILED
    DeviceRecord device;                                      // DEVICE_DISCOVERED
    ServiceMapPtr services;                                   // READY
    NotificationEvent notification;                           // NOTIFICATION
};

const char* eventTypeToString(CentralEventType type);

/**
 * @brief Subscriber arena with per-subscriber bounded mailboxes
 */
class BLENotificationHub {
public:
    /**
     * @brief Subscriber token
     *
     * Low 16 bits: slot index + 1. High 16 bits: slot serial. Zero is never
     * a valid id.
     */
    using SubscriberId = uint32_t;
    static constexpr SubscriberId INVALID_SUBSCRIBER = 0;

    explicit BLENotificationHub(size_t default_capacity = Limits::SUBSCRIBER_QUEUE_DEPTH);

    //=========================================================================
    // Subscriber Management
    //=========================================================================

    /**
     * @brief Subscribe to notifications of one characteristic
     *
     * @param characteristic Characteristic UUID (any accepted form)
     * @param capacity Mailbox depth, 0 selects the default
     * @return Subscriber id, or INVALID_SUBSCRIBER if the UUID is malformed
     *         or the arena is full
     */
    SubscriberId subscribe(const std::string& characteristic, size_t capacity = 0);

    /**
     * @brief Subscribe to connection lifecycle events (everything except
     *        characteristic notifications)
     */
    SubscriberId subscribeEvents(size_t capacity = 0);

    /**
     * @brief Remove a subscriber; pending events are discarded
     * @return false if the id is not live
     */
    bool unsubscribe(SubscriberId id);

    /**
     * @brief Close every characteristic subscriber
     *
     * Called when the connection generation advances. Closed subscribers
     * keep their undelivered events readable but receive nothing new, and
     * are released once drained or unsubscribed.
     *
     * @return Number of subscribers closed
     */
    size_t closeCharacteristicSubscribers();

    /**
     * @brief Characteristics with at least one open subscriber
     */
    std::set<std::string> subscribedCharacteristics() const;

    size_t subscriberCount() const;
    size_t subscriberCount(const std::string& characteristic) const;

    /**
     * @brief Characteristic a subscriber listens to (empty for event subscribers)
     */
    std::string characteristicOf(SubscriberId id) const;

    //=========================================================================
    // Reading
    //=========================================================================

    /**
     * @brief Take the next event without blocking
     * @return false if the mailbox is empty or the id is not live
     */
    bool poll(SubscriberId id, CentralEvent& event_out);

    /**
     * @brief Take the next event, waiting up to timeout_ms
     * @return false on timeout, on close, or if the id is not live
     */
    bool wait(SubscriberId id, CentralEvent& event_out, uint32_t timeout_ms);

    /**
     * @brief Check whether a subscriber still receives events
     */
    bool isOpen(SubscriberId id) const;

    size_t pending(SubscriberId id) const;

    /**
     * @brief Number of events dropped because the mailbox was full
     */
    uint32_t droppedCount(SubscriberId id) const;

    //=========================================================================
    // Publishing
    //=========================================================================

    /**
     * @brief Set the generation notifications must carry to be delivered
     */
    void setGeneration(uint32_t generation);
    uint32_t generation() const;

    /**
     * @brief Deliver a notification to its characteristic's subscribers
     *
     * Notifications tagged with a stale generation are discarded.
     * @return Number of mailboxes the event was appended to
     */
    size_t publishNotification(const NotificationEvent& notification);

    /**
     * @brief Deliver a lifecycle event to event subscribers
     * @return Number of mailboxes the event was appended to
     */
    size_t publishEvent(const CentralEvent& event);

    /**
     * @brief Total notifications discarded for a stale generation
     */
    uint32_t staleDiscarded() const;

private:
    struct Mailbox {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<CentralEvent> events;
        size_t capacity = Limits::SUBSCRIBER_QUEUE_DEPTH;
        uint32_t dropped = 0;
        bool closed = false;

        bool push(const CentralEvent& event);
    };

    enum class SlotKind : uint8_t {
        CHARACTERISTIC,
        EVENTS
    };

    /**
     * @brief Arena slot
     */
    struct SubscriberSlot {
        bool in_use = false;
        uint16_t serial = 0;
        SlotKind kind = SlotKind::EVENTS;
        std::string characteristic;
        std::shared_ptr<Mailbox> mailbox;

        void clear() {
            in_use = false;
            characteristic.clear();
            mailbox.reset();
        }
    };

    SubscriberId allocate(SlotKind kind, const std::string& characteristic, size_t capacity);
    std::shared_ptr<Mailbox> mailboxFor(SubscriberId id) const;
    const SubscriberSlot* findSlot(SubscriberId id) const;
    size_t publishTo(const std::vector<std::shared_ptr<Mailbox>>& targets, const CentralEvent& event);

    mutable std::mutex _mutex;
    SubscriberSlot _slots[Limits::MAX_SUBSCRIBERS];
    size_t _default_capacity;
    uint32_t _generation = 0;
    uint32_t _stale_discarded = 0;
};

} // namespace BLEC
