/**
 * @file test_device_registry.cpp
 * @brief Unit tests for BLEDeviceRegistry.h/cpp - Discovered peripheral table
 */

#include <unity.h>
#include "BLEDeviceRegistry.h"
#include "Utilities/OS.h"

using namespace BLEC;

static uint64_t time_offset_ms = 0;

static void advance_time(double seconds) {
    time_offset_ms += static_cast<uint64_t>(seconds * 1000);
    RNS::Utilities::OS::setTimeOffset(time_offset_ms);
}

static BLEAddress address(uint8_t last) {
    const uint8_t bytes[6] = {0xC4, 0x7F, 0x51, 0x0A, 0x22, last};
    return BLEAddress(bytes);
}

static ScanResult advertisement(uint8_t last, int8_t rssi, const std::string& name = "",
                                const std::string& service = "") {
    ScanResult result;
    result.address = address(last);
    result.name = name;
    result.rssi = rssi;
    result.connectable = true;
    if (!service.empty()) {
        result.service_uuids.push_back(normalizeUUID(service));
    }
    return result;
}

static BLEDeviceRegistry* registry = nullptr;

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
    registry = new BLEDeviceRegistry(4, 30.0);
}

void tearDown(void) {
    delete registry;
    registry = nullptr;
}

// =============================================================================
// UPSERT TESTS
// =============================================================================

void test_first_advertisement_creates_record(void) {
    DeviceRecord record;
    TEST_ASSERT_TRUE(registry->onAdvertisement(advertisement(1, -60, "HRM-Pro", "180d"), &record));
    TEST_ASSERT_EQUAL_size_t(1, registry->size());
    TEST_ASSERT_EQUAL_STRING("HRM-Pro", record.name.c_str());
    TEST_ASSERT_EQUAL_INT8(-60, record.rssi);
    TEST_ASSERT_EQUAL_INT8(-60, record.rssi_avg);
    TEST_ASSERT_EQUAL_UINT32(1, record.advertisement_count);
    TEST_ASSERT_TRUE(record.advertises("180d"));
}

void test_repeat_advertisement_updates_record(void) {
    registry->onAdvertisement(advertisement(1, -60, "HRM-Pro"));
    advance_time(2.0);

    DeviceRecord record;
    TEST_ASSERT_FALSE(registry->onAdvertisement(advertisement(1, -70, "HRM-Pro"), &record));
    TEST_ASSERT_EQUAL_size_t(1, registry->size());
    TEST_ASSERT_EQUAL_UINT32(2, record.advertisement_count);
    TEST_ASSERT_EQUAL_INT8(-70, record.rssi);
    TEST_ASSERT_TRUE(record.last_seen > record.discovered_at);
}

void test_rssi_average_is_smoothed(void) {
    registry->onAdvertisement(advertisement(1, -60));
    DeviceRecord record;
    registry->onAdvertisement(advertisement(1, -70), &record);
    // 0.7 * -60 + 0.3 * -70
    TEST_ASSERT_INT_WITHIN(1, -63, record.rssi_avg);
}

void test_missing_name_keeps_previous(void) {
    registry->onAdvertisement(advertisement(1, -60, "HRM-Pro"));
    DeviceRecord record;
    registry->onAdvertisement(advertisement(1, -61), &record);
    TEST_ASSERT_EQUAL_STRING("HRM-Pro", record.name.c_str());
}

void test_services_accumulate(void) {
    registry->onAdvertisement(advertisement(1, -60, "", "180d"));
    registry->onAdvertisement(advertisement(1, -60, "", "180f"));
    registry->onAdvertisement(advertisement(1, -60, "", "180d"));

    DeviceRecord record;
    TEST_ASSERT_TRUE(registry->get(address(1), record));
    TEST_ASSERT_EQUAL_size_t(2, record.service_uuids.size());
    TEST_ASSERT_TRUE(record.advertises("180f"));
}

void test_zero_address_ignored(void) {
    ScanResult result;
    result.rssi = -50;
    TEST_ASSERT_FALSE(registry->onAdvertisement(result));
    TEST_ASSERT_EQUAL_size_t(0, registry->size());
}

// =============================================================================
// CAPACITY TESTS
// =============================================================================

void test_full_registry_evicts_least_recently_seen(void) {
    for (uint8_t i = 1; i <= 4; i++) {
        registry->onAdvertisement(advertisement(i, -60));
        advance_time(1.0);
    }
    // Refresh device 1 so device 2 is now the oldest
    registry->onAdvertisement(advertisement(1, -60));
    advance_time(1.0);

    registry->onAdvertisement(advertisement(5, -60));
    TEST_ASSERT_EQUAL_size_t(4, registry->size());
    TEST_ASSERT_TRUE(registry->contains(address(1)));
    TEST_ASSERT_FALSE(registry->contains(address(2)));
    TEST_ASSERT_TRUE(registry->contains(address(5)));
}

void test_pinned_device_survives_eviction(void) {
    for (uint8_t i = 1; i <= 4; i++) {
        registry->onAdvertisement(advertisement(i, -60));
        advance_time(1.0);
    }
    registry->pin(address(1));

    registry->onAdvertisement(advertisement(5, -60));
    TEST_ASSERT_TRUE(registry->contains(address(1)));
    TEST_ASSERT_FALSE(registry->contains(address(2)));
}

void test_shrinking_capacity_evicts(void) {
    for (uint8_t i = 1; i <= 4; i++) {
        registry->onAdvertisement(advertisement(i, -60));
        advance_time(1.0);
    }
    registry->setMaxDevices(2);
    TEST_ASSERT_EQUAL_size_t(2, registry->size());
    TEST_ASSERT_TRUE(registry->contains(address(3)));
    TEST_ASSERT_TRUE(registry->contains(address(4)));
}

// =============================================================================
// STALENESS TESTS
// =============================================================================

void test_prune_removes_stale_records(void) {
    registry->onAdvertisement(advertisement(1, -60));
    advance_time(20.0);
    registry->onAdvertisement(advertisement(2, -60));
    advance_time(15.0);

    TEST_ASSERT_EQUAL_size_t(1, registry->prune());
    TEST_ASSERT_FALSE(registry->contains(address(1)));
    TEST_ASSERT_TRUE(registry->contains(address(2)));
}

void test_prune_keeps_pinned_record(void) {
    registry->onAdvertisement(advertisement(1, -60));
    registry->pin(address(1));
    advance_time(60.0);

    TEST_ASSERT_EQUAL_size_t(0, registry->prune());
    TEST_ASSERT_TRUE(registry->contains(address(1)));

    registry->unpin();
    TEST_ASSERT_EQUAL_size_t(1, registry->prune());
}

void test_list_excludes_stale_before_prune(void) {
    registry->onAdvertisement(advertisement(1, -60));
    advance_time(31.0);
    registry->onAdvertisement(advertisement(2, -60));

    std::vector<DeviceRecord> devices = registry->list();
    TEST_ASSERT_EQUAL_size_t(1, devices.size());
    TEST_ASSERT_TRUE(devices[0].address == address(2));
    TEST_ASSERT_EQUAL_size_t(2, registry->size());
}

void test_stale_window_configurable(void) {
    registry->setStaleAfter(5.0);
    registry->onAdvertisement(advertisement(1, -60));
    advance_time(6.0);
    TEST_ASSERT_EQUAL_size_t(1, registry->prune());
}

// =============================================================================
// SNAPSHOT TESTS
// =============================================================================

void test_list_filters_by_service(void) {
    registry->onAdvertisement(advertisement(1, -60, "HRM", "180d"));
    registry->onAdvertisement(advertisement(2, -60, "Thermo", "181a"));

    ScanFilter filter;
    filter.service_uuids.push_back("181A");
    std::vector<DeviceRecord> devices = registry->list(filter);
    TEST_ASSERT_EQUAL_size_t(1, devices.size());
    TEST_ASSERT_EQUAL_STRING("Thermo", devices[0].name.c_str());
}

void test_list_filters_by_rssi(void) {
    registry->onAdvertisement(advertisement(1, -55));
    registry->onAdvertisement(advertisement(2, -90));

    ScanFilter filter;
    filter.min_rssi = -80;
    TEST_ASSERT_EQUAL_size_t(1, registry->list(filter).size());
}

void test_list_is_snapshot(void) {
    registry->onAdvertisement(advertisement(1, -60, "Before"));
    std::vector<DeviceRecord> snapshot = registry->list();

    registry->onAdvertisement(advertisement(1, -60, "After"));
    registry->remove(address(1));

    TEST_ASSERT_EQUAL_size_t(1, snapshot.size());
    TEST_ASSERT_EQUAL_STRING("Before", snapshot[0].name.c_str());
    TEST_ASSERT_EQUAL_size_t(0, registry->size());
}

void test_get_unknown_returns_false(void) {
    DeviceRecord record;
    TEST_ASSERT_FALSE(registry->get(address(9), record));
}

void test_clear_empties_registry(void) {
    registry->onAdvertisement(advertisement(1, -60));
    registry->onAdvertisement(advertisement(2, -60));
    registry->clear();
    TEST_ASSERT_EQUAL_size_t(0, registry->size());
    TEST_ASSERT_EQUAL_size_t(0, registry->list().size());
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Upsert Tests
    RUN_TEST(test_first_advertisement_creates_record);
    RUN_TEST(test_repeat_advertisement_updates_record);
    RUN_TEST(test_rssi_average_is_smoothed);
    RUN_TEST(test_missing_name_keeps_previous);
    RUN_TEST(test_services_accumulate);
    RUN_TEST(test_zero_address_ignored);

    // Capacity Tests
    RUN_TEST(test_full_registry_evicts_least_recently_seen);
    RUN_TEST(test_pinned_device_survives_eviction);
    RUN_TEST(test_shrinking_capacity_evicts);

    // Staleness Tests
    RUN_TEST(test_prune_removes_stale_records);
    RUN_TEST(test_prune_keeps_pinned_record);
    RUN_TEST(test_list_excludes_stale_before_prune);
    RUN_TEST(test_stale_window_configurable);

    // Snapshot Tests
    RUN_TEST(test_list_filters_by_service);
    RUN_TEST(test_list_filters_by_rssi);
    RUN_TEST(test_list_is_snapshot);
    RUN_TEST(test_get_unknown_returns_false);
    RUN_TEST(test_clear_empties_registry);

    return UNITY_END();
}
