/**
 * @file test_simulated_platform.cpp
 * @brief Unit tests for platforms/SimulatedPlatform.h/cpp - Scriptable radio
 */

#include <unity.h>
#include "BLEPlatform.h"
#include "platforms/SimulatedPlatform.h"
#include "Utilities/OS.h"

#include <memory>
#include <vector>

using namespace BLEC;

static uint64_t time_offset_ms = 0;

static std::shared_ptr<SimulatedPlatform> radio;
static SimulatedPeripheral hrm;

static void advance(double seconds, double step = 0.01) {
    for (double elapsed = 0; elapsed < seconds; elapsed += step) {
        time_offset_ms += static_cast<uint64_t>(step * 1000);
        RNS::Utilities::OS::setTimeOffset(time_offset_ms);
        radio->loop();
    }
}

// Connect with defaults and return the handle, or 0xFFFF on failure
static uint16_t connect_now(const BLEAddress& address) {
    uint16_t handle = 0xFFFF;
    radio->connect(address, 1000, [&handle](OperationResult result, uint16_t conn_handle) {
        if (result == OperationResult::SUCCESS) {
            handle = conn_handle;
        }
    });
    advance(0.2);
    return handle;
}

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
    radio = std::make_shared<SimulatedPlatform>();

    hrm = SimulatedPeripheral();
    hrm.address = BLEAddress::fromString("C4:7F:51:0A:22:01");
    hrm.name = "HRM-Pro";
    hrm.rssi = -58;
    hrm.advertised_services.push_back("180d");
    hrm.services.addCharacteristic("180d", CharacteristicInfo{"2a37", 3, Property::NOTIFY});
    hrm.services.addCharacteristic("180d", CharacteristicInfo{"2a38", 5, Property::READ});
    hrm.services.addCharacteristic("180d", CharacteristicInfo{"2a39", 7, Property::WRITE});
    const uint8_t chest = 0x01;
    hrm.values["2a38"] = Bytes(&chest, 1);
    radio->addPeripheral(hrm);

    radio->setLatency(0.05);
    radio->initialize(PlatformConfig());
    radio->start();
}

void tearDown(void) {
    radio->shutdown();
    radio.reset();
}

// =============================================================================
// FACTORY TESTS
// =============================================================================

void test_factory_creates_simulated_platform(void) {
    IBLEPlatform::Ptr platform = BLEPlatformFactory::create(PlatformType::SIMULATED);
    TEST_ASSERT_NOT_NULL(platform.get());
    TEST_ASSERT_EQUAL(PlatformType::SIMULATED, platform->getPlatformType());
    TEST_ASSERT_EQUAL_STRING("Simulated", platform->getPlatformName().c_str());
}

void test_factory_detects_build_platform(void) {
    TEST_ASSERT_EQUAL(PlatformType::SIMULATED, BLEPlatformFactory::getDetectedPlatform());
    TEST_ASSERT_NOT_NULL(BLEPlatformFactory::create().get());
}

void test_factory_parses_names(void) {
    TEST_ASSERT_EQUAL(PlatformType::SIMULATED, BLEPlatformFactory::fromName("sim"));
    TEST_ASSERT_EQUAL(PlatformType::NONE, BLEPlatformFactory::fromName("nimble"));
    TEST_ASSERT_NULL(BLEPlatformFactory::create(PlatformType::NONE).get());
}

// =============================================================================
// LIFECYCLE TESTS
// =============================================================================

void test_start_requires_initialize(void) {
    SimulatedPlatform fresh;
    TEST_ASSERT_FALSE(fresh.start());
    TEST_ASSERT_TRUE(fresh.initialize(PlatformConfig()));
    TEST_ASSERT_TRUE(fresh.start());
    TEST_ASSERT_TRUE(fresh.isRunning());
}

void test_calls_refused_when_stopped(void) {
    radio->stop();
    TEST_ASSERT_FALSE(radio->startScan(ScanFilter()));
    TEST_ASSERT_FALSE(radio->connect(hrm.address, 1000, [](OperationResult, uint16_t) {}));
}

// =============================================================================
// SCAN TESTS
// =============================================================================

void test_scan_reports_matching_advertisements(void) {
    SimulatedPeripheral thermo;
    thermo.address = BLEAddress::fromString("E0:11:9C:40:7B:3D");
    thermo.name = "Thermo";
    thermo.advertised_services.push_back("181a");
    radio->addPeripheral(thermo);

    std::vector<ScanResult> results;
    radio->setOnScanResult([&results](const ScanResult& result) {
        results.push_back(result);
    });

    ScanFilter filter;
    filter.service_uuids.push_back("180d");
    TEST_ASSERT_TRUE(radio->startScan(filter));
    TEST_ASSERT_TRUE(radio->isScanning());
    advance(0.05);

    TEST_ASSERT_EQUAL_size_t(1, results.size());
    TEST_ASSERT_EQUAL_STRING("HRM-Pro", results[0].name.c_str());
    TEST_ASSERT_EQUAL_INT8(-58, results[0].rssi);
    TEST_ASSERT_EQUAL_STRING(normalizeUUID("180d").c_str(), results[0].service_uuids[0].c_str());
}

void test_scan_repeats_advertisements(void) {
    size_t count = 0;
    radio->setOnScanResult([&count](const ScanResult&) { count++; });
    radio->setAdvertisingInterval(0.1);
    radio->startScan(ScanFilter());
    advance(0.55);
    TEST_ASSERT_TRUE(count >= 5);
}

void test_bounded_scan_completes(void) {
    bool completed = false;
    radio->setOnScanComplete([&completed]() { completed = true; });
    radio->startScan(ScanFilter(), 300);

    advance(0.2);
    TEST_ASSERT_FALSE(completed);
    advance(0.2);
    TEST_ASSERT_TRUE(completed);
    TEST_ASSERT_FALSE(radio->isScanning());
}

void test_scan_interval_from_config(void) {
    PlatformConfig config;
    config.scan_interval_ms = 250;
    TEST_ASSERT_TRUE(radio->initialize(config));

    size_t count = 0;
    radio->setOnScanResult([&count](const ScanResult&) { count++; });
    radio->startScan(ScanFilter());
    advance(1.0);
    TEST_ASSERT_TRUE(count >= 4 && count <= 5);
}

void test_default_scan_duration_from_config(void) {
    PlatformConfig config;
    config.scan_duration_ms = 300;
    TEST_ASSERT_TRUE(radio->initialize(config));

    bool completed = false;
    radio->setOnScanComplete([&completed]() { completed = true; });
    radio->startScan(ScanFilter());

    advance(0.2);
    TEST_ASSERT_FALSE(completed);
    advance(0.2);
    TEST_ASSERT_TRUE(completed);
    TEST_ASSERT_FALSE(radio->isScanning());
}

void test_stop_scan_does_not_report_complete(void) {
    bool completed = false;
    radio->setOnScanComplete([&completed]() { completed = true; });
    radio->startScan(ScanFilter(), 300);
    radio->stopScan();
    advance(0.5);
    TEST_ASSERT_FALSE(completed);
}

void test_connected_peripheral_stops_advertising(void) {
    connect_now(hrm.address);
    size_t count = 0;
    radio->setOnScanResult([&count](const ScanResult&) { count++; });
    radio->startScan(ScanFilter());
    advance(0.3);
    TEST_ASSERT_EQUAL_size_t(0, count);
}

// =============================================================================
// CONNECT TESTS
// =============================================================================

void test_connect_succeeds_after_latency(void) {
    OperationResult result = OperationResult::PENDING;
    uint16_t handle = 0xFFFF;
    TEST_ASSERT_TRUE(radio->connect(hrm.address, 1000,
        [&result, &handle](OperationResult r, uint16_t h) { result = r; handle = h; }));

    TEST_ASSERT_EQUAL(OperationResult::PENDING, result);
    advance(0.1);
    TEST_ASSERT_EQUAL(OperationResult::SUCCESS, result);
    TEST_ASSERT_TRUE(handle != 0xFFFF);
    TEST_ASSERT_TRUE(radio->isConnected(hrm.address));
    TEST_ASSERT_EQUAL_size_t(1, radio->connectAttempts(hrm.address));
}

void test_connect_unknown_peripheral_times_out(void) {
    OperationResult result = OperationResult::PENDING;
    radio->connect(BLEAddress::fromString("01:02:03:04:05:06"), 500,
        [&result](OperationResult r, uint16_t) { result = r; });

    advance(0.4);
    TEST_ASSERT_EQUAL(OperationResult::PENDING, result);
    advance(0.2);
    TEST_ASSERT_EQUAL(OperationResult::TIMEOUT, result);
}

void test_scripted_failure_then_default_success(void) {
    radio->scriptConnect(hrm.address, SimulatedStep::fail(0.1, OperationResult::ADAPTER_ERROR));

    OperationResult first = OperationResult::PENDING;
    radio->connect(hrm.address, 1000, [&first](OperationResult r, uint16_t) { first = r; });
    advance(0.2);
    TEST_ASSERT_EQUAL(OperationResult::ADAPTER_ERROR, first);
    TEST_ASSERT_FALSE(radio->isConnected(hrm.address));

    TEST_ASSERT_TRUE(connect_now(hrm.address) != 0xFFFF);
    TEST_ASSERT_EQUAL_size_t(2, radio->connectAttempts(hrm.address));
}

void test_scripted_stall_never_answers(void) {
    radio->scriptConnect(hrm.address, SimulatedStep::stall());
    bool answered = false;
    radio->connect(hrm.address, 500, [&answered](OperationResult, uint16_t) { answered = true; });
    advance(2.0);
    TEST_ASSERT_FALSE(answered);
}

void test_slow_answer_beyond_timeout_times_out(void) {
    radio->scriptConnect(hrm.address, SimulatedStep::succeed(3.0));
    OperationResult result = OperationResult::PENDING;
    radio->connect(hrm.address, 1000, [&result](OperationResult r, uint16_t) { result = r; });
    advance(1.1);
    TEST_ASSERT_EQUAL(OperationResult::TIMEOUT, result);
    advance(3.0);
    TEST_ASSERT_FALSE(radio->isConnected(hrm.address));
}

void test_refused_call_returns_false_once(void) {
    radio->refuseNextCall();
    bool answered = false;
    TEST_ASSERT_FALSE(radio->connect(hrm.address, 1000, [&answered](OperationResult, uint16_t) { answered = true; }));
    advance(0.2);
    TEST_ASSERT_FALSE(answered);
    TEST_ASSERT_TRUE(connect_now(hrm.address) != 0xFFFF);
}

// =============================================================================
// LINK TESTS
// =============================================================================

void test_disconnect_reports_local_host_reason(void) {
    uint16_t handle = connect_now(hrm.address);
    uint16_t lost_handle = 0;
    uint8_t lost_reason = 0;
    radio->setOnDisconnected([&lost_handle, &lost_reason](uint16_t h, uint8_t reason) {
        lost_handle = h;
        lost_reason = reason;
    });

    TEST_ASSERT_TRUE(radio->disconnect(handle));
    advance(0.1);
    TEST_ASSERT_EQUAL_UINT16(handle, lost_handle);
    TEST_ASSERT_EQUAL_UINT8(SimulatedPlatform::REASON_LOCAL_HOST, lost_reason);
    TEST_ASSERT_EQUAL_size_t(0, radio->connectionCount());
    TEST_ASSERT_FALSE(radio->disconnect(handle));
}

void test_drop_connection_fires_immediately(void) {
    uint16_t handle = connect_now(hrm.address);
    uint16_t lost_handle = 0;
    radio->setOnDisconnected([&lost_handle](uint16_t h, uint8_t) { lost_handle = h; });

    TEST_ASSERT_TRUE(radio->dropConnection(hrm.address));
    TEST_ASSERT_EQUAL_UINT16(handle, lost_handle);
    TEST_ASSERT_FALSE(radio->dropConnection(hrm.address));
}

void test_new_connection_gets_new_handle(void) {
    uint16_t first = connect_now(hrm.address);
    radio->dropConnection(hrm.address);
    uint16_t second = connect_now(hrm.address);
    TEST_ASSERT_TRUE(second != 0xFFFF);
    TEST_ASSERT_TRUE(first != second);
}

// =============================================================================
// DISCOVERY TESTS
// =============================================================================

void test_discovery_returns_gatt_table(void) {
    uint16_t handle = connect_now(hrm.address);
    OperationResult result = OperationResult::PENDING;
    ServiceMap services;
    TEST_ASSERT_TRUE(radio->discoverServices(handle,
        [&result, &services](OperationResult r, const ServiceMap& map) { result = r; services = map; }));
    advance(0.1);

    TEST_ASSERT_EQUAL(OperationResult::SUCCESS, result);
    TEST_ASSERT_TRUE(services.hasService("180d"));
    TEST_ASSERT_EQUAL_size_t(3, services.characteristicCount());
}

void test_scripted_discovery_failure(void) {
    radio->scriptDiscovery(hrm.address, SimulatedStep::fail(0.05, OperationResult::DISCOVERY_FAILED));
    uint16_t handle = connect_now(hrm.address);
    OperationResult result = OperationResult::PENDING;
    radio->discoverServices(handle, [&result](OperationResult r, const ServiceMap&) { result = r; });
    advance(0.1);
    TEST_ASSERT_EQUAL(OperationResult::DISCOVERY_FAILED, result);
}

void test_discovery_on_unknown_handle_refused(void) {
    TEST_ASSERT_FALSE(radio->discoverServices(42, [](OperationResult, const ServiceMap&) {}));
}

// =============================================================================
// GATT TESTS
// =============================================================================

void test_read_returns_value(void) {
    uint16_t handle = connect_now(hrm.address);
    OperationResult result = OperationResult::PENDING;
    Bytes value;
    radio->read(handle, "2a38", [&result, &value](OperationResult r, const Bytes& data) {
        result = r;
        value = data;
    });
    advance(0.1);
    TEST_ASSERT_EQUAL(OperationResult::SUCCESS, result);
    TEST_ASSERT_EQUAL_size_t(1, value.size());
    TEST_ASSERT_EQUAL_UINT8(0x01, value.data()[0]);
}

void test_write_records_payload(void) {
    uint16_t handle = connect_now(hrm.address);
    const uint8_t reset = 0x01;
    OperationResult result = OperationResult::PENDING;
    radio->write(handle, "2a39", Bytes(&reset, 1), true,
                 [&result](OperationResult r, const Bytes&) { result = r; });
    advance(0.1);
    TEST_ASSERT_EQUAL(OperationResult::SUCCESS, result);
    TEST_ASSERT_EQUAL_size_t(1, radio->writesTo(hrm.address, "2A39").size());
    TEST_ASSERT_TRUE(radio->valueOf(hrm.address, "2a39") == Bytes(&reset, 1));
}

void test_property_mismatch_not_supported(void) {
    uint16_t handle = connect_now(hrm.address);
    OperationResult result = OperationResult::PENDING;
    radio->read(handle, "2a39", [&result](OperationResult r, const Bytes&) { result = r; });
    advance(0.1);
    TEST_ASSERT_EQUAL(OperationResult::NOT_SUPPORTED, result);
}

void test_unknown_characteristic_not_found(void) {
    uint16_t handle = connect_now(hrm.address);
    OperationResult result = OperationResult::PENDING;
    radio->read(handle, "2a19", [&result](OperationResult r, const Bytes&) { result = r; });
    advance(0.1);
    TEST_ASSERT_EQUAL(OperationResult::NOT_FOUND, result);
}

void test_stalled_characteristic_never_answers(void) {
    uint16_t handle = connect_now(hrm.address);
    radio->stallCharacteristic("2a39");
    bool answered = false;
    const uint8_t reset = 0x01;
    TEST_ASSERT_TRUE(radio->write(handle, "2a39", Bytes(&reset, 1), true,
                                  [&answered](OperationResult, const Bytes&) { answered = true; }));
    advance(1.0);
    TEST_ASSERT_FALSE(answered);
    TEST_ASSERT_EQUAL_size_t(0, radio->writesTo(hrm.address, "2a39").size());
}

void test_failing_characteristic_answers_error(void) {
    uint16_t handle = connect_now(hrm.address);
    radio->failCharacteristic("2a38", OperationResult::ADAPTER_ERROR);
    OperationResult result = OperationResult::PENDING;
    radio->read(handle, "2a38", [&result](OperationResult r, const Bytes&) { result = r; });
    advance(0.1);
    TEST_ASSERT_EQUAL(OperationResult::ADAPTER_ERROR, result);
}

void test_link_lost_during_operation_reports_disconnected(void) {
    uint16_t handle = connect_now(hrm.address);
    OperationResult result = OperationResult::PENDING;
    radio->read(handle, "2a38", [&result](OperationResult r, const Bytes&) { result = r; });
    radio->dropConnection(hrm.address);
    advance(0.1);
    TEST_ASSERT_EQUAL(OperationResult::DISCONNECTED, result);
}

// =============================================================================
// NOTIFICATION TESTS
// =============================================================================

void test_notifications_only_after_enable(void) {
    uint16_t handle = connect_now(hrm.address);
    std::vector<Bytes> received;
    radio->setOnNotification([&received](uint16_t, const std::string&, const Bytes& value) {
        received.push_back(value);
    });

    const uint8_t bpm[] = {0x00, 72};
    TEST_ASSERT_FALSE(radio->emitNotification(hrm.address, "2a37", Bytes(bpm, 2)));

    OperationResult result = OperationResult::PENDING;
    radio->setNotify(handle, "2a37", true, [&result](OperationResult r, const Bytes&) { result = r; });
    advance(0.1);
    TEST_ASSERT_EQUAL(OperationResult::SUCCESS, result);
    TEST_ASSERT_TRUE(radio->isNotifying(hrm.address, "2a37"));

    TEST_ASSERT_TRUE(radio->emitNotification(hrm.address, "2a37", Bytes(bpm, 2)));
    TEST_ASSERT_EQUAL_size_t(1, received.size());

    radio->setNotify(handle, "2a37", false, [](OperationResult, const Bytes&) {});
    advance(0.1);
    TEST_ASSERT_FALSE(radio->emitNotification(hrm.address, "2a37", Bytes(bpm, 2)));
    TEST_ASSERT_EQUAL_size_t(1, received.size());
}

void test_notify_on_non_notifying_characteristic(void) {
    uint16_t handle = connect_now(hrm.address);
    OperationResult result = OperationResult::PENDING;
    radio->setNotify(handle, "2a38", true, [&result](OperationResult r, const Bytes&) { result = r; });
    advance(0.1);
    TEST_ASSERT_EQUAL(OperationResult::NOT_SUPPORTED, result);
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Factory Tests
    RUN_TEST(test_factory_creates_simulated_platform);
    RUN_TEST(test_factory_detects_build_platform);
    RUN_TEST(test_factory_parses_names);

    // Lifecycle Tests
    RUN_TEST(test_start_requires_initialize);
    RUN_TEST(test_calls_refused_when_stopped);

    // Scan Tests
    RUN_TEST(test_scan_reports_matching_advertisements);
    RUN_TEST(test_scan_repeats_advertisements);
    RUN_TEST(test_bounded_scan_completes);
    RUN_TEST(test_scan_interval_from_config);
    RUN_TEST(test_default_scan_duration_from_config);
    RUN_TEST(test_stop_scan_does_not_report_complete);
    RUN_TEST(test_connected_peripheral_stops_advertising);

    // Connect Tests
    RUN_TEST(test_connect_succeeds_after_latency);
    RUN_TEST(test_connect_unknown_peripheral_times_out);
    RUN_TEST(test_scripted_failure_then_default_success);
    RUN_TEST(test_scripted_stall_never_answers);
    RUN_TEST(test_slow_answer_beyond_timeout_times_out);
    RUN_TEST(test_refused_call_returns_false_once);

    // Link Tests
    RUN_TEST(test_disconnect_reports_local_host_reason);
    RUN_TEST(test_drop_connection_fires_immediately);
    RUN_TEST(test_new_connection_gets_new_handle);

    // Discovery Tests
    RUN_TEST(test_discovery_returns_gatt_table);
    RUN_TEST(test_scripted_discovery_failure);
    RUN_TEST(test_discovery_on_unknown_handle_refused);

    // GATT Tests
    RUN_TEST(test_read_returns_value);
    RUN_TEST(test_write_records_payload);
    RUN_TEST(test_property_mismatch_not_supported);
    RUN_TEST(test_unknown_characteristic_not_found);
    RUN_TEST(test_stalled_characteristic_never_answers);
    RUN_TEST(test_failing_characteristic_answers_error);
    RUN_TEST(test_link_lost_during_operation_reports_disconnected);

    // Notification Tests
    RUN_TEST(test_notifications_only_after_enable);
    RUN_TEST(test_notify_on_non_notifying_characteristic);

    return UNITY_END();
}
