// blec demo host
// Drives the central client against the simulated radio: discover, connect,
// read, subscribe, link loss with auto-reconnect, disconnect.

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

// Reticulum utilities
#include <Bytes.h>
#include <Log.h>
#include <Utilities/OS.h>

// BLE central
#include "BLECentral.h"
#include "platforms/SimulatedPlatform.h"

using namespace BLEC;

// Simulated clock, advanced instead of sleeping
static uint64_t time_offset_ms = 0;

static const char* HEART_RATE_SERVICE = "180d";
static const char* HEART_RATE_MEASUREMENT = "2a37";
static const char* BODY_SENSOR_LOCATION = "2a38";
static const char* HEART_RATE_CONTROL = "2a39";

void log_callback(const char* msg, RNS::LogLevel level) {
    printf("%s [%s] %s\n", RNS::getTimeString(), RNS::getLevelName(level), msg);
    fflush(stdout);
}

void advance(BLECentral& central, double seconds, double step = 0.05) {
    for (double elapsed = 0; elapsed < seconds; elapsed += step) {
        time_offset_ms += static_cast<uint64_t>(step * 1000);
        RNS::Utilities::OS::setTimeOffset(time_offset_ms);
        central.loop();
    }
}

SimulatedPeripheral make_heart_rate_monitor() {
    SimulatedPeripheral hrm;
    hrm.address = BLEAddress::fromString("C4:7F:51:0A:22:01");
    hrm.name = "HRM-Pro";
    hrm.rssi = -58;
    hrm.advertised_services.push_back(HEART_RATE_SERVICE);

    hrm.services.addService(HEART_RATE_SERVICE);
    hrm.services.addCharacteristic(HEART_RATE_SERVICE,
        CharacteristicInfo{HEART_RATE_MEASUREMENT, 0x0003, Property::NOTIFY});
    hrm.services.addCharacteristic(HEART_RATE_SERVICE,
        CharacteristicInfo{BODY_SENSOR_LOCATION, 0x0005, Property::READ});
    hrm.services.addCharacteristic(HEART_RATE_SERVICE,
        CharacteristicInfo{HEART_RATE_CONTROL, 0x0007, Property::WRITE});

    const uint8_t chest = 0x01;
    hrm.values[BODY_SENSOR_LOCATION] = Bytes(&chest, 1);
    return hrm;
}

SimulatedPeripheral make_thermometer() {
    SimulatedPeripheral thermo;
    thermo.address = BLEAddress::fromString("E0:11:9C:40:7B:3D");
    thermo.name = "Thermo";
    thermo.rssi = -81;
    thermo.advertised_services.push_back("181a");
    thermo.services.addService("181a");
    thermo.services.addCharacteristic("181a", CharacteristicInfo{"2a6e", 0x0003, Property::READ});
    return thermo;
}

int main(int argc, char** argv) {
    RNS::setLogCallback(log_callback);
    RNS::loglevel(RNS::LOG_INFO);
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-v") == 0) {
            RNS::loglevel(RNS::LOG_DEBUG);
        } else if (strcmp(argv[i], "-vv") == 0) {
            RNS::loglevel(RNS::LOG_TRACE);
        }
    }

    // Radio with two peripherals in range
    auto radio = std::make_shared<SimulatedPlatform>();
    SimulatedPeripheral hrm = make_heart_rate_monitor();
    radio->addPeripheral(hrm);
    radio->addPeripheral(make_thermometer());

    CentralConfig config;
    config.reconnect.enabled = true;
    config.reconnect.max_attempts = 3;
    config.reconnect.initial_delay = 0.5;

    BLECentral central(radio, config);

    central.setOnDeviceDiscovered([](const DeviceRecord& device) {
        printf("  found %s %-8s rssi %d\n", device.address.toString().c_str(),
               device.name.c_str(), device.rssi);
    });
    central.setOnConnectionStateChanged([](ConnectionState state) {
        printf("  state -> %s\n", stateToString(state));
    });
    central.setOnConnectionFailed([](const BLEAddress& address, OperationResult reason) {
        printf("  connection to %s failed: %s\n", address.toString().c_str(), resultToString(reason));
    });
    central.setOnNotification([](const NotificationEvent& notification) {
        if (notification.value.size() >= 2) {
            printf("  heart rate %u bpm\n", static_cast<unsigned int>(notification.value.data()[1]));
        }
    });
    central.setOnReady([&central](ServiceMapPtr services) {
        printf("  ready:\n%s", services->toString().c_str());

        central.receive(BODY_SENSOR_LOCATION, [](OperationResult result, const Bytes& data) {
            printf("  body sensor location: %s (%s)\n", data.toHex().c_str(), resultToString(result));
        });
        central.subscribe(HEART_RATE_MEASUREMENT, [](OperationResult result) {
            printf("  heart rate subscription: %s\n", resultToString(result));
        });
        const uint8_t reset_energy = 0x01;
        central.write(HEART_RATE_CONTROL, Bytes(&reset_energy, 1),
                      [](OperationResult result, const Bytes&) {
            printf("  energy reset: %s\n", resultToString(result));
        });
    });

    if (!central.start()) {
        ERROR("blec_demo: Failed to start central");
        return 1;
    }

    printf("== discover\n");
    ScanFilter filter;
    filter.service_uuids.push_back(HEART_RATE_SERVICE);
    central.discover(ScanFilter(), 2000);
    advance(central, 2.5);
    for (const DeviceRecord& device : central.devices(filter)) {
        printf("  heart rate monitor: %s\n", device.address.toString().c_str());
    }

    printf("== connect\n");
    radio->scriptConnect(hrm.address, SimulatedStep::succeed(1.2));
    OperationResult result = central.connect(hrm.address, HEART_RATE_SERVICE);
    printf("  connect: %s\n", resultToString(result));
    printf("  second connect: %s\n", resultToString(central.connect(make_thermometer().address)));
    advance(central, 2.0);

    printf("== notifications\n");
    for (uint8_t bpm = 72; bpm < 76; bpm++) {
        const uint8_t measurement[] = {0x00, bpm};
        radio->emitNotification(hrm.address, HEART_RATE_MEASUREMENT, Bytes(measurement, sizeof(measurement)));
        advance(central, 1.0);
    }

    printf("== link loss\n");
    radio->scriptConnect(hrm.address, SimulatedStep::fail(0.3));
    radio->dropConnection(hrm.address);
    advance(central, 5.0);

    printf("== disconnect\n");
    central.disconnect();
    advance(central, 0.5);

    printf("  writes to control point: %zu\n", radio->writesTo(hrm.address, HEART_RATE_CONTROL).size());

    central.stop();
    return central.state() == ConnectionState::DISCONNECTED ? 0 : 1;
}
