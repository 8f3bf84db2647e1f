/**
 * @file SimulatedPlatform.h
 * @brief In-memory implementation of IBLEPlatform
 *
 * Models a radio surrounded by scripted peripherals. Advertisements, link
 * establishment, discovery and GATT responses are scheduled on the
 * platform's own timeline (RNS::Utilities::OS::time()) and delivered from
 * loop(). Tests and the demo host script peripherals, per-attempt outcomes,
 * latencies, stalls, link loss and notifications.
 *
 * All methods are thread-safe. Callbacks are never invoked while the
 * platform's lock is held.
 */
#pragma once

#include "../BLEPlatform.h"

#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace BLEC {

/**
 * @brief A peripheral the simulated radio can see
 */
struct SimulatedPeripheral {
    BLEAddress address;
    std::string name;
    int8_t rssi = -60;
    bool connectable = true;
    std::vector<std::string> advertised_services;
    ServiceMap services;
    std::map<std::string, Bytes> values;    // Characteristic UUID -> current value
};

/**
 * @brief Scripted outcome of one adapter step
 */
struct SimulatedStep {
    enum class Outcome : uint8_t {
        SUCCEED,
        FAIL,
        STALL           // Never answers
    };

    Outcome outcome = Outcome::SUCCEED;
    double delay = 0.05;                    // Seconds until the answer
    OperationResult failure = OperationResult::ADAPTER_ERROR;

    static SimulatedStep succeed(double delay = 0.05) {
        SimulatedStep step;
        step.delay = delay;
        return step;
    }
    static SimulatedStep fail(double delay = 0.05,
                              OperationResult failure = OperationResult::ADAPTER_ERROR) {
        SimulatedStep step;
        step.outcome = Outcome::FAIL;
        step.delay = delay;
        step.failure = failure;
        return step;
    }
    static SimulatedStep stall() {
        SimulatedStep step;
        step.outcome = Outcome::STALL;
        return step;
    }
};

class SimulatedPlatform : public IBLEPlatform {
public:
    static constexpr uint8_t REASON_SUPERVISION_TIMEOUT = 0x08;
    static constexpr uint8_t REASON_LOCAL_HOST = 0x16;

    SimulatedPlatform();
    virtual ~SimulatedPlatform();

    //=========================================================================
    // IBLEPlatform Implementation
    //=========================================================================

    // Lifecycle
    bool initialize(const PlatformConfig& config) override;
    bool start() override;
    void stop() override;
    void loop() override;
    void shutdown() override;
    bool isRunning() const override;

    // Scanning
    bool startScan(const ScanFilter& filter, uint32_t duration_ms = 0) override;
    void stopScan() override;
    bool isScanning() const override;

    // Connections
    bool connect(const BLEAddress& address, uint32_t timeout_ms,
                 Callbacks::OnConnect callback) override;
    bool disconnect(uint16_t conn_handle) override;
    bool discoverServices(uint16_t conn_handle, Callbacks::OnDiscovery callback) override;

    // GATT Operations
    bool read(uint16_t conn_handle, const std::string& characteristic,
              Callbacks::OnOperation callback) override;
    bool write(uint16_t conn_handle, const std::string& characteristic, const Bytes& data,
               bool response, Callbacks::OnOperation callback) override;
    bool setNotify(uint16_t conn_handle, const std::string& characteristic, bool enable,
                   Callbacks::OnOperation callback) override;

    // Callback registration
    void setOnScanResult(Callbacks::OnScanResult callback) override;
    void setOnScanComplete(Callbacks::OnScanComplete callback) override;
    void setOnDisconnected(Callbacks::OnDisconnected callback) override;
    void setOnNotification(Callbacks::OnNotification callback) override;

    // Platform info
    PlatformType getPlatformType() const override { return PlatformType::SIMULATED; }
    std::string getPlatformName() const override { return "Simulated"; }

    //=========================================================================
    // Scripting
    //=========================================================================

    void addPeripheral(const SimulatedPeripheral& peripheral);

    /**
     * @brief Remove a peripheral; an open link to it is lost
     */
    void removePeripheral(const BLEAddress& address);

    /**
     * @brief Seconds between advertisements of each peripheral while scanning
     *
     * Overrides PlatformConfig::scan_interval_ms.
     */
    void setAdvertisingInterval(double seconds);

    /**
     * @brief Default latency of connect, discovery and GATT answers
     */
    void setLatency(double seconds);

    /**
     * @brief Queue the outcome of the next connect attempt to a peripheral
     *
     * Attempts without a scripted step succeed after the default latency.
     */
    void scriptConnect(const BLEAddress& address, const SimulatedStep& step);

    /**
     * @brief Queue the outcome of the next service discovery on a peripheral
     */
    void scriptDiscovery(const BLEAddress& address, const SimulatedStep& step);

    /**
     * @brief Make the next primitive call refuse to start (returns false)
     */
    void refuseNextCall();

    /**
     * @brief Operations on the characteristic never answer
     */
    void stallCharacteristic(const std::string& characteristic, bool stalled = true);

    /**
     * @brief Operations on the characteristic answer with an error
     */
    void failCharacteristic(const std::string& characteristic, OperationResult failure);

    /**
     * @brief Drop the link to a peripheral as if it went out of range
     * @return false if not connected
     */
    bool dropConnection(const BLEAddress& address, uint8_t reason = REASON_SUPERVISION_TIMEOUT);

    /**
     * @brief Peripheral pushes a value for a characteristic
     *
     * Delivered only while connected with notifications enabled.
     * @return true if the notification was delivered to the callback
     */
    bool emitNotification(const BLEAddress& address, const std::string& characteristic,
                          const Bytes& value);

    //=========================================================================
    // Inspection
    //=========================================================================

    bool isConnected(const BLEAddress& address) const;
    bool isNotifying(const BLEAddress& address, const std::string& characteristic) const;
    size_t connectAttempts(const BLEAddress& address) const;
    size_t connectionCount() const;
    Bytes valueOf(const BLEAddress& address, const std::string& characteristic) const;
    std::vector<Bytes> writesTo(const BLEAddress& address, const std::string& characteristic) const;
    size_t pendingTasks() const;

private:
    struct Task {
        double due = 0.0;
        uint64_t seq = 0;
        std::function<void()> fn;
    };

    struct Link {
        uint16_t handle = 0xFFFF;
        BLEAddress address;
        std::set<std::string> notifying;
    };

    void schedule(double delay, std::function<void()> fn);
    bool consumeRefusal();
    SimulatedPeripheral* findPeripheral(const BLEAddress& address);
    const SimulatedPeripheral* findPeripheral(const BLEAddress& address) const;
    Link* findLink(uint16_t conn_handle);
    const Link* findLink(const BLEAddress& address) const;
    bool closeLink(uint16_t conn_handle, uint8_t reason);

    /**
     * @brief Common path for read/write/subscribe answers
     */
    bool scheduleOperation(uint16_t conn_handle, const std::string& characteristic,
                           uint8_t required_properties, double delay,
                           std::function<OperationResult(SimulatedPeripheral&, Link&, Bytes&)> apply,
                           Callbacks::OnOperation callback);

    mutable std::recursive_mutex _mutex;

    PlatformConfig _config;
    bool _initialized = false;
    bool _running = false;

    // Scanning
    bool _scanning = false;
    ScanFilter _scan_filter;
    double _scan_end = 0.0;             // 0 = continuous
    double _next_advertisement = 0.0;
    double _advertising_interval = 0.1;

    double _latency = 0.05;
    bool _refuse_next = false;

    std::vector<SimulatedPeripheral> _peripherals;
    std::map<BLEAddress, std::deque<SimulatedStep>> _connect_script;
    std::map<BLEAddress, std::deque<SimulatedStep>> _discovery_script;
    std::map<BLEAddress, size_t> _connect_attempts;
    std::set<std::string> _stalled;
    std::map<std::string, OperationResult> _failing;
    std::map<std::string, std::vector<Bytes>> _writes;     // "address/uuid" -> payloads

    std::vector<Link> _links;
    uint16_t _next_handle = 1;

    std::vector<Task> _tasks;
    uint64_t _next_seq = 0;

    Callbacks::OnScanResult _on_scan_result;
    Callbacks::OnScanComplete _on_scan_complete;
    Callbacks::OnDisconnected _on_disconnected;
    Callbacks::OnNotification _on_notification;
};

} // namespace BLEC
