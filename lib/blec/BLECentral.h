/**
 * @file BLECentral.h
 * @brief BLE central-role client: connection state machine and command queue
 *
 * BLECentral turns an asynchronous, partially unreliable adapter into a
 * predictable scan -> connect -> discover -> operate -> disconnect sequence
 * for a single active connection.
 *
 * Usage:
 *   BLECentral central(BLEPlatformFactory::create());
 *   central.setOnReady([&](ServiceMapPtr services) { ... });
 *   central.start();
 *   central.startScan();
 *   central.connect(BLEAddress::fromString("AA:BB:CC:DD:EE:FF"));
 *   while (running) {
 *       central.loop();
 *   }
 *
 * Threading: loop() is the owning context. Adapter callbacks are marshalled
 * into an inbox and handled by loop(); public commands may be called from
 * any thread and are serialized by the central's lock. Host callbacks and
 * operation callbacks are invoked from loop() (rejections are returned, never
 * called back). Cancellations caused by disconnect() or stop() resolve before
 * those calls return.
 */
#pragma once

#include "BLETypes.h"
#include "BLEPlatform.h"
#include "BLEServiceMap.h"
#include "BLEOperationQueue.h"
#include "BLEDeviceRegistry.h"
#include "BLENotificationHub.h"
#include "Bytes.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <random>
#include <set>
#include <vector>

namespace BLEC {

class BLECentral : protected BLEOperationQueue {
public:
    using SubscriberId = BLENotificationHub::SubscriberId;
    static constexpr SubscriberId INVALID_SUBSCRIBER = BLENotificationHub::INVALID_SUBSCRIBER;

    // Host callbacks
    using OnDeviceDiscovered = std::function<void(const DeviceRecord& device)>;
    using OnConnectionStateChanged = std::function<void(ConnectionState state)>;
    using OnReady = std::function<void(ServiceMapPtr services)>;
    using OnConnectionFailed = std::function<void(const BLEAddress& address, OperationResult reason)>;
    using OnNotification = std::function<void(const NotificationEvent& notification)>;
    using OnScanComplete = std::function<void()>;

    using OperationCallback = std::function<void(OperationResult result, const Bytes& data)>;
    using SubscribeCallback = std::function<void(OperationResult result)>;

public:
    /**
     * @brief Construct a central over an adapter
     * @param platform Adapter to drive; nullptr selects the platform detected
     *        for this build
     */
    explicit BLECentral(IBLEPlatform::Ptr platform = nullptr,
                        const CentralConfig& config = CentralConfig(),
                        const PlatformConfig& platform_config = PlatformConfig());

    virtual ~BLECentral();

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Replace the configuration
     *
     * Only accepted while disconnected. Values are clamped by validate().
     * @return false if a connection exists or is being established
     */
    bool configure(const CentralConfig& config);
    const CentralConfig& config() const { return _config; }

    /**
     * @brief Initialize and start the adapter
     */
    bool start();

    /**
     * @brief Tear down any connection and stop the adapter
     */
    void stop();

    /**
     * @brief Drive the state machine - call periodically
     *
     * Pumps the adapter, handles marshalled adapter events, runs connection
     * and reconnect timers, prunes the device registry and executes queued
     * GATT operations.
     */
    void loop();

    bool isRunning() const;

    //=========================================================================
    // Scanning
    //=========================================================================

    /**
     * @brief Scan until stopScan()
     *
     * Bounded by PlatformConfig::scan_duration_ms when that is set.
     */
    OperationResult startScan(const ScanFilter& filter = ScanFilter());
    void stopScan();
    bool isScanning() const;

    /**
     * @brief Bounded scan; ScanComplete fires when it ends
     * @param duration_ms Scan length (0 selects the discovery timeout)
     */
    OperationResult discover(const ScanFilter& filter = ScanFilter(), uint32_t duration_ms = 0);

    /**
     * @brief Snapshot of known, non-stale devices matching a filter
     */
    std::vector<DeviceRecord> devices(const ScanFilter& filter = ScanFilter()) const;

    //=========================================================================
    // Connection
    //=========================================================================

    /**
     * @brief Start connecting to a peripheral
     *
     * Valid only while DISCONNECTED. The outcome arrives as Ready or
     * ConnectionFailed.
     *
     * @param address Peripheral address
     * @param required_service Service the peripheral must expose (optional)
     * @return SUCCESS if the attempt started, BUSY or ALREADY_CONNECTED while
     *         another connection exists, INVALID_ARGUMENT for a malformed
     *         address or service, ADAPTER_ERROR if the adapter refused,
     *         NOT_RUNNING before start()
     */
    OperationResult connect(const BLEAddress& address, const std::string& required_service = "");

    /**
     * @brief Tear down the connection, cancelling everything pending
     *
     * Always ends in DISCONNECTED, even if the adapter never confirms.
     * @return NOT_CONNECTED if already disconnected
     */
    OperationResult disconnect();

    ConnectionState state() const;
    bool isConnected() const;

    /**
     * @brief Current connection generation
     */
    uint32_t generation() const { return _generation.load(); }

    /**
     * @brief Record of the connected device
     * @return false unless CONNECTED
     */
    bool connectedDevice(DeviceRecord& device_out) const;

    /**
     * @brief Service map of the current connection (nullptr unless CONNECTED)
     */
    ServiceMapPtr services() const;

    //=========================================================================
    // GATT Operations
    //=========================================================================

    /**
     * @brief Queue a GATT operation
     *
     * The operation is bound to the current generation and resolves through
     * its callback exactly once.
     *
     * @return PENDING if queued; otherwise the rejection reason (the callback
     *         is not invoked)
     */
    OperationResult submitOperation(GATTOperation op);

    OperationResult read(const std::string& characteristic, OperationCallback callback);
    OperationResult write(const std::string& characteristic, const Bytes& data,
                          OperationCallback callback = nullptr);

    /**
     * @brief Write without response
     */
    OperationResult send(const std::string& characteristic, const Bytes& data,
                         OperationCallback callback = nullptr);

    /**
     * @brief Read, delivering the value to the callback
     */
    OperationResult receive(const std::string& characteristic, OperationCallback callback);

    /**
     * @brief Operations queued or in flight
     */
    size_t pendingCommands() const;

    //=========================================================================
    // Notifications and Events
    //=========================================================================

    /**
     * @brief Subscribe to a characteristic's notifications
     *
     * Creates a mailbox in the notification hub and enables notifications on
     * the peripheral if no other subscriber already did. The subscription
     * ends when the connection generation advances.
     *
     * @param callback Invoked from loop() with the adapter-level outcome. On
     *        failure the subscriber is removed.
     * @return Subscriber id, or INVALID_SUBSCRIBER if not connecting/connected,
     *         the UUID is malformed or the hub is full
     */
    SubscriberId subscribe(const std::string& characteristic, SubscribeCallback callback = nullptr);

    /**
     * @brief Remove a subscriber
     *
     * Disables notifications on the peripheral once the last subscriber of
     * the characteristic leaves.
     */
    bool unsubscribe(SubscriberId id);

    /**
     * @brief Subscribe to lifecycle events
     */
    SubscriberId subscribeEvents();

    bool poll(SubscriberId id, CentralEvent& event_out);
    bool wait(SubscriberId id, CentralEvent& event_out, uint32_t timeout_ms);

    BLENotificationHub& hub() { return _hub; }
    const BLEDeviceRegistry& registry() const { return _registry; }

    // Host callbacks
    void setOnDeviceDiscovered(OnDeviceDiscovered callback);
    void setOnConnectionStateChanged(OnConnectionStateChanged callback);
    void setOnReady(OnReady callback);
    void setOnConnectionFailed(OnConnectionFailed callback);
    void setOnNotification(OnNotification callback);
    void setOnScanComplete(OnScanComplete callback);

    /**
     * @brief Adapter events dropped because the inbox was full
     */
    uint32_t droppedEvents() const;

protected:
    //=========================================================================
    // BLEOperationQueue Implementation
    //=========================================================================

    OperationResult executeOperation(const GATTOperation& op) override;

private:
    /**
     * @brief Adapter event marshalled into the owning context
     */
    struct AdapterEvent {
        enum class Kind : uint8_t {
            SCAN_RESULT,
            SCAN_COMPLETE,
            CONNECTED,
            DISCOVERED,
            OPERATION_DONE,
            DISCONNECTED,
            NOTIFICATION
        };

        Kind kind = Kind::SCAN_RESULT;
        uint32_t generation = 0;
        uint32_t op_id = 0;
        OperationResult result = OperationResult::SUCCESS;
        uint16_t conn_handle = 0xFFFF;
        uint8_t reason = 0;
        ScanResult scan;
        std::shared_ptr<ServiceMap> services;
        std::string characteristic;
        Bytes data;
    };

    //=========================================================================
    // Adapter callbacks (any thread)
    //=========================================================================

    void installPlatformCallbacks();
    void postEvent(AdapterEvent event);

    //=========================================================================
    // Owning context
    //=========================================================================

    void drainInbox();
    void runDeferredCallbacks();
    void handleEvent(const AdapterEvent& event);
    void onScanResult(const ScanResult& result);
    void onConnectResult(const AdapterEvent& event);
    void onDiscoveryResult(const AdapterEvent& event);
    void onLinkDown(uint16_t conn_handle, uint8_t reason);
    void onNotification(const AdapterEvent& event);
    void checkTimers(double now);

    OperationResult beginAttempt();
    void attemptFailed(OperationResult reason);
    void scheduleReconnect();
    double backoffDelay(uint8_t attempt);
    void finishDisconnect();
    uint32_t advanceGeneration();
    void resetConnection(OperationResult pending_result);

    void setState(ConnectionState state);
    void emit(const CentralEvent& event);

    IBLEPlatform::Ptr _platform;
    CentralConfig _config;
    PlatformConfig _platform_config;

    BLEDeviceRegistry _registry;
    BLENotificationHub _hub;

    mutable std::recursive_mutex _mutex;
    bool _running = false;

    // Connection
    ConnectionState _state = ConnectionState::DISCONNECTED;
    std::atomic<uint32_t> _generation{0};
    BLEAddress _target;
    std::string _required_service;
    uint16_t _conn_handle = 0xFFFF;
    ServiceMapPtr _services;
    std::set<std::string> _notifying;       // Characteristics armed for delivery
    std::set<std::string> _notify_enabled;  // Armed and confirmed by the adapter
    double _deadline = 0.0;                 // Current CONNECTING/DISCOVERING/DISCONNECTING step

    // Reconnect
    bool _reconnecting = false;
    uint8_t _reconnect_attempt = 0;
    double _reconnect_at = 0.0;
    std::mt19937 _rng;

    double _last_prune = 0.0;

    // Inbox
    mutable std::mutex _inbox_mutex;
    std::vector<AdapterEvent> _inbox;
    uint32_t _dropped_events = 0;

    // Acknowledgements owed to callers, run from loop()
    std::vector<std::function<void()>> _deferred_callbacks;

    // Host callbacks
    OnDeviceDiscovered _on_device_discovered;
    OnConnectionStateChanged _on_connection_state_changed;
    OnReady _on_ready;
    OnConnectionFailed _on_connection_failed;
    OnNotification _on_notification;
    OnScanComplete _on_scan_complete;
};

} // namespace BLEC
