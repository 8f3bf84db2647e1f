/**
 * @file BLECentral.cpp
 * @brief BLE central-role client implementation
 */

#include "BLECentral.h"
#include "Log.h"
#include "Utilities/OS.h"

#include <algorithm>
#include <cmath>

namespace BLEC {

//=============================================================================
// CentralConfig
//=============================================================================

size_t CentralConfig::validate() {
    size_t corrected = 0;

    auto fix_timeout = [&corrected](uint32_t& value, uint32_t fallback, const char* name) {
        if (value == 0) {
            WARNING(std::string("CentralConfig: ") + name + " of 0 replaced by " +
                    std::to_string(fallback) + "ms");
            value = fallback;
            corrected++;
        }
    };
    fix_timeout(connect_timeout_ms, Timing::CONNECT_TIMEOUT_MS, "connect_timeout_ms");
    fix_timeout(discovery_timeout_ms, Timing::DISCOVERY_TIMEOUT_MS, "discovery_timeout_ms");
    fix_timeout(disconnect_timeout_ms, Timing::DISCONNECT_TIMEOUT_MS, "disconnect_timeout_ms");
    fix_timeout(default_operation_timeout_ms, Timing::OPERATION_TIMEOUT_MS,
                "default_operation_timeout_ms");

    if (device_stale_after <= 0) {
        WARNING("CentralConfig: device_stale_after must be positive, using default");
        device_stale_after = Timing::DEVICE_STALE_AFTER;
        corrected++;
    }
    if (prune_interval <= 0) {
        WARNING("CentralConfig: prune_interval must be positive, using default");
        prune_interval = Timing::PRUNE_INTERVAL;
        corrected++;
    }
    if (max_devices == 0) {
        WARNING("CentralConfig: max_devices of 0 replaced by default");
        max_devices = Limits::MAX_DEVICES;
        corrected++;
    }
    if (subscriber_queue_depth == 0) {
        WARNING("CentralConfig: subscriber_queue_depth of 0 replaced by default");
        subscriber_queue_depth = Limits::SUBSCRIBER_QUEUE_DEPTH;
        corrected++;
    }

    if (reconnect.initial_delay < 0) {
        WARNING("CentralConfig: negative reconnect initial delay clamped to 0");
        reconnect.initial_delay = 0;
        corrected++;
    }
    if (reconnect.multiplier < 1.0) {
        WARNING("CentralConfig: reconnect multiplier below 1 clamped to 1");
        reconnect.multiplier = 1.0;
        corrected++;
    }
    if (reconnect.max_delay < reconnect.initial_delay) {
        WARNING("CentralConfig: reconnect max delay raised to the initial delay");
        reconnect.max_delay = reconnect.initial_delay;
        corrected++;
    }
    if (reconnect.jitter < 0.0 || reconnect.jitter > 1.0) {
        WARNING("CentralConfig: reconnect jitter clamped to [0, 1]");
        reconnect.jitter = std::min(1.0, std::max(0.0, reconnect.jitter));
        corrected++;
    }

    return corrected;
}

//=============================================================================
// Construction
//=============================================================================

BLECentral::BLECentral(IBLEPlatform::Ptr platform, const CentralConfig& config,
                       const PlatformConfig& platform_config)
    : _platform(platform),
      _config(config),
      _platform_config(platform_config),
      _registry(config.max_devices, config.device_stale_after),
      _hub(config.subscriber_queue_depth),
      _rng(std::random_device{}()) {
    if (!_platform) {
        _platform = BLEPlatformFactory::create();
    }
    _config.validate();
    _registry.setMaxDevices(_config.max_devices);
    _registry.setStaleAfter(_config.device_stale_after);
    setTimeout(_config.default_operation_timeout_ms);
}

BLECentral::~BLECentral() {
    stop();
    if (_platform) {
        _platform->setOnScanResult(nullptr);
        _platform->setOnScanComplete(nullptr);
        _platform->setOnDisconnected(nullptr);
        _platform->setOnNotification(nullptr);
        _platform->shutdown();
    }
}

//=============================================================================
// Lifecycle
//=============================================================================

bool BLECentral::configure(const CentralConfig& config) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (_state != ConnectionState::DISCONNECTED) {
        WARNING("BLECentral: configure() rejected while " + std::string(stateToString(_state)));
        return false;
    }

    _config = config;
    size_t corrected = _config.validate();
    if (corrected > 0) {
        DEBUG("BLECentral: Configuration had " + std::to_string(corrected) + " corrected values");
    }

    _registry.setMaxDevices(_config.max_devices);
    _registry.setStaleAfter(_config.device_stale_after);
    setTimeout(_config.default_operation_timeout_ms);
    return true;
}

bool BLECentral::start() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (_running) {
        return true;
    }

    if (!_platform) {
        ERROR("BLECentral: No BLE platform available");
        return false;
    }

    if (!_platform->initialize(_platform_config)) {
        ERROR("BLECentral: Failed to initialize " + _platform->getPlatformName() + " platform");
        return false;
    }

    installPlatformCallbacks();

    if (!_platform->start()) {
        ERROR("BLECentral: Failed to start " + _platform->getPlatformName() + " platform");
        return false;
    }

    _running = true;
    _last_prune = RNS::Utilities::OS::time();

    INFO("BLECentral: Started on " + _platform->getPlatformName() + " platform");
    return true;
}

void BLECentral::stop() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!_running) {
        return;
    }

    if (_state != ConnectionState::DISCONNECTED) {
        _reconnecting = false;
        advanceGeneration();
        if (_conn_handle != 0xFFFF) {
            _platform->disconnect(_conn_handle);
        }
        finishDisconnect();
    }

    runDeferredCallbacks();

    _platform->stopScan();
    _platform->stop();
    _running = false;

    {
        std::lock_guard<std::mutex> inbox_lock(_inbox_mutex);
        _inbox.clear();
    }

    INFO("BLECentral: Stopped");
}

void BLECentral::loop() {
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (!_running) {
            return;
        }
    }

    // Adapter callbacks only post into the inbox, so pumping the platform
    // does not need the central's lock
    _platform->loop();

    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_running) {
        return;
    }

    double now = RNS::Utilities::OS::time();

    drainInbox();
    runDeferredCallbacks();
    checkTimers(now);

    if (now - _last_prune >= _config.prune_interval) {
        _last_prune = now;
        size_t removed = _registry.prune();
        if (removed > 0) {
            TRACE("BLECentral: Pruned " + std::to_string(removed) + " stale devices");
        }
    }

    if (_state == ConnectionState::CONNECTED) {
        process(_generation.load());
    }
}

bool BLECentral::isRunning() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _running;
}

//=============================================================================
// Scanning
//=============================================================================

OperationResult BLECentral::startScan(const ScanFilter& filter) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!_running) {
        return OperationResult::NOT_RUNNING;
    }
    if (!_platform->startScan(filter, 0)) {
        WARNING("BLECentral: Adapter refused to start scanning");
        return OperationResult::ADAPTER_ERROR;
    }

    DEBUG("BLECentral: Scanning");
    return OperationResult::SUCCESS;
}

void BLECentral::stopScan() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (_running) {
        _platform->stopScan();
        DEBUG("BLECentral: Scan stopped");
    }
}

bool BLECentral::isScanning() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _running && _platform->isScanning();
}

OperationResult BLECentral::discover(const ScanFilter& filter, uint32_t duration_ms) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!_running) {
        return OperationResult::NOT_RUNNING;
    }
    if (duration_ms == 0) {
        duration_ms = _config.discovery_timeout_ms;
    }
    if (!_platform->startScan(filter, duration_ms)) {
        WARNING("BLECentral: Adapter refused to start discovery scan");
        return OperationResult::ADAPTER_ERROR;
    }

    DEBUG("BLECentral: Discovering for " + std::to_string(duration_ms) + "ms");
    return OperationResult::SUCCESS;
}

std::vector<DeviceRecord> BLECentral::devices(const ScanFilter& filter) const {
    return _registry.list(filter);
}

//=============================================================================
// Connection
//=============================================================================

OperationResult BLECentral::connect(const BLEAddress& address, const std::string& required_service) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!_running) {
        return OperationResult::NOT_RUNNING;
    }

    if (address.isZero()) {
        WARNING("BLECentral: connect() with an empty address");
        return OperationResult::INVALID_ARGUMENT;
    }

    std::string required;
    if (!required_service.empty()) {
        required = normalizeUUID(required_service);
        if (required.empty()) {
            WARNING("BLECentral: connect() with malformed service UUID " + required_service);
            return OperationResult::INVALID_ARGUMENT;
        }
    }

    if (_state != ConnectionState::DISCONNECTED) {
        if (_state == ConnectionState::CONNECTED && _target == address) {
            WARNING("BLECentral: Already connected to " + address.toString());
            return OperationResult::ALREADY_CONNECTED;
        }
        WARNING("BLECentral: connect(" + address.toString() + ") rejected while " +
                stateToString(_state) + " to " + _target.toString());
        return OperationResult::BUSY;
    }

    _target = address;
    _required_service = required;
    _reconnecting = false;
    _reconnect_attempt = 0;

    return beginAttempt();
}

OperationResult BLECentral::disconnect() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (_state == ConnectionState::DISCONNECTED) {
        return OperationResult::NOT_CONNECTED;
    }
    if (_state == ConnectionState::DISCONNECTING) {
        return OperationResult::SUCCESS;
    }

    INFO("BLECentral: Disconnecting from " + _target.toString());

    _reconnecting = false;
    advanceGeneration();
    setState(ConnectionState::DISCONNECTING);

    if (_conn_handle != 0xFFFF && _platform->disconnect(_conn_handle)) {
        _deadline = RNS::Utilities::OS::time() + _config.disconnect_timeout_ms / 1000.0;
        return OperationResult::SUCCESS;
    }

    // Nothing to wait for: no link yet, or the adapter refused
    finishDisconnect();
    return OperationResult::SUCCESS;
}

ConnectionState BLECentral::state() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _state;
}

bool BLECentral::isConnected() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _state == ConnectionState::CONNECTED;
}

bool BLECentral::connectedDevice(DeviceRecord& device_out) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (_state != ConnectionState::CONNECTED) {
        return false;
    }
    if (!_registry.get(_target, device_out)) {
        device_out = DeviceRecord();
        device_out.address = _target;
    }
    return true;
}

ServiceMapPtr BLECentral::services() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _state == ConnectionState::CONNECTED ? _services : nullptr;
}

//=============================================================================
// GATT Operations
//=============================================================================

OperationResult BLECentral::submitOperation(GATTOperation op) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!_running) {
        return OperationResult::NOT_RUNNING;
    }

    std::string uuid = normalizeUUID(op.characteristic);
    if (uuid.empty()) {
        WARNING("BLECentral: Rejecting " + std::string(operationToString(op.type)) +
                " on malformed characteristic '" + op.characteristic + "'");
        return OperationResult::INVALID_ARGUMENT;
    }

    if (_state == ConnectionState::DISCONNECTED || _state == ConnectionState::DISCONNECTING) {
        DEBUG("BLECentral: Rejecting " + std::string(operationToString(op.type)) +
              " while " + stateToString(_state));
        return OperationResult::NOT_CONNECTED;
    }

    op.characteristic = uuid;
    op.generation = _generation.load();
    enqueue(std::move(op));
    return OperationResult::PENDING;
}

OperationResult BLECentral::read(const std::string& characteristic, OperationCallback callback) {
    return submitOperation(GATTOperationBuilder()
        .read(characteristic)
        .withCallback(callback)
        .build());
}

OperationResult BLECentral::write(const std::string& characteristic, const Bytes& data,
                                  OperationCallback callback) {
    return submitOperation(GATTOperationBuilder()
        .write(characteristic, data)
        .withCallback(callback)
        .build());
}

OperationResult BLECentral::send(const std::string& characteristic, const Bytes& data,
                                 OperationCallback callback) {
    return submitOperation(GATTOperationBuilder()
        .writeNoResponse(characteristic, data)
        .withCallback(callback)
        .build());
}

OperationResult BLECentral::receive(const std::string& characteristic, OperationCallback callback) {
    return read(characteristic, callback);
}

size_t BLECentral::pendingCommands() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return depth() + (isBusy() ? 1 : 0);
}

OperationResult BLECentral::executeOperation(const GATTOperation& op) {
    if (_state != ConnectionState::CONNECTED || !_services || _conn_handle == 0xFFFF) {
        return OperationResult::NOT_CONNECTED;
    }

    const CharacteristicInfo* info = _services->findCharacteristic(op.characteristic);
    if (!info) {
        WARNING("BLECentral: Characteristic " + op.characteristic + " not available on " +
                _target.toString());
        return OperationResult::NOT_FOUND;
    }
    if (!info->supports(op.type)) {
        WARNING("BLECentral: Characteristic " + op.characteristic + " does not support " +
                operationToString(op.type));
        return OperationResult::NOT_SUPPORTED;
    }

    uint32_t generation = op.generation;
    uint32_t op_id = op.id;
    Callbacks::OnOperation done = [this, generation, op_id](OperationResult result, const Bytes& data) {
        AdapterEvent event;
        event.kind = AdapterEvent::Kind::OPERATION_DONE;
        event.generation = generation;
        event.op_id = op_id;
        event.result = result;
        event.data = data;
        postEvent(event);
    };

    bool started = false;
    switch (op.type) {
        case OperationType::READ:
            started = _platform->read(_conn_handle, op.characteristic, done);
            break;

        case OperationType::WRITE:
            started = _platform->write(_conn_handle, op.characteristic, op.data, true, done);
            break;

        case OperationType::WRITE_NO_RESPONSE: {
            std::string characteristic = op.characteristic;
            started = _platform->write(_conn_handle, op.characteristic, op.data, false,
                [characteristic](OperationResult result, const Bytes&) {
                    if (result != OperationResult::SUCCESS) {
                        WARNING("BLECentral: Write without response to " + characteristic +
                                " reported " + resultToString(result));
                    }
                });
            if (started) {
                TRACE("BLECentral: Sent " + std::to_string(op.data.size()) + " bytes to " +
                      op.characteristic);
                return OperationResult::SUCCESS;
            }
            break;
        }

        case OperationType::NOTIFY_ENABLE:
            if (_hub.subscriberCount(op.characteristic) == 0) {
                DEBUG("BLECentral: No subscribers left on " + op.characteristic +
                      ", skipping notification enable");
                return OperationResult::CANCELLED;
            }
            // Armed before the adapter call so the first notification is not lost
            _notifying.insert(op.characteristic);
            started = _platform->setNotify(_conn_handle, op.characteristic, true, done);
            if (!started) {
                _notifying.erase(op.characteristic);
            }
            break;

        case OperationType::NOTIFY_DISABLE:
            started = _platform->setNotify(_conn_handle, op.characteristic, false, done);
            break;
    }

    return started ? OperationResult::PENDING : OperationResult::ADAPTER_ERROR;
}

//=============================================================================
// Notifications and Events
//=============================================================================

BLECentral::SubscriberId BLECentral::subscribe(const std::string& characteristic,
                                               SubscribeCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    if (!_running) {
        return INVALID_SUBSCRIBER;
    }

    std::string uuid = normalizeUUID(characteristic);
    if (uuid.empty()) {
        WARNING("BLECentral: subscribe() with malformed characteristic '" + characteristic + "'");
        return INVALID_SUBSCRIBER;
    }

    if (_state == ConnectionState::DISCONNECTED || _state == ConnectionState::DISCONNECTING) {
        WARNING("BLECentral: subscribe(" + uuid + ") rejected while " + stateToString(_state));
        return INVALID_SUBSCRIBER;
    }

    SubscriberId id = _hub.subscribe(uuid, _config.subscriber_queue_depth);
    if (id == INVALID_SUBSCRIBER) {
        WARNING("BLECentral: No free subscriber slot for " + uuid);
        return INVALID_SUBSCRIBER;
    }

    if (_notify_enabled.count(uuid) > 0) {
        DEBUG("BLECentral: Subscriber added to already enabled " + uuid);
        if (callback) {
            _deferred_callbacks.push_back([callback]() {
                callback(OperationResult::SUCCESS);
            });
        }
        return id;
    }

    GATTOperation op = GATTOperationBuilder()
        .enableNotify(uuid)
        .withCallback([this, id, uuid, callback](OperationResult result, const Bytes&) {
            if (result == OperationResult::SUCCESS) {
                // Not if the last subscriber left while the enable was in flight
                if (_notifying.count(uuid) > 0) {
                    _notify_enabled.insert(uuid);
                }
                DEBUG("BLECentral: Notifications enabled on " + uuid);
            } else {
                if (_notify_enabled.count(uuid) == 0) {
                    _notifying.erase(uuid);
                }
                // Cancelled subscribers were already removed or closed
                if (result != OperationResult::CANCELLED) {
                    WARNING("BLECentral: Enabling notifications on " + uuid + " failed: " +
                            resultToString(result));
                    _hub.unsubscribe(id);
                }
            }
            if (callback) {
                callback(result);
            }
        })
        .build();
    op.generation = _generation.load();
    enqueue(std::move(op));

    return id;
}

bool BLECentral::unsubscribe(SubscriberId id) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    std::string characteristic = _hub.characteristicOf(id);
    if (!_hub.unsubscribe(id)) {
        return false;
    }

    if (!characteristic.empty() && _hub.subscriberCount(characteristic) == 0 &&
        _notifying.count(characteristic) > 0 && _state == ConnectionState::CONNECTED) {
        DEBUG("BLECentral: Last subscriber left " + characteristic + ", disabling notifications");
        // Disarmed now so a resubscribe queues a fresh enable behind this disable
        _notifying.erase(characteristic);
        _notify_enabled.erase(characteristic);
        GATTOperation op = GATTOperationBuilder()
            .disableNotify(characteristic)
            .withCallback([characteristic](OperationResult result, const Bytes&) {
                if (result != OperationResult::SUCCESS) {
                    WARNING("BLECentral: Disabling notifications on " + characteristic +
                            " failed: " + resultToString(result));
                }
            })
            .build();
        op.generation = _generation.load();
        enqueue(std::move(op));
    }

    return true;
}

BLECentral::SubscriberId BLECentral::subscribeEvents() {
    return _hub.subscribeEvents(_config.subscriber_queue_depth);
}

bool BLECentral::poll(SubscriberId id, CentralEvent& event_out) {
    return _hub.poll(id, event_out);
}

bool BLECentral::wait(SubscriberId id, CentralEvent& event_out, uint32_t timeout_ms) {
    // Must not hold the central's lock while blocking
    return _hub.wait(id, event_out, timeout_ms);
}

void BLECentral::setOnDeviceDiscovered(OnDeviceDiscovered callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_device_discovered = callback;
}

void BLECentral::setOnConnectionStateChanged(OnConnectionStateChanged callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_connection_state_changed = callback;
}

void BLECentral::setOnReady(OnReady callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_ready = callback;
}

void BLECentral::setOnConnectionFailed(OnConnectionFailed callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_connection_failed = callback;
}

void BLECentral::setOnNotification(OnNotification callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_notification = callback;
}

void BLECentral::setOnScanComplete(OnScanComplete callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_scan_complete = callback;
}

uint32_t BLECentral::droppedEvents() const {
    std::lock_guard<std::mutex> lock(_inbox_mutex);
    return _dropped_events;
}

//=============================================================================
// Adapter Callbacks (any thread)
//=============================================================================

void BLECentral::installPlatformCallbacks() {
    _platform->setOnScanResult([this](const ScanResult& result) {
        AdapterEvent event;
        event.kind = AdapterEvent::Kind::SCAN_RESULT;
        event.scan = result;
        postEvent(event);
    });

    _platform->setOnScanComplete([this]() {
        AdapterEvent event;
        event.kind = AdapterEvent::Kind::SCAN_COMPLETE;
        postEvent(event);
    });

    _platform->setOnDisconnected([this](uint16_t conn_handle, uint8_t reason) {
        AdapterEvent event;
        event.kind = AdapterEvent::Kind::DISCONNECTED;
        event.conn_handle = conn_handle;
        event.reason = reason;
        postEvent(event);
    });

    _platform->setOnNotification([this](uint16_t conn_handle, const std::string& characteristic,
                                        const Bytes& value) {
        AdapterEvent event;
        event.kind = AdapterEvent::Kind::NOTIFICATION;
        event.generation = _generation.load();
        event.conn_handle = conn_handle;
        event.characteristic = characteristic;
        event.data = value;
        postEvent(event);
    });
}

void BLECentral::postEvent(AdapterEvent event) {
    std::lock_guard<std::mutex> lock(_inbox_mutex);

    // Completions are never dropped, the state machine depends on them
    bool droppable = event.kind == AdapterEvent::Kind::SCAN_RESULT ||
                     event.kind == AdapterEvent::Kind::NOTIFICATION;
    if (droppable && _inbox.size() >= Limits::MAX_PENDING_EVENTS) {
        _dropped_events++;
        WARNING("BLECentral: Adapter inbox full, dropping event");
        return;
    }

    _inbox.push_back(std::move(event));
}

//=============================================================================
// Owning Context
//=============================================================================

void BLECentral::drainInbox() {
    std::vector<AdapterEvent> events;
    {
        std::lock_guard<std::mutex> lock(_inbox_mutex);
        events.swap(_inbox);
    }

    for (const AdapterEvent& event : events) {
        handleEvent(event);
    }
}

void BLECentral::runDeferredCallbacks() {
    // Callbacks may subscribe again and defer more work
    while (!_deferred_callbacks.empty()) {
        std::vector<std::function<void()>> callbacks;
        callbacks.swap(_deferred_callbacks);
        for (const std::function<void()>& callback : callbacks) {
            callback();
        }
    }
}

void BLECentral::handleEvent(const AdapterEvent& event) {
    switch (event.kind) {
        case AdapterEvent::Kind::SCAN_RESULT:
            onScanResult(event.scan);
            break;

        case AdapterEvent::Kind::SCAN_COMPLETE: {
            DEBUG("BLECentral: Scan complete, " + std::to_string(_registry.size()) + " devices known");
            CentralEvent scan_event;
            scan_event.type = CentralEventType::SCAN_COMPLETE;
            scan_event.generation = _generation.load();
            emit(scan_event);
            break;
        }

        case AdapterEvent::Kind::CONNECTED:
            onConnectResult(event);
            break;

        case AdapterEvent::Kind::DISCOVERED:
            onDiscoveryResult(event);
            break;

        case AdapterEvent::Kind::OPERATION_DONE:
            if (event.generation != _generation.load()) {
                DEBUG("BLECentral: Discarding completion of operation " + std::to_string(event.op_id) +
                      " from generation " + std::to_string(event.generation));
                break;
            }
            complete(event.op_id, event.result, event.data);
            break;

        case AdapterEvent::Kind::DISCONNECTED:
            onLinkDown(event.conn_handle, event.reason);
            break;

        case AdapterEvent::Kind::NOTIFICATION:
            onNotification(event);
            break;
    }
}

void BLECentral::onScanResult(const ScanResult& result) {
    DeviceRecord record;
    bool is_new = _registry.onAdvertisement(result, &record);
    if (!is_new) {
        return;
    }

    DEBUG("BLECentral: Discovered " + record.address.toString() +
          (record.name.empty() ? std::string() : " (" + record.name + ")") +
          " RSSI " + std::to_string(record.rssi));

    CentralEvent event;
    event.type = CentralEventType::DEVICE_DISCOVERED;
    event.generation = _generation.load();
    event.address = record.address;
    event.device = record;
    emit(event);
}

void BLECentral::onConnectResult(const AdapterEvent& event) {
    if (event.generation != _generation.load() || _state != ConnectionState::CONNECTING) {
        if (event.result == OperationResult::SUCCESS) {
            // Attempt was abandoned; do not leak the link
            WARNING("BLECentral: Late connection from generation " + std::to_string(event.generation) +
                    ", disconnecting handle " + std::to_string(event.conn_handle));
            _platform->disconnect(event.conn_handle);
        }
        return;
    }

    if (event.result != OperationResult::SUCCESS) {
        attemptFailed(event.result);
        return;
    }

    _conn_handle = event.conn_handle;
    INFO("BLECentral: Link established to " + _target.toString() + " handle " +
         std::to_string(_conn_handle));

    setState(ConnectionState::DISCOVERING);
    _deadline = RNS::Utilities::OS::time() + _config.discovery_timeout_ms / 1000.0;

    uint32_t generation = event.generation;
    bool started = _platform->discoverServices(_conn_handle,
        [this, generation](OperationResult result, const ServiceMap& services) {
            AdapterEvent discovered;
            discovered.kind = AdapterEvent::Kind::DISCOVERED;
            discovered.generation = generation;
            discovered.result = result;
            discovered.services = std::make_shared<ServiceMap>(services);
            postEvent(discovered);
        });

    if (!started) {
        WARNING("BLECentral: Adapter refused service discovery");
        attemptFailed(OperationResult::DISCOVERY_FAILED);
    }
}

void BLECentral::onDiscoveryResult(const AdapterEvent& event) {
    if (event.generation != _generation.load() || _state != ConnectionState::DISCOVERING) {
        DEBUG("BLECentral: Discarding discovery result from generation " +
              std::to_string(event.generation));
        return;
    }

    if (event.result != OperationResult::SUCCESS || !event.services) {
        WARNING("BLECentral: Service discovery failed: " + std::string(resultToString(event.result)));
        attemptFailed(OperationResult::DISCOVERY_FAILED);
        return;
    }

    if (!_required_service.empty() && !event.services->hasService(_required_service)) {
        WARNING("BLECentral: " + _target.toString() + " lacks required service " + _required_service);
        attemptFailed(OperationResult::SERVICE_NOT_FOUND);
        return;
    }

    _services = event.services;

    char buf[80];
    snprintf(buf, sizeof(buf), "BLECentral: Discovered %zu services, %zu characteristics",
             _services->serviceCount(), _services->characteristicCount());
    DEBUG(buf);

    _reconnecting = false;
    _reconnect_attempt = 0;
    setState(ConnectionState::CONNECTED);
    if (_state != ConnectionState::CONNECTED) {
        // A state callback already tore the connection down
        return;
    }

    CentralEvent ready;
    ready.type = CentralEventType::READY;
    ready.generation = _generation.load();
    ready.address = _target;
    ready.services = _services;
    emit(ready);
}

void BLECentral::onLinkDown(uint16_t conn_handle, uint8_t reason) {
    if (conn_handle == 0xFFFF || conn_handle != _conn_handle) {
        DEBUG("BLECentral: Ignoring disconnect of stale handle " + std::to_string(conn_handle));
        return;
    }

    char buf[80];
    snprintf(buf, sizeof(buf), "BLECentral: Link to %s lost, reason 0x%02X",
             _target.toString().c_str(), reason);

    switch (_state) {
        case ConnectionState::DISCONNECTING:
            DEBUG(buf);
            finishDisconnect();
            break;

        case ConnectionState::DISCOVERING:
            WARNING(buf);
            _conn_handle = 0xFFFF;
            attemptFailed(OperationResult::DISCONNECTED);
            break;

        case ConnectionState::CONNECTED:
            WARNING(buf);
            _conn_handle = 0xFFFF;
            if (_config.reconnect.enabled && _config.reconnect.max_attempts > 0) {
                advanceGeneration();
                _reconnecting = true;
                _reconnect_attempt = 0;
                scheduleReconnect();
            } else {
                resetConnection(OperationResult::DISCONNECTED);
                setState(ConnectionState::DISCONNECTED);
            }
            break;

        default:
            DEBUG(buf);
            _conn_handle = 0xFFFF;
            break;
    }
}

void BLECentral::onNotification(const AdapterEvent& event) {
    bool live = (_state == ConnectionState::CONNECTED || _state == ConnectionState::DISCOVERING) &&
                event.conn_handle == _conn_handle;
    if (!live || _notifying.count(event.characteristic) == 0) {
        TRACE("BLECentral: Dropping notification on " + event.characteristic);
        return;
    }

    NotificationEvent notification;
    notification.characteristic = event.characteristic;
    notification.value = event.data;
    notification.generation = event.generation;

    // The hub discards events of a superseded generation
    _hub.publishNotification(notification);
    if (notification.generation != _generation.load()) {
        return;
    }

    TRACE("BLECentral: Notification on " + notification.characteristic + ": " +
          notification.value.toHex());

    if (_on_notification) {
        _on_notification(notification);
    }
}

void BLECentral::checkTimers(double now) {
    switch (_state) {
        case ConnectionState::CONNECTING:
            if (now > _deadline) {
                WARNING("BLECentral: Connection to " + _target.toString() + " timed out after " +
                        std::to_string(_config.connect_timeout_ms) + "ms");
                attemptFailed(OperationResult::TIMEOUT);
            }
            break;

        case ConnectionState::DISCOVERING:
            if (now > _deadline) {
                WARNING("BLECentral: Service discovery on " + _target.toString() + " timed out");
                attemptFailed(OperationResult::DISCOVERY_FAILED);
            }
            break;

        case ConnectionState::DISCONNECTING:
            if (now > _deadline) {
                WARNING("BLECentral: Adapter did not confirm disconnect, forcing DISCONNECTED");
                finishDisconnect();
            }
            break;

        case ConnectionState::RECONNECTING:
            if (now >= _reconnect_at) {
                beginAttempt();
            }
            break;

        default:
            break;
    }
}

OperationResult BLECentral::beginAttempt() {
    uint32_t generation = advanceGeneration();
    _registry.pin(_target);

    if (_reconnecting) {
        INFO("BLECentral: Reconnect attempt " + std::to_string(_reconnect_attempt) + "/" +
             std::to_string(_config.reconnect.max_attempts) + " to " + _target.toString());
    } else {
        INFO("BLECentral: Connecting to " + _target.toString());
    }

    setState(ConnectionState::CONNECTING);
    _deadline = RNS::Utilities::OS::time() + _config.connect_timeout_ms / 1000.0;

    bool started = _platform->connect(_target, _config.connect_timeout_ms,
        [this, generation](OperationResult result, uint16_t conn_handle) {
            AdapterEvent event;
            event.kind = AdapterEvent::Kind::CONNECTED;
            event.generation = generation;
            event.result = result;
            event.conn_handle = conn_handle;
            postEvent(event);
        });

    if (!started) {
        WARNING("BLECentral: Adapter refused connection to " + _target.toString());
        attemptFailed(OperationResult::ADAPTER_ERROR);
        return OperationResult::ADAPTER_ERROR;
    }

    return OperationResult::SUCCESS;
}

void BLECentral::attemptFailed(OperationResult reason) {
    WARNING("BLECentral: Connection attempt to " + _target.toString() + " failed: " +
            resultToString(reason));

    if (_conn_handle != 0xFFFF) {
        // Best effort, the link is abandoned either way
        _platform->disconnect(_conn_handle);
        _conn_handle = 0xFFFF;
    }

    CentralEvent failed;
    failed.type = CentralEventType::CONNECTION_FAILED;
    failed.generation = _generation.load();
    failed.address = _target;
    failed.reason = reason;
    emit(failed);

    // The failure callback may have started something else
    if (_state != ConnectionState::CONNECTING && _state != ConnectionState::DISCOVERING) {
        return;
    }

    if (_reconnecting && _reconnect_attempt < _config.reconnect.max_attempts) {
        scheduleReconnect();
        return;
    }

    if (_reconnecting) {
        WARNING("BLECentral: Giving up on " + _target.toString() + " after " +
                std::to_string(_reconnect_attempt) + " reconnect attempts");
    }
    _reconnecting = false;
    _reconnect_attempt = 0;
    resetConnection(OperationResult::CANCELLED);
    setState(ConnectionState::DISCONNECTED);
}

void BLECentral::scheduleReconnect() {
    _reconnect_attempt++;
    double delay = backoffDelay(_reconnect_attempt);
    _reconnect_at = RNS::Utilities::OS::time() + delay;

    char buf[80];
    snprintf(buf, sizeof(buf), "BLECentral: Reconnect attempt %u in %.2fs",
             static_cast<unsigned int>(_reconnect_attempt), delay);
    INFO(buf);

    setState(ConnectionState::RECONNECTING);
}

double BLECentral::backoffDelay(uint8_t attempt) {
    const ReconnectPolicy& policy = _config.reconnect;

    // initial * multiplier^(attempt-1), capped, then +/- jitter
    double delay = policy.initial_delay * std::pow(policy.multiplier, attempt > 0 ? attempt - 1 : 0);
    if (delay > policy.max_delay) {
        delay = policy.max_delay;
    }

    if (policy.jitter > 0 && delay > 0) {
        std::uniform_real_distribution<double> spread(-policy.jitter, policy.jitter);
        delay += delay * spread(_rng);
    }

    return delay < 0 ? 0 : delay;
}

void BLECentral::finishDisconnect() {
    _conn_handle = 0xFFFF;
    resetConnection(OperationResult::CANCELLED);
    setState(ConnectionState::DISCONNECTED);
}

uint32_t BLECentral::advanceGeneration() {
    uint32_t generation = ++_generation;

    _hub.setGeneration(generation);
    size_t closed = _hub.closeCharacteristicSubscribers();
    size_t cancelled = cancelStale(generation);

    _notifying.clear();
    _notify_enabled.clear();
    _services.reset();

    DEBUG("BLECentral: Generation " + std::to_string(generation) + " (" +
          std::to_string(cancelled) + " operations cancelled, " +
          std::to_string(closed) + " subscriptions closed)");
    return generation;
}

void BLECentral::resetConnection(OperationResult pending_result) {
    clear(pending_result);
    _hub.closeCharacteristicSubscribers();
    _notifying.clear();
    _notify_enabled.clear();
    _services.reset();
    _registry.unpin();
}

void BLECentral::setState(ConnectionState state) {
    if (_state == state) {
        return;
    }

    INFO("BLECentral: State " + std::string(stateToString(_state)) + " -> " + stateToString(state));
    _state = state;

    CentralEvent event;
    event.type = CentralEventType::CONNECTION_STATE_CHANGED;
    event.generation = _generation.load();
    event.address = _target;
    event.state = state;
    emit(event);
}

void BLECentral::emit(const CentralEvent& event) {
    _hub.publishEvent(event);

    switch (event.type) {
        case CentralEventType::DEVICE_DISCOVERED:
            if (_on_device_discovered) {
                _on_device_discovered(event.device);
            }
            break;
        case CentralEventType::CONNECTION_STATE_CHANGED:
            if (_on_connection_state_changed) {
                _on_connection_state_changed(event.state);
            }
            break;
        case CentralEventType::READY:
            if (_on_ready) {
                _on_ready(event.services);
            }
            break;
        case CentralEventType::CONNECTION_FAILED:
            if (_on_connection_failed) {
                _on_connection_failed(event.address, event.reason);
            }
            break;
        case CentralEventType::SCAN_COMPLETE:
            if (_on_scan_complete) {
                _on_scan_complete();
            }
            break;
        case CentralEventType::NOTIFICATION:
            break;
    }
}

} // namespace BLEC
