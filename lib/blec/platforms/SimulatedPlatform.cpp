/**
 * @file SimulatedPlatform.cpp
 * @brief In-memory implementation of IBLEPlatform
 */

#include "SimulatedPlatform.h"
#include "Log.h"
#include "Utilities/OS.h"

#include <algorithm>

namespace BLEC {

namespace {

std::string writeKey(const BLEAddress& address, const std::string& characteristic) {
    return address.toString() + "/" + characteristic;
}

}  // namespace

SimulatedPlatform::SimulatedPlatform() {
}

SimulatedPlatform::~SimulatedPlatform() {
    shutdown();
}

//=============================================================================
// Lifecycle
//=============================================================================

bool SimulatedPlatform::initialize(const PlatformConfig& config) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _config = config;
    if (config.scan_interval_ms > 0) {
        _advertising_interval = config.scan_interval_ms / 1000.0;
    }
    _initialized = true;
    INFO("SimulatedPlatform: Initialized as '" + config.device_name + "'");
    return true;
}

bool SimulatedPlatform::start() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_initialized) {
        ERROR("SimulatedPlatform: start() before initialize()");
        return false;
    }
    _running = true;
    DEBUG("SimulatedPlatform: Started with " + std::to_string(_peripherals.size()) + " peripherals");
    return true;
}

void SimulatedPlatform::stop() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _running = false;
    _scanning = false;
}

void SimulatedPlatform::loop() {
    double now = RNS::Utilities::OS::time();

    std::vector<ScanResult> advertisements;
    std::vector<Task> due;
    bool scan_completed = false;
    Callbacks::OnScanResult on_scan_result;
    Callbacks::OnScanComplete on_scan_complete;

    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        if (!_running) {
            return;
        }

        if (_scanning) {
            if (_scan_end > 0 && now >= _scan_end) {
                _scanning = false;
                scan_completed = true;
            } else if (now >= _next_advertisement) {
                for (const SimulatedPeripheral& peripheral : _peripherals) {
                    // Connected peripherals stop advertising
                    if (findLink(peripheral.address)) {
                        continue;
                    }
                    ScanResult result;
                    result.address = peripheral.address;
                    result.name = peripheral.name;
                    result.rssi = peripheral.rssi;
                    result.connectable = peripheral.connectable;
                    for (const std::string& uuid : peripheral.advertised_services) {
                        std::string norm = normalizeUUID(uuid);
                        if (!norm.empty()) {
                            result.service_uuids.push_back(norm);
                        }
                    }
                    if (_scan_filter.matches(result)) {
                        advertisements.push_back(result);
                    }
                }
                _next_advertisement = now + _advertising_interval;
            }
        }

        std::stable_sort(_tasks.begin(), _tasks.end(), [](const Task& a, const Task& b) {
            return a.due < b.due || (a.due == b.due && a.seq < b.seq);
        });
        auto split = std::find_if(_tasks.begin(), _tasks.end(), [now](const Task& task) {
            return task.due > now;
        });
        due.assign(std::make_move_iterator(_tasks.begin()), std::make_move_iterator(split));
        _tasks.erase(_tasks.begin(), split);

        on_scan_result = _on_scan_result;
        on_scan_complete = _on_scan_complete;
    }

    for (const ScanResult& result : advertisements) {
        if (on_scan_result) {
            on_scan_result(result);
        }
    }
    if (scan_completed) {
        DEBUG("SimulatedPlatform: Scan complete");
        if (on_scan_complete) {
            on_scan_complete();
        }
    }
    for (Task& task : due) {
        task.fn();
    }
}

void SimulatedPlatform::shutdown() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _running = false;
    _scanning = false;
    _initialized = false;
    _tasks.clear();
    _links.clear();
}

bool SimulatedPlatform::isRunning() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _running;
}

//=============================================================================
// Scanning
//=============================================================================

bool SimulatedPlatform::startScan(const ScanFilter& filter, uint32_t duration_ms) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_running || consumeRefusal()) {
        return false;
    }

    if (duration_ms == 0) {
        duration_ms = _config.scan_duration_ms;
    }

    double now = RNS::Utilities::OS::time();
    _scan_filter = filter;
    _scanning = true;
    _scan_end = duration_ms > 0 ? now + duration_ms / 1000.0 : 0.0;
    _next_advertisement = now;

    DEBUG("SimulatedPlatform: Scanning" +
          (duration_ms > 0 ? " for " + std::to_string(duration_ms) + "ms" : std::string()));
    return true;
}

void SimulatedPlatform::stopScan() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _scanning = false;
}

bool SimulatedPlatform::isScanning() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _scanning;
}

//=============================================================================
// Connections
//=============================================================================

bool SimulatedPlatform::connect(const BLEAddress& address, uint32_t timeout_ms,
                                Callbacks::OnConnect callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_running || consumeRefusal()) {
        return false;
    }

    _connect_attempts[address]++;
    double timeout = timeout_ms / 1000.0;

    const SimulatedPeripheral* peripheral = findPeripheral(address);
    if (!peripheral || !peripheral->connectable) {
        // Nobody answers, the controller gives up at the timeout
        schedule(timeout, [callback]() {
            callback(OperationResult::TIMEOUT, 0xFFFF);
        });
        return true;
    }

    SimulatedStep step = SimulatedStep::succeed(_latency);
    auto script = _connect_script.find(address);
    if (script != _connect_script.end() && !script->second.empty()) {
        step = script->second.front();
        script->second.pop_front();
    }

    if (step.outcome == SimulatedStep::Outcome::STALL) {
        return true;
    }
    if (step.delay > timeout) {
        schedule(timeout, [callback]() {
            callback(OperationResult::TIMEOUT, 0xFFFF);
        });
        return true;
    }
    if (step.outcome == SimulatedStep::Outcome::FAIL) {
        OperationResult failure = step.failure;
        schedule(step.delay, [callback, failure]() {
            callback(failure, 0xFFFF);
        });
        return true;
    }

    schedule(step.delay, [this, address, callback]() {
        uint16_t handle = 0xFFFF;
        {
            std::lock_guard<std::recursive_mutex> task_lock(_mutex);
            if (findPeripheral(address)) {
                handle = _next_handle++;
                if (_next_handle == 0xFFFF) {
                    _next_handle = 1;
                }
                Link link;
                link.handle = handle;
                link.address = address;
                _links.push_back(link);
            }
        }
        if (handle == 0xFFFF) {
            callback(OperationResult::ADAPTER_ERROR, 0xFFFF);
            return;
        }
        DEBUG("SimulatedPlatform: Link up to " + address.toString() + " handle " +
              std::to_string(handle));
        callback(OperationResult::SUCCESS, handle);
    });
    return true;
}

bool SimulatedPlatform::disconnect(uint16_t conn_handle) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_running || consumeRefusal() || !findLink(conn_handle)) {
        return false;
    }

    schedule(_latency, [this, conn_handle]() {
        Callbacks::OnDisconnected on_disconnected;
        {
            std::lock_guard<std::recursive_mutex> task_lock(_mutex);
            if (!closeLink(conn_handle, REASON_LOCAL_HOST)) {
                return;
            }
            on_disconnected = _on_disconnected;
        }
        if (on_disconnected) {
            on_disconnected(conn_handle, REASON_LOCAL_HOST);
        }
    });
    return true;
}

bool SimulatedPlatform::discoverServices(uint16_t conn_handle, Callbacks::OnDiscovery callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_running || consumeRefusal()) {
        return false;
    }

    Link* link = findLink(conn_handle);
    if (!link) {
        return false;
    }

    SimulatedStep step = SimulatedStep::succeed(_latency);
    auto script = _discovery_script.find(link->address);
    if (script != _discovery_script.end() && !script->second.empty()) {
        step = script->second.front();
        script->second.pop_front();
    }

    if (step.outcome == SimulatedStep::Outcome::STALL) {
        return true;
    }
    if (step.outcome == SimulatedStep::Outcome::FAIL) {
        OperationResult failure = step.failure;
        schedule(step.delay, [callback, failure]() {
            callback(failure, ServiceMap());
        });
        return true;
    }

    schedule(step.delay, [this, conn_handle, callback]() {
        ServiceMap services;
        OperationResult result = OperationResult::DISCONNECTED;
        {
            std::lock_guard<std::recursive_mutex> task_lock(_mutex);
            Link* task_link = findLink(conn_handle);
            const SimulatedPeripheral* peripheral = task_link ? findPeripheral(task_link->address) : nullptr;
            if (peripheral) {
                services = peripheral->services;
                result = OperationResult::SUCCESS;
            }
        }
        callback(result, services);
    });
    return true;
}

//=============================================================================
// GATT Operations
//=============================================================================

bool SimulatedPlatform::read(uint16_t conn_handle, const std::string& characteristic,
                             Callbacks::OnOperation callback) {
    return scheduleOperation(conn_handle, characteristic, Property::READ, _latency,
        [characteristic](SimulatedPeripheral& peripheral, Link&, Bytes& data) {
            auto it = peripheral.values.find(normalizeUUID(characteristic));
            data = (it != peripheral.values.end()) ? it->second : Bytes();
            return OperationResult::SUCCESS;
        },
        callback);
}

bool SimulatedPlatform::write(uint16_t conn_handle, const std::string& characteristic,
                              const Bytes& data, bool response, Callbacks::OnOperation callback) {
    std::string uuid = normalizeUUID(characteristic);
    return scheduleOperation(conn_handle, characteristic,
        response ? Property::WRITE : Property::WRITE_NO_RESPONSE,
        response ? _latency : 0.0,
        [this, uuid, data](SimulatedPeripheral& peripheral, Link& link, Bytes&) {
            peripheral.values[uuid] = data;
            _writes[writeKey(link.address, uuid)].push_back(data);
            return OperationResult::SUCCESS;
        },
        callback);
}

bool SimulatedPlatform::setNotify(uint16_t conn_handle, const std::string& characteristic,
                                  bool enable, Callbacks::OnOperation callback) {
    std::string uuid = normalizeUUID(characteristic);
    return scheduleOperation(conn_handle, characteristic, Property::NOTIFY | Property::INDICATE,
        _latency,
        [uuid, enable](SimulatedPeripheral&, Link& link, Bytes&) {
            if (enable) {
                link.notifying.insert(uuid);
            } else {
                link.notifying.erase(uuid);
            }
            return OperationResult::SUCCESS;
        },
        callback);
}

//=============================================================================
// Callback Registration
//=============================================================================

void SimulatedPlatform::setOnScanResult(Callbacks::OnScanResult callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_scan_result = callback;
}

void SimulatedPlatform::setOnScanComplete(Callbacks::OnScanComplete callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_scan_complete = callback;
}

void SimulatedPlatform::setOnDisconnected(Callbacks::OnDisconnected callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_disconnected = callback;
}

void SimulatedPlatform::setOnNotification(Callbacks::OnNotification callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _on_notification = callback;
}

//=============================================================================
// Scripting
//=============================================================================

void SimulatedPlatform::addPeripheral(const SimulatedPeripheral& peripheral) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    SimulatedPeripheral copy = peripheral;
    std::map<std::string, Bytes> values;
    for (const auto& entry : peripheral.values) {
        values[normalizeUUID(entry.first)] = entry.second;
    }
    copy.values = values;

    SimulatedPeripheral* existing = findPeripheral(peripheral.address);
    if (existing) {
        *existing = copy;
    } else {
        _peripherals.push_back(copy);
    }
}

void SimulatedPlatform::removePeripheral(const BLEAddress& address) {
    uint16_t handle = 0xFFFF;
    Callbacks::OnDisconnected on_disconnected;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _peripherals.erase(std::remove_if(_peripherals.begin(), _peripherals.end(),
                                          [&address](const SimulatedPeripheral& p) {
                                              return p.address == address;
                                          }),
                           _peripherals.end());
        const Link* link = findLink(address);
        if (link) {
            handle = link->handle;
            closeLink(handle, REASON_SUPERVISION_TIMEOUT);
            on_disconnected = _on_disconnected;
        }
    }
    if (handle != 0xFFFF && on_disconnected) {
        on_disconnected(handle, REASON_SUPERVISION_TIMEOUT);
    }
}

void SimulatedPlatform::setAdvertisingInterval(double seconds) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _advertising_interval = seconds;
}

void SimulatedPlatform::setLatency(double seconds) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _latency = seconds;
}

void SimulatedPlatform::scriptConnect(const BLEAddress& address, const SimulatedStep& step) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _connect_script[address].push_back(step);
}

void SimulatedPlatform::scriptDiscovery(const BLEAddress& address, const SimulatedStep& step) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _discovery_script[address].push_back(step);
}

void SimulatedPlatform::refuseNextCall() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _refuse_next = true;
}

void SimulatedPlatform::stallCharacteristic(const std::string& characteristic, bool stalled) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (stalled) {
        _stalled.insert(normalizeUUID(characteristic));
    } else {
        _stalled.erase(normalizeUUID(characteristic));
    }
}

void SimulatedPlatform::failCharacteristic(const std::string& characteristic, OperationResult failure) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (failure == OperationResult::SUCCESS) {
        _failing.erase(normalizeUUID(characteristic));
    } else {
        _failing[normalizeUUID(characteristic)] = failure;
    }
}

bool SimulatedPlatform::dropConnection(const BLEAddress& address, uint8_t reason) {
    uint16_t handle = 0xFFFF;
    Callbacks::OnDisconnected on_disconnected;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        const Link* link = findLink(address);
        if (!link) {
            return false;
        }
        handle = link->handle;
        closeLink(handle, reason);
        on_disconnected = _on_disconnected;
    }

    if (on_disconnected) {
        on_disconnected(handle, reason);
    }
    return true;
}

bool SimulatedPlatform::emitNotification(const BLEAddress& address, const std::string& characteristic,
                                         const Bytes& value) {
    std::string uuid = normalizeUUID(characteristic);
    uint16_t handle = 0xFFFF;
    Callbacks::OnNotification on_notification;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        const Link* link = findLink(address);
        if (!link || link->notifying.count(uuid) == 0) {
            return false;
        }
        SimulatedPeripheral* peripheral = findPeripheral(address);
        if (peripheral) {
            peripheral->values[uuid] = value;
        }
        handle = link->handle;
        on_notification = _on_notification;
    }

    if (!on_notification) {
        return false;
    }
    on_notification(handle, uuid, value);
    return true;
}

//=============================================================================
// Inspection
//=============================================================================

bool SimulatedPlatform::isConnected(const BLEAddress& address) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return findLink(address) != nullptr;
}

bool SimulatedPlatform::isNotifying(const BLEAddress& address, const std::string& characteristic) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    const Link* link = findLink(address);
    return link && link->notifying.count(normalizeUUID(characteristic)) > 0;
}

size_t SimulatedPlatform::connectAttempts(const BLEAddress& address) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    auto it = _connect_attempts.find(address);
    return it != _connect_attempts.end() ? it->second : 0;
}

size_t SimulatedPlatform::connectionCount() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _links.size();
}

Bytes SimulatedPlatform::valueOf(const BLEAddress& address, const std::string& characteristic) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    const SimulatedPeripheral* peripheral = findPeripheral(address);
    if (!peripheral) {
        return Bytes();
    }
    auto it = peripheral->values.find(normalizeUUID(characteristic));
    return it != peripheral->values.end() ? it->second : Bytes();
}

std::vector<Bytes> SimulatedPlatform::writesTo(const BLEAddress& address,
                                               const std::string& characteristic) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    auto it = _writes.find(writeKey(address, normalizeUUID(characteristic)));
    return it != _writes.end() ? it->second : std::vector<Bytes>();
}

size_t SimulatedPlatform::pendingTasks() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _tasks.size();
}

//=============================================================================
// Private Methods
//=============================================================================

void SimulatedPlatform::schedule(double delay, std::function<void()> fn) {
    Task task;
    task.due = RNS::Utilities::OS::time() + delay;
    task.seq = _next_seq++;
    task.fn = std::move(fn);
    _tasks.push_back(std::move(task));
}

bool SimulatedPlatform::consumeRefusal() {
    if (_refuse_next) {
        _refuse_next = false;
        DEBUG("SimulatedPlatform: Refusing call as scripted");
        return true;
    }
    return false;
}

SimulatedPeripheral* SimulatedPlatform::findPeripheral(const BLEAddress& address) {
    for (SimulatedPeripheral& peripheral : _peripherals) {
        if (peripheral.address == address) {
            return &peripheral;
        }
    }
    return nullptr;
}

const SimulatedPeripheral* SimulatedPlatform::findPeripheral(const BLEAddress& address) const {
    return const_cast<SimulatedPlatform*>(this)->findPeripheral(address);
}

SimulatedPlatform::Link* SimulatedPlatform::findLink(uint16_t conn_handle) {
    for (Link& link : _links) {
        if (link.handle == conn_handle) {
            return &link;
        }
    }
    return nullptr;
}

const SimulatedPlatform::Link* SimulatedPlatform::findLink(const BLEAddress& address) const {
    for (const Link& link : _links) {
        if (link.address == address) {
            return &link;
        }
    }
    return nullptr;
}

bool SimulatedPlatform::closeLink(uint16_t conn_handle, uint8_t reason) {
    auto it = std::find_if(_links.begin(), _links.end(), [conn_handle](const Link& link) {
        return link.handle == conn_handle;
    });
    if (it == _links.end()) {
        return false;
    }
    char buf[80];
    snprintf(buf, sizeof(buf), "SimulatedPlatform: Link down to %s handle %u reason 0x%02X",
             it->address.toString().c_str(), conn_handle, reason);
    DEBUG(buf);
    _links.erase(it);
    return true;
}

bool SimulatedPlatform::scheduleOperation(uint16_t conn_handle, const std::string& characteristic,
                                          uint8_t required_properties, double delay,
                                          std::function<OperationResult(SimulatedPeripheral&, Link&, Bytes&)> apply,
                                          Callbacks::OnOperation callback) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    if (!_running || consumeRefusal()) {
        return false;
    }

    Link* link = findLink(conn_handle);
    if (!link) {
        return false;
    }
    const SimulatedPeripheral* peripheral = findPeripheral(link->address);
    if (!peripheral) {
        return false;
    }

    std::string uuid = normalizeUUID(characteristic);
    const CharacteristicInfo* info = peripheral->services.findCharacteristic(uuid);

    OperationResult early = OperationResult::SUCCESS;
    if (!info) {
        early = OperationResult::NOT_FOUND;
    } else if (required_properties != 0 && (info->properties & required_properties) == 0) {
        early = OperationResult::NOT_SUPPORTED;
    } else if (_stalled.count(uuid) > 0) {
        return true;
    } else if (_failing.count(uuid) > 0) {
        early = _failing[uuid];
    }

    if (early != OperationResult::SUCCESS) {
        schedule(delay, [callback, early]() {
            if (callback) {
                callback(early, Bytes());
            }
        });
        return true;
    }

    schedule(delay, [this, conn_handle, apply, callback]() {
        Bytes data;
        OperationResult result = OperationResult::DISCONNECTED;
        {
            std::lock_guard<std::recursive_mutex> task_lock(_mutex);
            Link* task_link = findLink(conn_handle);
            SimulatedPeripheral* task_peripheral = task_link ? findPeripheral(task_link->address) : nullptr;
            if (task_peripheral) {
                result = apply(*task_peripheral, *task_link, data);
            }
        }
        if (callback) {
            callback(result, data);
        }
    });
    return true;
}

} // namespace BLEC
