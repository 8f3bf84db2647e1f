/**
 * @file BLEDeviceRegistry.cpp
 * @brief Table of discovered BLE peripherals implementation
 */

#include "BLEDeviceRegistry.h"
#include "Log.h"

namespace BLEC {

bool DeviceRecord::advertises(const std::string& service_uuid) const {
    std::string uuid = normalizeUUID(service_uuid);
    return std::find(service_uuids.begin(), service_uuids.end(), uuid) != service_uuids.end();
}

BLEDeviceRegistry::BLEDeviceRegistry(size_t max_devices, double stale_after)
    : _max_devices(max_devices > 0 ? max_devices : 1), _stale_after(stale_after) {
}

void BLEDeviceRegistry::setMaxDevices(size_t max_devices) {
    std::lock_guard<std::mutex> lock(_mutex);
    _max_devices = max_devices > 0 ? max_devices : 1;
    while (_devices.size() > _max_devices) {
        evictOldest();
    }
}

void BLEDeviceRegistry::setStaleAfter(double seconds) {
    std::lock_guard<std::mutex> lock(_mutex);
    _stale_after = seconds;
}

double BLEDeviceRegistry::staleAfter() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _stale_after;
}

//=============================================================================
// Updates
//=============================================================================

bool BLEDeviceRegistry::onAdvertisement(const ScanResult& result, DeviceRecord* record_out) {
    if (result.address.isZero()) {
        return false;
    }

    double now = RNS::Utilities::OS::time();
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _devices.find(result.address);
    if (it != _devices.end()) {
        DeviceRecord& record = it->second;

        record.last_seen = now;
        record.rssi = result.rssi;
        // Exponential moving average for RSSI
        record.rssi_avg = static_cast<int8_t>(0.7f * record.rssi_avg + 0.3f * result.rssi);
        record.connectable = result.connectable;
        record.advertisement_count++;

        // Scan responses often omit the name, keep the last one seen
        if (!result.name.empty()) {
            record.name = result.name;
        }
        for (const std::string& uuid : result.service_uuids) {
            std::string norm = normalizeUUID(uuid);
            if (!norm.empty() && !record.advertises(norm)) {
                record.service_uuids.push_back(norm);
            }
        }

        if (record_out) {
            *record_out = record;
        }
        return false;
    }

    if (_devices.size() >= _max_devices) {
        evictOldest();
    }

    DeviceRecord record;
    record.address = result.address;
    record.name = result.name;
    record.discovered_at = now;
    record.last_seen = now;
    record.rssi = result.rssi;
    record.rssi_avg = result.rssi;
    record.connectable = result.connectable;
    record.advertisement_count = 1;
    for (const std::string& uuid : result.service_uuids) {
        std::string norm = normalizeUUID(uuid);
        if (!norm.empty() && !record.advertises(norm)) {
            record.service_uuids.push_back(norm);
        }
    }

    _devices[result.address] = record;

    char buf[96];
    snprintf(buf, sizeof(buf), "BLEDeviceRegistry: Discovered new device %s RSSI %d",
             result.address.toString().c_str(), result.rssi);
    DEBUG(buf);

    if (record_out) {
        *record_out = record;
    }
    return true;
}

size_t BLEDeviceRegistry::prune() {
    double now = RNS::Utilities::OS::time();
    std::lock_guard<std::mutex> lock(_mutex);

    size_t removed = 0;
    for (auto it = _devices.begin(); it != _devices.end();) {
        if (_has_pinned && it->first == _pinned) {
            ++it;
            continue;
        }
        if (isStale(it->second, now)) {
            TRACE("BLEDeviceRegistry: Removed stale device " + it->first.toString());
            it = _devices.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

void BLEDeviceRegistry::pin(const BLEAddress& address) {
    std::lock_guard<std::mutex> lock(_mutex);
    _pinned = address;
    _has_pinned = true;
}

void BLEDeviceRegistry::unpin() {
    std::lock_guard<std::mutex> lock(_mutex);
    _pinned = BLEAddress();
    _has_pinned = false;
}

void BLEDeviceRegistry::remove(const BLEAddress& address) {
    std::lock_guard<std::mutex> lock(_mutex);
    _devices.erase(address);
}

void BLEDeviceRegistry::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _devices.clear();
}

//=============================================================================
// Snapshots
//=============================================================================

std::vector<DeviceRecord> BLEDeviceRegistry::list(const ScanFilter& filter) const {
    double now = RNS::Utilities::OS::time();
    std::lock_guard<std::mutex> lock(_mutex);

    std::vector<DeviceRecord> result;
    result.reserve(_devices.size());
    for (const auto& entry : _devices) {
        if (isStale(entry.second, now)) {
            continue;
        }
        if (matches(entry.second, filter)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

bool BLEDeviceRegistry::get(const BLEAddress& address, DeviceRecord& record_out) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _devices.find(address);
    if (it == _devices.end()) {
        return false;
    }
    record_out = it->second;
    return true;
}

bool BLEDeviceRegistry::contains(const BLEAddress& address) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices.count(address) > 0;
}

size_t BLEDeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices.size();
}

//=============================================================================
// Private Methods
//=============================================================================

bool BLEDeviceRegistry::isStale(const DeviceRecord& record, double now) const {
    return (now - record.last_seen) > _stale_after;
}

bool BLEDeviceRegistry::matches(const DeviceRecord& record, const ScanFilter& filter) const {
    if (record.rssi < filter.min_rssi) {
        return false;
    }
    if (filter.service_uuids.empty()) {
        return true;
    }
    for (const std::string& wanted : filter.service_uuids) {
        if (record.advertises(wanted)) {
            return true;
        }
    }
    return false;
}

void BLEDeviceRegistry::evictOldest() {
    auto oldest = _devices.end();
    for (auto it = _devices.begin(); it != _devices.end(); ++it) {
        if (_has_pinned && it->first == _pinned) {
            continue;
        }
        if (oldest == _devices.end() || it->second.last_seen < oldest->second.last_seen) {
            oldest = it;
        }
    }
    if (oldest != _devices.end()) {
        TRACE("BLEDeviceRegistry: Registry full, evicting " + oldest->first.toString());
        _devices.erase(oldest);
    }
}

} // namespace BLEC
