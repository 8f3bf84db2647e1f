/**
 * @file BLEDeviceRegistry.h
 * @brief Table of discovered BLE peripherals
 *
 * Maintains one record per advertising peripheral, keyed by address:
 * - Upserted on every advertisement (name, signal strength, services)
 * - Read through snapshots, never live views, so readers in any context
 *   are unaffected by concurrent updates
 * - Swept periodically to evict records not seen within the staleness window
 *
 * All methods are thread-safe.
 */
#pragma once

#include "BLETypes.h"
#include "Utilities/OS.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace BLEC {

/**
 * @brief Information about a discovered peripheral
 */
struct DeviceRecord {
    BLEAddress address;
    std::string name;                       // Last advertised name, may be empty
    std::vector<std::string> service_uuids; // Union of advertised services

    // Timing
    double discovered_at = 0.0;
    double last_seen = 0.0;

    // Signal quality
    int8_t rssi = -127;
    int8_t rssi_avg = -127;                 // Smoothed average

    bool connectable = false;
    uint32_t advertisement_count = 0;

    bool advertises(const std::string& service_uuid) const;
};

/**
 * @brief Discovered peripheral table
 */
class BLEDeviceRegistry {
public:
    explicit BLEDeviceRegistry(size_t max_devices = Limits::MAX_DEVICES,
                               double stale_after = Timing::DEVICE_STALE_AFTER);

    void setMaxDevices(size_t max_devices);
    void setStaleAfter(double seconds);
    double staleAfter() const;

    //=========================================================================
    // Updates
    //=========================================================================

    /**
     * @brief Upsert a record from an advertisement
     *
     * Evicts the least recently seen record if the table is full.
     *
     * @param result Advertisement
     * @param record_out Optional copy of the updated record
     * @return true if the device was not known before
     */
    bool onAdvertisement(const ScanResult& result, DeviceRecord* record_out = nullptr);

    /**
     * @brief Remove records whose last-seen time exceeds the staleness window
     *
     * The pinned address (an in-progress connection) is never removed.
     * @return Number of records removed
     */
    size_t prune();

    /**
     * @brief Keep a record alive regardless of staleness
     */
    void pin(const BLEAddress& address);
    void unpin();

    void remove(const BLEAddress& address);
    void clear();

    //=========================================================================
    // Snapshots
    //=========================================================================

    /**
     * @brief Get non-stale records matching a filter
     *
     * The filter's service list and minimum RSSI apply; records are ordered
     * by address.
     */
    std::vector<DeviceRecord> list(const ScanFilter& filter = ScanFilter()) const;

    /**
     * @brief Get a copy of one record
     * @return false if the address is unknown
     */
    bool get(const BLEAddress& address, DeviceRecord& record_out) const;

    bool contains(const BLEAddress& address) const;

    size_t size() const;

private:
    bool isStale(const DeviceRecord& record, double now) const;
    bool matches(const DeviceRecord& record, const ScanFilter& filter) const;
    void evictOldest();

    mutable std::mutex _mutex;
    std::map<BLEAddress, DeviceRecord> _devices;
    size_t _max_devices;
    double _stale_after;
    BLEAddress _pinned;
    bool _has_pinned = false;
};

} // namespace BLEC
