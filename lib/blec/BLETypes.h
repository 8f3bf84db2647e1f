/**
 * @file BLETypes.h
 * @brief BLE central client types, constants, and common structures
 *
 * This file defines the core types used throughout the BLE central client.
 * It includes timing and limit constants, result codes, connection states,
 * addressing, scan results, GATT operation descriptors, configuration, and
 * the callback signatures shared by the platform layer and the host API.
 */
#pragma once

#include "Bytes.h"
#include "Log.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace BLEC {

using RNS::Bytes;

//=============================================================================
// UUIDs
//=============================================================================

namespace UUID {
    // Bluetooth SIG base UUID, used to expand 16-bit and 32-bit short forms
    static constexpr const char* BASE_SUFFIX = "-0000-1000-8000-00805f9b34fb";
}

//=============================================================================
// Timing Constants (defaults, overridable through CentralConfig)
//=============================================================================

namespace Timing {
    static constexpr uint32_t CONNECT_TIMEOUT_MS = 30000;     // Link establishment
    static constexpr uint32_t DISCOVERY_TIMEOUT_MS = 10000;   // Service enumeration
    static constexpr uint32_t DISCONNECT_TIMEOUT_MS = 3000;   // Best-effort teardown
    static constexpr uint32_t OPERATION_TIMEOUT_MS = 5000;    // Per GATT command
    static constexpr double DEVICE_STALE_AFTER = 30.0;        // Seconds before registry eviction
    static constexpr double PRUNE_INTERVAL = 1.0;             // Seconds between registry sweeps
    static constexpr double RECONNECT_INITIAL_DELAY = 1.0;    // Seconds before first reconnect
    static constexpr double RECONNECT_MULTIPLIER = 2.0;       // Backoff growth per attempt
    static constexpr double RECONNECT_MAX_DELAY = 30.0;       // Backoff ceiling in seconds
    static constexpr double RECONNECT_JITTER = 0.1;           // +/- fraction of the delay
}

//=============================================================================
// Limits
//=============================================================================

namespace Limits {
    static constexpr size_t MAX_DEVICES = 100;                // Registry capacity
    static constexpr size_t MAX_SUBSCRIBERS = 32;             // Fan-out arena slots
    static constexpr size_t SUBSCRIBER_QUEUE_DEPTH = 64;      // Events buffered per subscriber
    static constexpr size_t MAX_PENDING_EVENTS = 256;         // Adapter inbox depth
    static constexpr uint8_t RECONNECT_MAX_ATTEMPTS = 3;
}

//=============================================================================
// Enumerations
//=============================================================================

/**
 * @brief Platform type for startup selection
 */
enum class PlatformType {
    NONE,
    SIMULATED           // In-memory radio with scripted peripherals
};

/**
 * @brief Connection state machine states
 *
 * DISCONNECTED -> CONNECTING -> DISCOVERING -> CONNECTED -> DISCONNECTING -> DISCONNECTED
 * CONNECTED -> RECONNECTING -> CONNECTING (unexpected link loss with auto-reconnect)
 */
enum class ConnectionState : uint8_t {
    DISCONNECTED,
    CONNECTING,
    DISCOVERING,
    CONNECTED,
    DISCONNECTING,
    RECONNECTING
};

/**
 * @brief GATT operation types for queuing
 */
enum class OperationType : uint8_t {
    READ,
    WRITE,
    WRITE_NO_RESPONSE,
    NOTIFY_ENABLE,
    NOTIFY_DISABLE
};

/**
 * @brief Result codes for commands, GATT operations and connection attempts
 */
enum class OperationResult : uint8_t {
    SUCCESS,
    PENDING,
    TIMEOUT,
    CANCELLED,
    BUSY,
    ALREADY_CONNECTED,
    NOT_CONNECTED,
    NOT_FOUND,
    NOT_SUPPORTED,
    DISCOVERY_FAILED,
    SERVICE_NOT_FOUND,
    ADAPTER_ERROR,
    DISCONNECTED,
    INVALID_ARGUMENT,
    NOT_RUNNING
};

/**
 * @brief GATT characteristic property bits (Core spec Vol 3, Part G, 3.3.1.1)
 */
namespace Property {
    static constexpr uint8_t BROADCAST         = 0x01;
    static constexpr uint8_t READ              = 0x02;
    static constexpr uint8_t WRITE_NO_RESPONSE = 0x04;
    static constexpr uint8_t WRITE             = 0x08;
    static constexpr uint8_t NOTIFY            = 0x10;
    static constexpr uint8_t INDICATE          = 0x20;
}

//=============================================================================
// UUID Helpers
//=============================================================================

/**
 * @brief Normalize a UUID string to lowercase 128-bit form
 *
 * Accepts 16-bit ("180d"), 32-bit ("0000180d") and 128-bit forms, with or
 * without "0x" prefix. Returns an empty string if the input is malformed.
 */
inline std::string normalizeUUID(const std::string& uuid) {
    std::string s;
    s.reserve(uuid.size());
    for (char c : uuid) {
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (s.size() > 2 && s[0] == '0' && s[1] == 'x') {
        s = s.substr(2);
    }

    auto all_hex = [](const std::string& str) {
        return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        });
    };

    if (s.size() == 4 && all_hex(s)) {
        return "0000" + s + UUID::BASE_SUFFIX;
    }
    if (s.size() == 8 && all_hex(s)) {
        return s + UUID::BASE_SUFFIX;
    }
    if (s.size() == 36 && s[8] == '-' && s[13] == '-' && s[18] == '-' && s[23] == '-') {
        std::string digits = s.substr(0, 8) + s.substr(9, 4) + s.substr(14, 4) +
                             s.substr(19, 4) + s.substr(24);
        if (all_hex(digits)) {
            return s;
        }
    }
    return std::string();
}

//=============================================================================
// Data Structures
//=============================================================================

/**
 * @brief BLE address (6 bytes + type)
 *
 * The stable device identifier for the lifetime of a radio session.
 */
struct BLEAddress {
    uint8_t addr[6] = {0};
    uint8_t type = 0;  // 0 = public, 1 = random

    BLEAddress() = default;

    BLEAddress(const uint8_t* address, uint8_t addr_type = 0) : type(addr_type) {
        if (address) {
            memcpy(addr, address, 6);
        }
    }

    bool operator==(const BLEAddress& other) const {
        return memcmp(addr, other.addr, 6) == 0 && type == other.type;
    }

    bool operator!=(const BLEAddress& other) const {
        return !(*this == other);
    }

    bool operator<(const BLEAddress& other) const {
        int cmp = memcmp(addr, other.addr, 6);
        if (cmp != 0) return cmp < 0;
        return type < other.type;
    }

    /**
     * @brief Convert to colon-separated hex string (XX:XX:XX:XX:XX:XX)
     * addr[0] is MSB (first displayed), addr[5] is LSB (last displayed)
     */
    std::string toString() const {
        char buf[18];
        snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                 addr[0], addr[1], addr[2], addr[3], addr[4], addr[5]);
        return std::string(buf);
    }

    /**
     * @brief Parse from colon-separated hex string
     * First byte in string goes to addr[0] (MSB). Returns a zero address on
     * malformed input.
     */
    static BLEAddress fromString(const std::string& str, uint8_t addr_type = 0) {
        BLEAddress result;
        result.type = addr_type;
        if (str.length() >= 17) {
            unsigned int values[6];
            if (sscanf(str.c_str(), "%02X:%02X:%02X:%02X:%02X:%02X",
                       &values[0], &values[1], &values[2],
                       &values[3], &values[4], &values[5]) == 6) {
                for (int i = 0; i < 6; i++) {
                    result.addr[i] = static_cast<uint8_t>(values[i]);
                }
            }
        }
        return result;
    }

    Bytes toBytes() const {
        return Bytes(addr, 6);
    }

    /**
     * @brief Check if address is all zeros (invalid)
     */
    bool isZero() const {
        for (int i = 0; i < 6; i++) {
            if (addr[i] != 0) return false;
        }
        return true;
    }
};

/**
 * @brief Advertisement received while scanning
 */
struct ScanResult {
    BLEAddress address;
    std::string name;                       // Empty if not advertised
    int8_t rssi = 0;
    bool connectable = false;
    std::vector<std::string> service_uuids; // Normalized 128-bit UUIDs
};

/**
 * @brief Scan filter
 *
 * An empty service list matches every advertisement.
 */
struct ScanFilter {
    std::vector<std::string> service_uuids;
    int8_t min_rssi = -127;

    bool matches(const ScanResult& result) const {
        if (result.rssi < min_rssi) {
            return false;
        }
        if (service_uuids.empty()) {
            return true;
        }
        for (const std::string& wanted : service_uuids) {
            std::string norm = normalizeUUID(wanted);
            for (const std::string& advertised : result.service_uuids) {
                if (advertised == norm) {
                    return true;
                }
            }
        }
        return false;
    }
};

/**
 * @brief GATT operation for queuing
 */
struct GATTOperation {
    uint32_t id = 0;                    // Assigned on enqueue
    OperationType type = OperationType::READ;
    uint16_t conn_handle = 0xFFFF;      // Resolved at execution time
    std::string characteristic;         // Normalized characteristic UUID
    Bytes data;                         // For writes
    uint32_t timeout_ms = 0;            // 0 = queue default
    uint32_t generation = 0;            // Connection generation at submission

    // Completion callback, invoked exactly once
    std::function<void(OperationResult, const Bytes&)> callback;

    // Internal tracking
    double queued_at = 0;
    double started_at = 0;
};

/**
 * @brief Auto-reconnect policy applied on unexpected link loss
 */
struct ReconnectPolicy {
    bool enabled = false;
    uint8_t max_attempts = Limits::RECONNECT_MAX_ATTEMPTS;
    double initial_delay = Timing::RECONNECT_INITIAL_DELAY;
    double multiplier = Timing::RECONNECT_MULTIPLIER;
    double max_delay = Timing::RECONNECT_MAX_DELAY;
    double jitter = Timing::RECONNECT_JITTER;
};

/**
 * @brief Central client configuration
 */
struct CentralConfig {
    uint32_t connect_timeout_ms = Timing::CONNECT_TIMEOUT_MS;
    uint32_t discovery_timeout_ms = Timing::DISCOVERY_TIMEOUT_MS;
    uint32_t disconnect_timeout_ms = Timing::DISCONNECT_TIMEOUT_MS;
    uint32_t default_operation_timeout_ms = Timing::OPERATION_TIMEOUT_MS;

    double device_stale_after = Timing::DEVICE_STALE_AFTER;
    double prune_interval = Timing::PRUNE_INTERVAL;
    size_t max_devices = Limits::MAX_DEVICES;
    size_t subscriber_queue_depth = Limits::SUBSCRIBER_QUEUE_DEPTH;

    ReconnectPolicy reconnect;

    /**
     * @brief Clamp out-of-range values to usable ones
     * @return Number of fields that were corrected
     */
    size_t validate();
};

/**
 * @brief Platform (adapter) configuration
 */
struct PlatformConfig {
    std::string device_name = "blec";

    // Scan parameters
    uint16_t scan_interval_ms = 100;    // Advertisement reporting cadence
    uint32_t scan_duration_ms = 0;      // Default for startScan(); 0 = continuous
};

//=============================================================================
// String Conversion
//=============================================================================

/**
 * @brief Convert ConnectionState to string for logging
 */
inline const char* stateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED:  return "DISCONNECTED";
        case ConnectionState::CONNECTING:    return "CONNECTING";
        case ConnectionState::DISCOVERING:   return "DISCOVERING";
        case ConnectionState::CONNECTED:     return "CONNECTED";
        case ConnectionState::DISCONNECTING: return "DISCONNECTING";
        case ConnectionState::RECONNECTING:  return "RECONNECTING";
        default:                             return "UNKNOWN";
    }
}

/**
 * @brief Convert OperationResult to string for logging and events
 */
inline const char* resultToString(OperationResult result) {
    switch (result) {
        case OperationResult::SUCCESS:           return "SUCCESS";
        case OperationResult::PENDING:           return "PENDING";
        case OperationResult::TIMEOUT:           return "TIMEOUT";
        case OperationResult::CANCELLED:         return "CANCELLED";
        case OperationResult::BUSY:              return "BUSY";
        case OperationResult::ALREADY_CONNECTED: return "ALREADY_CONNECTED";
        case OperationResult::NOT_CONNECTED:     return "NOT_CONNECTED";
        case OperationResult::NOT_FOUND:         return "NOT_FOUND";
        case OperationResult::NOT_SUPPORTED:     return "NOT_SUPPORTED";
        case OperationResult::DISCOVERY_FAILED:  return "DISCOVERY_FAILED";
        case OperationResult::SERVICE_NOT_FOUND: return "SERVICE_NOT_FOUND";
        case OperationResult::ADAPTER_ERROR:     return "ADAPTER_ERROR";
        case OperationResult::DISCONNECTED:      return "DISCONNECTED";
        case OperationResult::INVALID_ARGUMENT:  return "INVALID_ARGUMENT";
        case OperationResult::NOT_RUNNING:       return "NOT_RUNNING";
        default:                                 return "UNKNOWN";
    }
}

inline const char* operationToString(OperationType type) {
    switch (type) {
        case OperationType::READ:              return "READ";
        case OperationType::WRITE:             return "WRITE";
        case OperationType::WRITE_NO_RESPONSE: return "WRITE_NO_RESPONSE";
        case OperationType::NOTIFY_ENABLE:     return "NOTIFY_ENABLE";
        case OperationType::NOTIFY_DISABLE:    return "NOTIFY_DISABLE";
        default:                               return "UNKNOWN";
    }
}

} // namespace BLEC
