/**
 * @file BLEPlatform.h
 * @brief BLE adapter abstraction consumed by the central client
 *
 * Provides a platform-agnostic interface to the radio stack. Platform-specific
 * implementations (a simulated radio today, native stacks as they are added)
 * implement this interface so the central client works unchanged across them.
 *
 * The HAL abstracts:
 * - Stack initialization and lifecycle
 * - Scanning
 * - Connection establishment and teardown
 * - Service discovery
 * - GATT operations (read, write, subscribe)
 *
 * Every asynchronous primitive takes its own completion callback. Callbacks
 * may fire from any thread, including synchronously from inside the call.
 * A primitive returning false will not invoke its callback.
 */
#pragma once

#include "BLETypes.h"
#include "BLEServiceMap.h"
#include "Bytes.h"

#include <memory>
#include <vector>

namespace BLEC {

//=============================================================================
// Callback Type Definitions
//=============================================================================

namespace Callbacks {
    // Scan callbacks
    using OnScanResult = std::function<void(const ScanResult& result)>;
    using OnScanComplete = std::function<void()>;

    // Per-call completions
    using OnConnect = std::function<void(OperationResult result, uint16_t conn_handle)>;
    using OnDiscovery = std::function<void(OperationResult result, const ServiceMap& services)>;
    using OnOperation = std::function<void(OperationResult result, const Bytes& data)>;

    // Out-of-band link events
    using OnDisconnected = std::function<void(uint16_t conn_handle, uint8_t reason)>;
    using OnNotification = std::function<void(uint16_t conn_handle, const std::string& characteristic,
                                              const Bytes& value)>;
}

/**
 * @brief Abstract BLE adapter interface
 *
 * Platform-specific implementations should inherit from this class and
 * implement all pure virtual methods. The factory selects one at startup.
 */
class IBLEPlatform {
public:
    using Ptr = std::shared_ptr<IBLEPlatform>;

    virtual ~IBLEPlatform() = default;

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Initialize the BLE stack with configuration
     *
     * @param config Platform configuration
     * @return true if initialization successful
     */
    virtual bool initialize(const PlatformConfig& config) = 0;

    /**
     * @brief Start BLE operations
     * @return true if started successfully
     */
    virtual bool start() = 0;

    /**
     * @brief Stop all BLE operations
     */
    virtual void stop() = 0;

    /**
     * @brief Main loop processing - must be called periodically
     *
     * Handles stack events and invokes callbacks on platforms without their
     * own event thread.
     */
    virtual void loop() = 0;

    /**
     * @brief Shutdown and cleanup the BLE stack
     */
    virtual void shutdown() = 0;

    /**
     * @brief Check if platform is initialized and running
     */
    virtual bool isRunning() const = 0;

    //=========================================================================
    // Scanning
    //=========================================================================

    /**
     * @brief Start scanning for peripherals
     *
     * @param filter Advertisements not matching are not reported
     * @param duration_ms Scan duration in milliseconds (0 = PlatformConfig::scan_duration_ms,
     *        which in turn 0 = until stopScan())
     * @return true if scan started successfully
     */
    virtual bool startScan(const ScanFilter& filter, uint32_t duration_ms = 0) = 0;

    /**
     * @brief Stop scanning
     */
    virtual void stopScan() = 0;

    /**
     * @brief Check if currently scanning
     */
    virtual bool isScanning() const = 0;

    //=========================================================================
    // Connections
    //=========================================================================

    /**
     * @brief Connect to a peripheral
     *
     * @param address Peer's BLE address
     * @param timeout_ms Connection timeout in milliseconds
     * @param callback Invoked once with the outcome and connection handle
     * @return true if connection attempt started
     */
    virtual bool connect(const BLEAddress& address, uint32_t timeout_ms,
                         Callbacks::OnConnect callback) = 0;

    /**
     * @brief Disconnect from a peer
     *
     * The disconnected callback fires when the link is down.
     *
     * @param conn_handle Connection handle
     * @return true if disconnect initiated
     */
    virtual bool disconnect(uint16_t conn_handle) = 0;

    /**
     * @brief Enumerate services and characteristics of a connected peripheral
     *
     * @param conn_handle Connection handle
     * @param callback Invoked once with the outcome and discovered map
     * @return true if discovery started
     */
    virtual bool discoverServices(uint16_t conn_handle, Callbacks::OnDiscovery callback) = 0;

    //=========================================================================
    // GATT Operations
    //=========================================================================

    /**
     * @brief Read a characteristic value
     * @return true if read was started
     */
    virtual bool read(uint16_t conn_handle, const std::string& characteristic,
                      Callbacks::OnOperation callback) = 0;

    /**
     * @brief Write a characteristic value
     *
     * @param response true for write with response, false for write without
     *        response (callback then fires once the write is handed to the
     *        controller)
     * @return true if write was started
     */
    virtual bool write(uint16_t conn_handle, const std::string& characteristic, const Bytes& data,
                       bool response, Callbacks::OnOperation callback) = 0;

    /**
     * @brief Enable/disable notifications or indications on a characteristic
     * @return true if the CCCD write was started
     */
    virtual bool setNotify(uint16_t conn_handle, const std::string& characteristic, bool enable,
                           Callbacks::OnOperation callback) = 0;

    //=========================================================================
    // Callback Registration
    //=========================================================================

    virtual void setOnScanResult(Callbacks::OnScanResult callback) = 0;
    virtual void setOnScanComplete(Callbacks::OnScanComplete callback) = 0;

    /**
     * @brief Set callback for link loss (fires once per connection)
     */
    virtual void setOnDisconnected(Callbacks::OnDisconnected callback) = 0;

    /**
     * @brief Set callback for values pushed by a peripheral
     */
    virtual void setOnNotification(Callbacks::OnNotification callback) = 0;

    //=========================================================================
    // Platform Info
    //=========================================================================

    virtual PlatformType getPlatformType() const = 0;
    virtual std::string getPlatformName() const = 0;
};

/**
 * @brief Factory for creating platform-specific BLE implementations
 */
class BLEPlatformFactory {
public:
    /**
     * @brief Create the platform detected for this build
     * @return Shared pointer to platform instance, or nullptr if no platform available
     */
    static IBLEPlatform::Ptr create();

    /**
     * @brief Create specific platform (for testing or explicit selection)
     *
     * @param type Platform type to create
     * @return Shared pointer to platform instance, or nullptr if not available
     */
    static IBLEPlatform::Ptr create(PlatformType type);

    /**
     * @brief Get the default platform type for this build
     */
    static PlatformType getDetectedPlatform();

    /**
     * @brief Parse a platform name ("simulated") as used in configuration
     */
    static PlatformType fromName(const std::string& name);
};

} // namespace BLEC
