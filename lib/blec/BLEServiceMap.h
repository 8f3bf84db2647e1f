/**
 * @file BLEServiceMap.h
 * @brief Discovered GATT services and characteristics of a connection
 *
 * Built once per successful connection during service discovery and never
 * modified afterwards for that connection generation. Consumers receive it
 * through a shared pointer to const.
 */
#pragma once

#include "BLETypes.h"

#include <map>
#include <string>
#include <vector>

namespace BLEC {

/**
 * @brief Characteristic descriptor
 */
struct CharacteristicInfo {
    std::string uuid;                   // Normalized 128-bit UUID
    uint16_t handle = 0;                // Platform-specific value handle
    uint8_t properties = 0;             // Property:: bit mask

    bool canRead() const { return (properties & Property::READ) != 0; }
    bool canWrite() const { return (properties & Property::WRITE) != 0; }
    bool canWriteNoResponse() const { return (properties & Property::WRITE_NO_RESPONSE) != 0; }
    bool canNotify() const { return (properties & Property::NOTIFY) != 0; }
    bool canIndicate() const { return (properties & Property::INDICATE) != 0; }

    /**
     * @brief Check whether the characteristic supports an operation type
     */
    bool supports(OperationType type) const;
};

/**
 * @brief Mapping from service UUID to its ordered characteristic list
 */
class ServiceMap {
public:
    using Characteristics = std::vector<CharacteristicInfo>;

    ServiceMap() = default;

    /**
     * @brief Add a service (discovery builder use only)
     * @return false if the UUID is malformed or already present
     */
    bool addService(const std::string& service_uuid);

    /**
     * @brief Append a characteristic to a service (discovery builder use only)
     *
     * Creates the service if needed. Characteristic order is preserved.
     * @return false if either UUID is malformed or the characteristic is
     *         already present in that service
     */
    bool addCharacteristic(const std::string& service_uuid, const CharacteristicInfo& characteristic);

    /**
     * @brief Look up a characteristic by UUID across all services
     * @return Pointer to the first match in service order, or nullptr
     */
    const CharacteristicInfo* findCharacteristic(const std::string& characteristic_uuid) const;

    /**
     * @brief Get characteristics for a service
     * @return Pointer to the list, or nullptr if the service is unknown
     */
    const Characteristics* characteristics(const std::string& service_uuid) const;

    bool hasService(const std::string& service_uuid) const;

    std::vector<std::string> serviceUUIDs() const;

    size_t serviceCount() const { return _services.size(); }
    size_t characteristicCount() const;
    bool empty() const { return _services.empty(); }

    std::string toString() const;

private:
    std::map<std::string, Characteristics> _services;
};

using ServiceMapPtr = std::shared_ptr<const ServiceMap>;

} // namespace BLEC
