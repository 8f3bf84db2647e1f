/**
 * @file BLEServiceMap.cpp
 * @brief Discovered GATT services and characteristics implementation
 */

#include "BLEServiceMap.h"

namespace BLEC {

bool CharacteristicInfo::supports(OperationType type) const {
    switch (type) {
        case OperationType::READ:
            return canRead();
        case OperationType::WRITE:
            return canWrite();
        case OperationType::WRITE_NO_RESPONSE:
            return canWriteNoResponse();
        case OperationType::NOTIFY_ENABLE:
        case OperationType::NOTIFY_DISABLE:
            return canNotify() || canIndicate();
        default:
            return false;
    }
}

bool ServiceMap::addService(const std::string& service_uuid) {
    std::string uuid = normalizeUUID(service_uuid);
    if (uuid.empty() || _services.count(uuid) > 0) {
        return false;
    }
    _services[uuid] = Characteristics();
    return true;
}

bool ServiceMap::addCharacteristic(const std::string& service_uuid,
                                   const CharacteristicInfo& characteristic) {
    std::string service = normalizeUUID(service_uuid);
    std::string uuid = normalizeUUID(characteristic.uuid);
    if (service.empty() || uuid.empty()) {
        return false;
    }

    Characteristics& list = _services[service];
    for (const CharacteristicInfo& existing : list) {
        if (existing.uuid == uuid) {
            return false;
        }
    }

    CharacteristicInfo info = characteristic;
    info.uuid = uuid;
    list.push_back(info);
    return true;
}

const CharacteristicInfo* ServiceMap::findCharacteristic(const std::string& characteristic_uuid) const {
    std::string uuid = normalizeUUID(characteristic_uuid);
    if (uuid.empty()) {
        return nullptr;
    }

    for (const auto& entry : _services) {
        for (const CharacteristicInfo& info : entry.second) {
            if (info.uuid == uuid) {
                return &info;
            }
        }
    }
    return nullptr;
}

const ServiceMap::Characteristics* ServiceMap::characteristics(const std::string& service_uuid) const {
    auto it = _services.find(normalizeUUID(service_uuid));
    if (it == _services.end()) {
        return nullptr;
    }
    return &it->second;
}

bool ServiceMap::hasService(const std::string& service_uuid) const {
    return _services.count(normalizeUUID(service_uuid)) > 0;
}

std::vector<std::string> ServiceMap::serviceUUIDs() const {
    std::vector<std::string> result;
    result.reserve(_services.size());
    for (const auto& entry : _services) {
        result.push_back(entry.first);
    }
    return result;
}

size_t ServiceMap::characteristicCount() const {
    size_t count = 0;
    for (const auto& entry : _services) {
        count += entry.second.size();
    }
    return count;
}

std::string ServiceMap::toString() const {
    std::string out = "ServiceMap[" + std::to_string(_services.size()) + " services, " +
                      std::to_string(characteristicCount()) + " characteristics]";
    for (const auto& entry : _services) {
        out += "\n  " + entry.first;
        for (const CharacteristicInfo& info : entry.second) {
            char props[8];
            snprintf(props, sizeof(props), "0x%02X", info.properties);
            out += "\n    " + info.uuid + " props=" + props;
        }
    }
    return out;
}

} // namespace BLEC
