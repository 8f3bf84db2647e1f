/**
 * @file BLEPlatform.cpp
 * @brief BLE Platform factory implementation
 */

#include "BLEPlatform.h"
#include "Log.h"

#include "platforms/SimulatedPlatform.h"

namespace BLEC {

IBLEPlatform::Ptr BLEPlatformFactory::create() {
    return create(getDetectedPlatform());
}

IBLEPlatform::Ptr BLEPlatformFactory::create(PlatformType type) {
    switch (type) {
        case PlatformType::SIMULATED:
            INFO("BLEPlatformFactory: Creating simulated platform");
            return std::make_shared<SimulatedPlatform>();

        default:
            ERROR("BLEPlatformFactory: No platform available for type " +
                  std::to_string(static_cast<int>(type)));
            return nullptr;
    }
}

PlatformType BLEPlatformFactory::getDetectedPlatform() {
#if defined(BLEC_PLATFORM_SIMULATED)
    return PlatformType::SIMULATED;
#else
    return PlatformType::NONE;
#endif
}

PlatformType BLEPlatformFactory::fromName(const std::string& name) {
    if (name == "simulated" || name == "sim") {
        return PlatformType::SIMULATED;
    }
    return PlatformType::NONE;
}

} // namespace BLEC
