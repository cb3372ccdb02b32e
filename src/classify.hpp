#pragma once

#include "profile.hpp"
#include "signals.hpp"

#include <string>
#include <vector>

namespace hwprov {

struct ClassifyResult {
    HardwareProfile profile;
    std::vector<std::string> reasons; // one line per axis, for logs/UI
};

// Pure: identical signals always yield an identical profile.
HardwareProfile classify(const RawSignals& signals, const std::string& fallback_region = kDefaultRegion);
ClassifyResult classify_with_reasons(const RawSignals& signals,
                                     const std::string& fallback_region = kDefaultRegion);

CpuVendor classify_cpu(const std::string& vendor_string);
GpuConfig classify_gpu(const std::vector<std::string>& display_controllers);
Platform classify_platform(const std::string& chassis_type, bool has_battery);
OemFamily classify_oem(const std::string& manufacturer,
                       const std::string& product_name,
                       const std::string& product_version = {});
std::string classify_region(const std::string& locale, const std::string& fallback_region = kDefaultRegion);
FeatureFlags classify_features(const RawSignals& signals);

} // namespace hwprov
