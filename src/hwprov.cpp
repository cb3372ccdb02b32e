#include "hwprov.hpp"

#include <nlohmann/json.hpp>

namespace hwprov {

HardwareProfile detect_profile(const std::string& fallback_region) {
    return classify(collect_signals(), fallback_region);
}

std::string profile_summary(const HardwareProfile& p) {
    std::string out = std::string("cpu=") + cpu_vendor_name(p.cpu_vendor) +
                      " gpu=" + gpu_config_name(p.gpu_config) +
                      " platform=" + platform_name(p.platform) +
                      " oem=" + oem_family_name(p.oem_family) +
                      " region=" + p.mirror_region;
    if (!p.features.empty()) out += " features=" + format_features(p.features);
    return out;
}

std::string format_profile_json(const HardwareProfile& p, const std::vector<std::string>& reasons) {
    nlohmann::json j;
    j["cpu_vendor"] = cpu_vendor_name(p.cpu_vendor);
    j["gpu_type"] = gpu_config_name(p.gpu_config);
    j["platform"] = platform_name(p.platform);
    j["oem_family"] = oem_family_name(p.oem_family);
    j["country"] = p.mirror_region;

    nlohmann::json features = nlohmann::json::array();
    for (Feature f : all_features()) {
        if (p.features.has(f)) features.push_back(feature_name(f));
    }
    j["features"] = features;
    if (!reasons.empty()) j["reasons"] = reasons;
    return j.dump(4);
}

} // namespace hwprov
