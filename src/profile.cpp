#include "profile.hpp"

#include "text_util.hpp"

namespace hwprov {

bool FeatureFlags::has(Feature f) const {
    switch (f) {
        case Feature::FanControl: return fan_control;
        case Feature::GpuSwitching: return gpu_switching;
        case Feature::Thunderbolt: return thunderbolt;
        case Feature::Touchscreen: return touchscreen;
        case Feature::Fingerprint: return fingerprint;
    }
    return false;
}

void FeatureFlags::set(Feature f, bool on) {
    switch (f) {
        case Feature::FanControl: fan_control = on; break;
        case Feature::GpuSwitching: gpu_switching = on; break;
        case Feature::Thunderbolt: thunderbolt = on; break;
        case Feature::Touchscreen: touchscreen = on; break;
        case Feature::Fingerprint: fingerprint = on; break;
    }
}

bool FeatureFlags::empty() const {
    return !fan_control && !gpu_switching && !thunderbolt && !touchscreen && !fingerprint;
}

const std::vector<Feature>& all_features() {
    static const std::vector<Feature> features = {
        Feature::FanControl,
        Feature::GpuSwitching,
        Feature::Thunderbolt,
        Feature::Touchscreen,
        Feature::Fingerprint,
    };
    return features;
}

const char* cpu_vendor_name(CpuVendor v) {
    switch (v) {
        case CpuVendor::Intel: return "intel";
        case CpuVendor::Amd: return "amd";
        case CpuVendor::Unknown: return "unknown";
    }
    return "unknown";
}

const char* gpu_config_name(GpuConfig g) {
    switch (g) {
        case GpuConfig::Intel: return "intel";
        case GpuConfig::Amd: return "amd";
        case GpuConfig::Nvidia: return "nvidia";
        case GpuConfig::HybridIntelNvidia: return "hybrid-nvidia";
        case GpuConfig::HybridIntelAmd: return "hybrid-amd";
        case GpuConfig::Unknown: return "unknown";
    }
    return "unknown";
}

const char* platform_name(Platform p) {
    switch (p) {
        case Platform::Laptop: return "laptop";
        case Platform::Desktop: return "desktop";
    }
    return "desktop";
}

const char* oem_family_name(OemFamily o) {
    switch (o) {
        case OemFamily::ThinkPad: return "thinkpad";
        case OemFamily::Dell: return "dell";
        case OemFamily::Hp: return "hp";
        case OemFamily::Asus: return "asus";
        case OemFamily::Msi: return "msi";
        case OemFamily::Acer: return "acer";
        case OemFamily::Generic: return "generic";
    }
    return "generic";
}

const char* feature_name(Feature f) {
    switch (f) {
        case Feature::FanControl: return "fan_control";
        case Feature::GpuSwitching: return "gpu_switching";
        case Feature::Thunderbolt: return "thunderbolt";
        case Feature::Touchscreen: return "touchscreen";
        case Feature::Fingerprint: return "fingerprint";
    }
    return "";
}

std::optional<CpuVendor> parse_cpu_vendor(const std::string& s) {
    for (CpuVendor v : {CpuVendor::Intel, CpuVendor::Amd, CpuVendor::Unknown}) {
        if (s == cpu_vendor_name(v)) return v;
    }
    return std::nullopt;
}

std::optional<GpuConfig> parse_gpu_config(const std::string& s) {
    for (GpuConfig g : {GpuConfig::Intel, GpuConfig::Amd, GpuConfig::Nvidia,
                        GpuConfig::HybridIntelNvidia, GpuConfig::HybridIntelAmd,
                        GpuConfig::Unknown}) {
        if (s == gpu_config_name(g)) return g;
    }
    return std::nullopt;
}

std::optional<Platform> parse_platform(const std::string& s) {
    if (s == "laptop") return Platform::Laptop;
    if (s == "desktop") return Platform::Desktop;
    return std::nullopt;
}

std::optional<OemFamily> parse_oem_family(const std::string& s) {
    for (OemFamily o : {OemFamily::ThinkPad, OemFamily::Dell, OemFamily::Hp, OemFamily::Asus,
                        OemFamily::Msi, OemFamily::Acer, OemFamily::Generic}) {
        if (s == oem_family_name(o)) return o;
    }
    return std::nullopt;
}

std::optional<Feature> parse_feature(const std::string& s) {
    for (Feature f : all_features()) {
        if (s == feature_name(f)) return f;
    }
    return std::nullopt;
}

std::string format_features(const FeatureFlags& flags) {
    std::string out;
    for (Feature f : all_features()) {
        if (!flags.has(f)) continue;
        if (!out.empty()) out += ',';
        out += feature_name(f);
    }
    return out;
}

std::optional<FeatureFlags> parse_features(const std::string& s) {
    FeatureFlags flags;
    for (const std::string& item : split(s, ',')) {
        std::string name = trim(item);
        if (name.empty()) continue;
        auto f = parse_feature(name);
        if (!f) return std::nullopt;
        flags.set(*f);
    }
    return flags;
}

GpuConfig discrete_component(GpuConfig g) {
    switch (g) {
        case GpuConfig::HybridIntelNvidia: return GpuConfig::Nvidia;
        case GpuConfig::HybridIntelAmd: return GpuConfig::Amd;
        default: return g;
    }
}

bool is_hybrid(GpuConfig g) {
    return g == GpuConfig::HybridIntelNvidia || g == GpuConfig::HybridIntelAmd;
}

} // namespace hwprov
