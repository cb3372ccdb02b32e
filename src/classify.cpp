#include "classify.hpp"

#include "text_util.hpp"

#include <cctype>

namespace hwprov {

namespace {

struct GpuVendors {
    bool intel = false;
    bool amd = false;
    bool nvidia = false;
};

// Word tokens, not substrings: "amdgpu" or "Corporation" must not read as AMD/ATI.
GpuVendors scan_gpu_vendors(const std::vector<std::string>& controllers) {
    GpuVendors v;
    for (const std::string& line : controllers) {
        if (has_any_word(line, {"nvidia", "geforce", "quadro"})) v.nvidia = true;
        if (has_any_word(line, {"amd", "ati", "radeon"})) v.amd = true;
        if (has_any_word(line, {"intel"})) v.intel = true;
    }
    return v;
}

enum class ChassisClass {
    Laptop,
    Desktop,
    Unrecognized
};

ChassisClass lookup_chassis(const std::string& chassis_type) {
    static const char* const laptop_like[] = {
        "notebook", "laptop", "portable", "hand held", "sub notebook",
        "convertible", "detachable", "tablet",
    };
    static const char* const desktop_like[] = {
        "desktop", "low profile desktop", "pizza box", "mini tower", "tower",
        "space-saving", "lunch box", "all in one", "mini pc", "stick pc",
    };

    const std::string c = to_lower(trim(chassis_type));
    if (c.empty()) return ChassisClass::Unrecognized;
    for (const char* name : laptop_like) {
        if (c == name) return ChassisClass::Laptop;
    }
    for (const char* name : desktop_like) {
        if (c == name) return ChassisClass::Desktop;
    }
    return ChassisClass::Unrecognized;
}

bool is_region_code(const std::string& s) {
    if (s.size() != 2) return false;
    for (char c : s) {
        if (!std::isalpha((unsigned char)c)) return false;
    }
    return true;
}

} // namespace

CpuVendor classify_cpu(const std::string& vendor_string) {
    if (vendor_string == "GenuineIntel") return CpuVendor::Intel;
    if (vendor_string == "AuthenticAMD") return CpuVendor::Amd;
    return CpuVendor::Unknown;
}

GpuConfig classify_gpu(const std::vector<std::string>& display_controllers) {
    GpuVendors v = scan_gpu_vendors(display_controllers);

    // Hybrid wins over single-vendor; NVIDIA is preferred when both discrete vendors show up.
    if (v.intel && v.nvidia) return GpuConfig::HybridIntelNvidia;
    if (v.intel && v.amd) return GpuConfig::HybridIntelAmd;
    if (v.nvidia) return GpuConfig::Nvidia;
    if (v.amd) return GpuConfig::Amd;
    if (v.intel) return GpuConfig::Intel;
    return GpuConfig::Unknown;
}

Platform classify_platform(const std::string& chassis_type, bool has_battery) {
    switch (lookup_chassis(chassis_type)) {
        case ChassisClass::Laptop: return Platform::Laptop;
        case ChassisClass::Desktop: return Platform::Desktop;
        case ChassisClass::Unrecognized: break;
    }
    return has_battery ? Platform::Laptop : Platform::Desktop;
}

OemFamily classify_oem(const std::string& manufacturer,
                       const std::string& product_name,
                       const std::string& product_version) {
    const std::string vendor = to_lower(manufacturer);

    if (vendor.find("lenovo") != std::string::npos) {
        const std::string product = to_lower(product_name) + " " + to_lower(product_version);
        return product.find("thinkpad") != std::string::npos ? OemFamily::ThinkPad : OemFamily::Generic;
    }
    if (vendor.find("dell") != std::string::npos) return OemFamily::Dell;
    if (vendor.find("asus") != std::string::npos) return OemFamily::Asus;
    if (contains_any(vendor, {"micro-star", "msi"})) return OemFamily::Msi;
    if (vendor.find("acer") != std::string::npos) return OemFamily::Acer;
    if (contains_any(vendor, {"hewlett", "hp"})) return OemFamily::Hp;
    return OemFamily::Generic;
}

std::string classify_region(const std::string& locale, const std::string& fallback_region) {
    // ll_CC[.encoding][@modifier]
    auto us = locale.find('_');
    if (us == std::string::npos) return fallback_region;
    std::string territory = locale.substr(us + 1);
    auto end = territory.find_first_of(".@");
    if (end != std::string::npos) territory = territory.substr(0, end);
    if (!is_region_code(territory)) return fallback_region;
    return to_upper(territory);
}

FeatureFlags classify_features(const RawSignals& signals) {
    FeatureFlags flags;

    flags.fan_control = signals.fan_control_interface;

    GpuVendors v = scan_gpu_vendors(signals.display_controllers);
    flags.gpu_switching = v.intel && (v.nvidia || v.amd);

    for (const std::string& line : signals.pci_devices) {
        if (has_any_word(line, {"thunderbolt"})) flags.thunderbolt = true;
    }
    for (const std::string& name : signals.input_devices) {
        if (has_any_word(name, {"touchscreen", "touch"})) flags.touchscreen = true;
    }
    for (const std::string& line : signals.usb_devices) {
        if (has_any_word(line, {"fingerprint"})) flags.fingerprint = true;
    }
    return flags;
}

ClassifyResult classify_with_reasons(const RawSignals& signals, const std::string& fallback_region) {
    ClassifyResult out;
    HardwareProfile& p = out.profile;

    p.cpu_vendor = classify_cpu(signals.cpu_vendor_string);
    if (p.cpu_vendor == CpuVendor::Unknown) {
        out.reasons.push_back(signals.cpu_vendor_string.empty()
                                  ? "cpu: vendor string unavailable"
                                  : "cpu: unrecognized vendor string '" + signals.cpu_vendor_string + "'");
    } else {
        out.reasons.push_back("cpu: vendor string '" + signals.cpu_vendor_string + "'");
    }

    p.gpu_config = classify_gpu(signals.display_controllers);
    if (signals.display_controllers.empty()) {
        out.reasons.push_back("gpu: no display controllers listed");
    } else {
        out.reasons.push_back("gpu: " + std::to_string(signals.display_controllers.size()) +
                              " display controller(s)" +
                              (is_hybrid(p.gpu_config) ? ", integrated + discrete" : ""));
    }

    p.platform = classify_platform(signals.chassis_type, signals.has_battery);
    if (lookup_chassis(signals.chassis_type) != ChassisClass::Unrecognized) {
        out.reasons.push_back("platform: chassis type '" + signals.chassis_type + "'");
    } else {
        out.reasons.push_back(std::string("platform: chassis type inconclusive, battery ") +
                              (signals.has_battery ? "present" : "absent"));
    }

    p.oem_family = classify_oem(signals.system_manufacturer,
                                signals.system_product_name,
                                signals.system_product_version);
    out.reasons.push_back("oem: manufacturer '" + signals.system_manufacturer + "'");

    p.mirror_region = classify_region(signals.locale, fallback_region);
    p.features = classify_features(signals);

    return out;
}

HardwareProfile classify(const RawSignals& signals, const std::string& fallback_region) {
    return classify_with_reasons(signals, fallback_region).profile;
}

} // namespace hwprov
