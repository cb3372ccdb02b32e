#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hwprov {

enum class CpuVendor {
    Intel,
    Amd,
    Unknown
};

enum class GpuConfig {
    Intel,
    Amd,
    Nvidia,
    HybridIntelNvidia,   // Optimus-style: Intel iGPU + NVIDIA dGPU
    HybridIntelAmd,      // Intel iGPU + AMD dGPU
    Unknown
};

enum class Platform {
    Laptop,
    Desktop
};

enum class OemFamily {
    ThinkPad,
    Dell,
    Hp,
    Asus,
    Msi,
    Acer,
    Generic
};

enum class Feature {
    FanControl,        // thinkpad_acpi fan interface
    GpuSwitching,      // integrated + discrete controller present
    Thunderbolt,
    Touchscreen,
    Fingerprint
};

inline constexpr const char* kDefaultRegion = "US";

struct FeatureFlags {
    bool fan_control = false;
    bool gpu_switching = false;
    bool thunderbolt = false;
    bool touchscreen = false;
    bool fingerprint = false;

    bool has(Feature f) const;
    void set(Feature f, bool on = true);
    bool empty() const;

    bool operator==(const FeatureFlags&) const = default;
};

struct HardwareProfile {
    CpuVendor cpu_vendor = CpuVendor::Unknown;
    GpuConfig gpu_config = GpuConfig::Unknown;
    Platform platform = Platform::Desktop;
    OemFamily oem_family = OemFamily::Generic;
    std::string mirror_region = kDefaultRegion;
    FeatureFlags features;

    bool operator==(const HardwareProfile&) const = default;
};

const std::vector<Feature>& all_features();

// Persisted names. These are the exact values written to the profile file.
const char* cpu_vendor_name(CpuVendor v);
const char* gpu_config_name(GpuConfig g);
const char* platform_name(Platform p);
const char* oem_family_name(OemFamily o);
const char* feature_name(Feature f);

std::optional<CpuVendor> parse_cpu_vendor(const std::string& s);
std::optional<GpuConfig> parse_gpu_config(const std::string& s);
std::optional<Platform> parse_platform(const std::string& s);
std::optional<OemFamily> parse_oem_family(const std::string& s);
std::optional<Feature> parse_feature(const std::string& s);

// "fan_control,thunderbolt"; empty string for no features.
std::string format_features(const FeatureFlags& flags);
std::optional<FeatureFlags> parse_features(const std::string& s);

// Discrete half of a GPU configuration (Nvidia for HybridIntelNvidia, ...).
GpuConfig discrete_component(GpuConfig g);
bool is_hybrid(GpuConfig g);

} // namespace hwprov
