#pragma once

#include "package_groups.hpp"
#include "profile.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace hwprov {

// Hardware predicate attached to a system file. Axes are ANDed, values within
// one axis are ORed; an empty predicate matches every machine.
struct HardwarePredicate {
    std::vector<CpuVendor> cpu;
    std::vector<GpuConfig> gpu;          // exact configuration
    std::vector<GpuConfig> gpu_vendor;   // Intel/Amd/Nvidia present, integrated or discrete
    std::vector<Platform> platform;
    std::vector<OemFamily> oem;
    std::vector<Feature> features;       // every listed feature must be set

    bool matches(const HardwareProfile& profile) const;
    bool universal() const;
};

// True when the GPU configuration includes a controller from `vendor`.
bool gpu_has_vendor(GpuConfig config, GpuConfig vendor);

struct ConfigFileEntry {
    std::filesystem::path source;        // relative to the repository root
    std::filesystem::path destination;
    bool executable = false;
};

struct SystemFileEntry {
    std::filesystem::path source;
    std::filesystem::path destination;
    bool kernel_module = false;          // modprobe.d fragment, needs an initramfs rebuild
    HardwarePredicate when;
};

struct KernelConfig {
    std::string performance_package = "linux-zen";
    std::string stable_package = "linux";
    KernelChoice default_choice = KernelChoice::Performance;
};

struct MirrorConfig {
    bool enabled = true;
    std::string mirrorlist = "/etc/pacman.d/mirrorlist";
    int max_age_hours = 12;
};

struct AurConfig {
    std::string helper = "paru";
    std::string group = "aur";
    bool bootstrap = true;               // build the helper from the AUR when it is missing
    std::string repository;              // git URL; empty means https://aur.archlinux.org/<helper>.git

    std::string repository_url() const;
};

struct ServiceConfig {
    std::vector<std::string> system;
    std::vector<std::string> user;
};

struct ReloadConfig {
    std::string process;                 // pgrep -x target; empty disables the step
    std::vector<std::string> command;
};

struct VerifyConfig {
    std::vector<std::filesystem::path> files;
    std::vector<std::string> commands;
    std::vector<std::string> services;
};

struct ProvisionConfig {
    std::filesystem::path repo_dir;
    std::filesystem::path package_dir;
    std::filesystem::path state_file = "/tmp/hardware-detection.env";
    std::filesystem::path log_file;
    std::string fallback_region = kDefaultRegion;

    // Installed before detection; signal collection shells out to these.
    std::vector<std::string> prerequisites = {"dmidecode", "pciutils", "usbutils", "reflector"};

    KernelConfig kernel;
    MirrorConfig mirrors;
    AurConfig aur;

    std::vector<std::filesystem::path> executable_dirs;
    std::vector<std::filesystem::path> executables;
    std::vector<std::filesystem::path> directories;
    std::vector<ConfigFileEntry> config_files;
    std::vector<SystemFileEntry> system_files;

    ServiceConfig services;
    ReloadConfig reload;
    VerifyConfig verify;
};

struct ConfigLoadResult {
    bool ok = false;
    ProvisionConfig config;
    std::string error;
};

// "~" and "~/x" expand against `home`; other relative paths resolve against `base`.
std::filesystem::path expand_path(const std::string& raw,
                                  const std::filesystem::path& base,
                                  const std::string& home);

// `base_dir` is the default repository root, normally the manifest's directory.
ConfigLoadResult parse_provision_config(const std::string& yaml_text,
                                        const std::filesystem::path& base_dir,
                                        const std::string& home);

ConfigLoadResult load_provision_config(const std::filesystem::path& path);

// Built-in defaults when `path` does not exist; a manifest that exists must load.
ConfigLoadResult load_provision_config_or_defaults(const std::filesystem::path& path);

} // namespace hwprov
