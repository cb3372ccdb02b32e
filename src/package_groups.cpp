#include "package_groups.hpp"

#include "text_util.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace hwprov {

const char* kernel_choice_name(KernelChoice k) {
    switch (k) {
        case KernelChoice::Performance: return "performance";
        case KernelChoice::Stable: return "stable";
    }
    return "performance";
}

std::optional<KernelChoice> parse_kernel_choice(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "performance" || v == "zen") return KernelChoice::Performance;
    if (v == "stable" || v == "linux") return KernelChoice::Stable;
    return std::nullopt;
}

FlatFilePackageGroupStore::FlatFilePackageGroupStore(std::filesystem::path dir)
    : dir_(std::move(dir)) {}

std::filesystem::path FlatFilePackageGroupStore::path_for(const std::string& key) const {
    std::string name = key;
    for (char& c : name) {
        if (c == ':') c = '-';
    }
    return dir_ / (name + ".txt");
}

std::optional<PackageGroup> FlatFilePackageGroupStore::load(const std::string& key) const {
    std::ifstream f(path_for(key));
    if (!f) return std::nullopt;
    std::ostringstream ss;
    ss << f.rdbuf();

    PackageGroup group;
    group.key = key;
    group.packages = parse_package_list(ss.str());
    return group;
}

std::vector<std::string> parse_package_list(const std::string& text) {
    std::vector<std::string> out;
    for (const std::string& raw : split_lines(text)) {
        std::string line = raw;
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        line = trim(line);
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

std::vector<std::string> resolve(const HardwareProfile& profile, KernelChoice kernel) {
    std::vector<std::string> keys;

    keys.push_back("base");
    keys.push_back(std::string("kernel:") + kernel_choice_name(kernel));

    // No generic microcode group exists.
    if (profile.cpu_vendor != CpuVendor::Unknown) {
        keys.push_back(std::string("cpu:") + cpu_vendor_name(profile.cpu_vendor));
    }

    // Hybrid setups get the discrete vendor's drivers.
    GpuConfig gpu = discrete_component(profile.gpu_config);
    if (gpu != GpuConfig::Unknown) {
        keys.push_back(std::string("gpu:") + gpu_config_name(gpu));
    }

    if (profile.platform == Platform::Laptop) {
        keys.push_back("platform:laptop");
    }

    if (profile.oem_family != OemFamily::Generic) {
        keys.push_back(std::string("oem:") + oem_family_name(profile.oem_family));
    }

    return keys;
}

size_t ResolvedPackages::package_count() const {
    size_t n = 0;
    for (const auto& g : groups) n += g.packages.size();
    return n;
}

ResolvedPackages load_groups(const std::vector<std::string>& keys, const PackageGroupStore& store) {
    ResolvedPackages out;
    for (const std::string& key : keys) {
        auto group = store.load(key);
        if (!group) {
            spdlog::warn("no package list for group '{}', skipping it", key);
            out.warnings.push_back("no package list for group '" + key + "'");
            continue;
        }
        spdlog::debug("group '{}': {} package(s)", key, group->packages.size());
        out.groups.push_back(std::move(*group));
    }
    return out;
}

} // namespace hwprov
