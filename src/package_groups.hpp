#pragma once

#include "profile.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hwprov {

enum class KernelChoice {
    Performance,   // linux-zen
    Stable         // linux
};

const char* kernel_choice_name(KernelChoice k);
std::optional<KernelChoice> parse_kernel_choice(const std::string& s);

struct PackageGroup {
    std::string key;                    // "base", "cpu:intel", "gpu:nvidia", ...
    std::vector<std::string> packages;  // file order, kept for reproducible logs
};

// Keyed package lists. The store is an external collaborator; a missing key is
// reported by returning nullopt.
class PackageGroupStore {
public:
    virtual ~PackageGroupStore() = default;
    virtual std::optional<PackageGroup> load(const std::string& key) const = 0;
};

// One flat file per group: "<dir>/cpu-intel.txt" for key "cpu:intel".
// One package per line; blank lines and '#' comments are ignored.
class FlatFilePackageGroupStore : public PackageGroupStore {
public:
    explicit FlatFilePackageGroupStore(std::filesystem::path dir);

    std::optional<PackageGroup> load(const std::string& key) const override;
    std::filesystem::path path_for(const std::string& key) const;

private:
    std::filesystem::path dir_;
};

std::vector<std::string> parse_package_list(const std::string& text);

// Ordered group keys for a profile: base, kernel, cpu, gpu, platform, oem.
// Deterministic and additive; no group is ever removed once added.
std::vector<std::string> resolve(const HardwareProfile& profile, KernelChoice kernel);

struct ResolvedPackages {
    std::vector<PackageGroup> groups;   // in key order, missing keys skipped
    std::vector<std::string> warnings;  // one per key without a backing list
    size_t package_count() const;
};

ResolvedPackages load_groups(const std::vector<std::string>& keys, const PackageGroupStore& store);

} // namespace hwprov
