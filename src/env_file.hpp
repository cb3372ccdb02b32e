#pragma once

#include "profile.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace hwprov {

// The persisted profile is a handful of short lines; anything bigger is corrupt.
inline constexpr std::size_t kMaxEnvFileBytes = 4096;

// Keys that may be bound from a profile file. LAPTOP_BRAND is the legacy
// spelling of OEM_FAMILY.
const std::vector<std::string>& profile_env_keys();

struct EnvLoadResult {
    bool ok = false;
    std::map<std::string, std::string> values;   // allow-listed keys only
    std::vector<std::string> ignored_keys;       // well-formed but not allow-listed
    std::string error;
};

// All-or-nothing: one malformed line or forbidden character fails the whole load.
EnvLoadResult parse_env_text(const std::string& text, const std::vector<std::string>& allowed_keys);
EnvLoadResult load_env_file(const std::filesystem::path& path,
                            const std::vector<std::string>& allowed_keys = profile_env_keys());

bool is_env_key(const std::string& key);
bool is_safe_env_value(const std::string& value);

struct ProfileParseResult {
    bool ok = false;
    HardwareProfile profile;
    std::string error;
};

ProfileParseResult profile_from_env(const std::map<std::string, std::string>& values);
ProfileParseResult load_profile_env(const std::filesystem::path& path);

std::string format_profile_env(const HardwareProfile& profile);

// Writes to a sibling temp file with mode 0600 and renames it into place.
bool write_profile_env(const std::filesystem::path& path, const HardwareProfile& profile, std::string& error);

} // namespace hwprov
