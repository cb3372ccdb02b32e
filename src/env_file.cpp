#include "env_file.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace hwprov {

namespace {

namespace fs = std::filesystem;

bool is_allowed(const std::string& key, const std::vector<std::string>& allowed) {
    return std::find(allowed.begin(), allowed.end(), key) != allowed.end();
}

EnvLoadResult fail(std::string error) {
    EnvLoadResult r;
    r.error = std::move(error);
    return r;
}

ProfileParseResult fail_profile(std::string error) {
    ProfileParseResult r;
    r.error = std::move(error);
    return r;
}

const std::string* find_value(const std::map<std::string, std::string>& values, const char* key) {
    auto it = values.find(key);
    return it == values.end() ? nullptr : &it->second;
}

bool is_region_value(const std::string& s) {
    if (s.empty() || s.size() > 8) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isalnum(c) != 0; });
}

} // namespace

const std::vector<std::string>& profile_env_keys() {
    static const std::vector<std::string> keys = {
        "CPU_VENDOR", "GPU_TYPE", "PLATFORM", "OEM_FAMILY", "LAPTOP_BRAND", "COUNTRY", "FEATURES",
    };
    return keys;
}

bool is_env_key(const std::string& key) {
    if (key.empty() || !std::isupper((unsigned char)key[0])) return false;
    for (char c : key) {
        unsigned char uc = (unsigned char)c;
        if (!(std::isupper(uc) || std::isdigit(uc) || c == '_')) return false;
    }
    return true;
}

bool is_safe_env_value(const std::string& value) {
    for (char c : value) {
        unsigned char uc = (unsigned char)c;
        if (uc < 0x20 || uc == 0x7F) return false;
        switch (c) {
            case '$': case '`': case '(': case ')': case '|': case '&':
            case ';': case '<': case '>': case '"': case '\\':
                return false;
            default:
                break;
        }
    }
    return true;
}

EnvLoadResult parse_env_text(const std::string& text, const std::vector<std::string>& allowed_keys) {
    if (text.size() > kMaxEnvFileBytes) {
        return fail("profile file exceeds " + std::to_string(kMaxEnvFileBytes) + " bytes");
    }

    EnvLoadResult out;
    std::vector<std::string> seen;
    int lineno = 0;

    for (const std::string& line : split_lines(text)) {
        ++lineno;
        if (line.empty()) continue;

        const std::string where = "line " + std::to_string(lineno);

        // KEY="value", nothing before or after.
        auto eq = line.find('=');
        if (eq == std::string::npos) return fail(where + ": expected KEY=\"value\"");

        std::string key = line.substr(0, eq);
        if (!is_env_key(key)) return fail(where + ": malformed key");

        std::string rest = line.substr(eq + 1);
        if (rest.size() < 2 || rest.front() != '"' || rest.back() != '"') {
            return fail(where + ": value for " + key + " must be double-quoted");
        }
        std::string value = rest.substr(1, rest.size() - 2);
        if (!is_safe_env_value(value)) {
            return fail(where + ": value for " + key + " contains forbidden characters");
        }

        if (std::find(seen.begin(), seen.end(), key) != seen.end()) {
            return fail(where + ": duplicate key " + key);
        }
        seen.push_back(key);

        if (is_allowed(key, allowed_keys)) {
            out.values[key] = value;
        } else {
            out.ignored_keys.push_back(key);
        }
    }

    out.ok = true;
    return out;
}

EnvLoadResult load_env_file(const fs::path& path, const std::vector<std::string>& allowed_keys) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        return fail(path.string() + ": " + std::strerror(errno));
    }
    if (S_ISLNK(st.st_mode)) return fail(path.string() + ": refusing to follow a symlink");
    if (!S_ISREG(st.st_mode)) return fail(path.string() + ": not a regular file");
    if ((std::size_t)st.st_size > kMaxEnvFileBytes) {
        return fail(path.string() + ": file is " + std::to_string(st.st_size) +
                    " bytes, limit is " + std::to_string(kMaxEnvFileBytes));
    }

    std::ifstream f(path, std::ios::binary);
    if (!f) return fail(path.string() + ": cannot open");

    // Read one byte past the limit in case the file grew after lstat.
    std::string text(kMaxEnvFileBytes + 1, '\0');
    f.read(text.data(), (std::streamsize)text.size());
    text.resize((std::size_t)f.gcount());

    EnvLoadResult r = parse_env_text(text, allowed_keys);
    if (!r.ok) {
        r.error = path.string() + ": " + r.error;
        return r;
    }
    for (const std::string& key : r.ignored_keys) {
        spdlog::warn("{}: ignoring unrecognized key {}", path.string(), key);
    }
    return r;
}

ProfileParseResult profile_from_env(const std::map<std::string, std::string>& values) {
    ProfileParseResult out;
    HardwareProfile& p = out.profile;

    const std::string* cpu = find_value(values, "CPU_VENDOR");
    if (!cpu) return fail_profile("missing CPU_VENDOR");
    auto cpu_v = parse_cpu_vendor(*cpu);
    if (!cpu_v) return fail_profile("invalid CPU_VENDOR '" + *cpu + "'");
    p.cpu_vendor = *cpu_v;

    const std::string* gpu = find_value(values, "GPU_TYPE");
    if (!gpu) return fail_profile("missing GPU_TYPE");
    auto gpu_v = parse_gpu_config(*gpu);
    if (!gpu_v) return fail_profile("invalid GPU_TYPE '" + *gpu + "'");
    p.gpu_config = *gpu_v;

    const std::string* platform = find_value(values, "PLATFORM");
    if (!platform) return fail_profile("missing PLATFORM");
    auto platform_v = parse_platform(*platform);
    if (!platform_v) return fail_profile("invalid PLATFORM '" + *platform + "'");
    p.platform = *platform_v;

    const std::string* oem = find_value(values, "OEM_FAMILY");
    if (!oem) oem = find_value(values, "LAPTOP_BRAND");
    if (!oem) return fail_profile("missing OEM_FAMILY");
    auto oem_v = parse_oem_family(*oem);
    if (!oem_v) return fail_profile("invalid OEM_FAMILY '" + *oem + "'");
    p.oem_family = *oem_v;

    if (const std::string* country = find_value(values, "COUNTRY")) {
        if (!is_region_value(*country)) return fail_profile("invalid COUNTRY '" + *country + "'");
        p.mirror_region = *country;
    }

    if (const std::string* features = find_value(values, "FEATURES")) {
        auto flags = parse_features(*features);
        if (!flags) return fail_profile("invalid FEATURES '" + *features + "'");
        p.features = *flags;
    }

    out.ok = true;
    return out;
}

ProfileParseResult load_profile_env(const fs::path& path) {
    EnvLoadResult env = load_env_file(path);
    if (!env.ok) return fail_profile(env.error);

    ProfileParseResult r = profile_from_env(env.values);
    if (!r.ok) r.error = path.string() + ": " + r.error;
    return r;
}

std::string format_profile_env(const HardwareProfile& profile) {
    std::string out;
    auto line = [&](const char* key, const std::string& value) {
        out += key;
        out += "=\"";
        out += value;
        out += "\"\n";
    };
    line("CPU_VENDOR", cpu_vendor_name(profile.cpu_vendor));
    line("GPU_TYPE", gpu_config_name(profile.gpu_config));
    line("PLATFORM", platform_name(profile.platform));
    line("OEM_FAMILY", oem_family_name(profile.oem_family));
    line("COUNTRY", profile.mirror_region);
    line("FEATURES", format_features(profile.features));
    return out;
}

bool write_profile_env(const fs::path& path, const HardwareProfile& profile, std::string& error) {
    const std::string text = format_profile_env(profile);

    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    fs::path tmp = path;
    tmp += ".tmp." + std::to_string(::getpid());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW, 0600);
    if (fd < 0) {
        error = tmp.string() + ": " + std::strerror(errno);
        return false;
    }

    const char* data = text.data();
    std::size_t left = text.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = tmp.string() + ": " + std::strerror(errno);
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }
        data += n;
        left -= (std::size_t)n;
    }
    if (::close(fd) != 0) {
        error = tmp.string() + ": " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return false;
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        error = path.string() + ": " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}

} // namespace hwprov
