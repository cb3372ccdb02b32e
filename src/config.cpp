#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace hwprov {

namespace {

namespace fs = std::filesystem;

// ---------- tiny helpers ----------

template<typename T>
T get_or(const YAML::Node& obj, const char* key, T def) {
    auto n = obj[key];
    return n ? n.as<T>() : def;
}

// A scalar is accepted where a one-element list is meant.
std::vector<std::string> string_list(const YAML::Node& node) {
    if (!node || node.IsNull()) return {};
    if (node.IsScalar()) return {node.as<std::string>()};
    return node.as<std::vector<std::string>>();
}

template<typename T, typename Parser>
std::vector<T> enum_list(const YAML::Node& node, const char* axis, Parser parse) {
    std::vector<T> out;
    for (const std::string& s : string_list(node)) {
        std::optional<T> v = parse(s);
        if (!v) throw std::runtime_error(std::string("unknown ") + axis + " value '" + s + "'");
        out.push_back(*v);
    }
    return out;
}

std::optional<GpuConfig> parse_gpu_vendor(const std::string& s) {
    if (s == "intel") return GpuConfig::Intel;
    if (s == "amd") return GpuConfig::Amd;
    if (s == "nvidia") return GpuConfig::Nvidia;
    return std::nullopt;
}

template<typename T>
bool listed(const std::vector<T>& values, T v) {
    return values.empty() || std::find(values.begin(), values.end(), v) != values.end();
}

// ---------- from_yaml helpers ----------

struct Context {
    fs::path repo;
    std::string home;

    fs::path path(const std::string& raw) const { return expand_path(raw, repo, home); }

    std::vector<fs::path> paths(const YAML::Node& node) const {
        std::vector<fs::path> out;
        for (const std::string& s : string_list(node)) out.push_back(path(s));
        return out;
    }
};

void from_yaml(const YAML::Node& node, HardwarePredicate& out) {
    out.cpu = enum_list<CpuVendor>(node["cpu"], "cpu", parse_cpu_vendor);
    out.gpu = enum_list<GpuConfig>(node["gpu"], "gpu", parse_gpu_config);
    out.gpu_vendor = enum_list<GpuConfig>(node["gpu_vendor"], "gpu_vendor", parse_gpu_vendor);
    out.platform = enum_list<Platform>(node["platform"], "platform", parse_platform);
    out.oem = enum_list<OemFamily>(node["oem"], "oem", parse_oem_family);
    out.features = enum_list<Feature>(node["features"], "features", parse_feature);
}

void from_yaml(const YAML::Node& node, const Context& ctx, ConfigFileEntry& out) {
    out.source = ctx.path(node["source"].as<std::string>());
    out.destination = ctx.path(node["destination"].as<std::string>());
    out.executable = get_or<bool>(node, "executable", false);
}

void from_yaml(const YAML::Node& node, const Context& ctx, SystemFileEntry& out) {
    out.source = ctx.path(node["source"].as<std::string>());
    out.destination = ctx.path(node["destination"].as<std::string>());
    out.kernel_module = get_or<bool>(node, "kernel_module", false);
    if (auto w = node["when"]) from_yaml(w, out.when);
}

void from_yaml(const YAML::Node& node, KernelConfig& out) {
    out.performance_package = get_or<std::string>(node, "performance_package", out.performance_package);
    out.stable_package = get_or<std::string>(node, "stable_package", out.stable_package);
    if (auto n = node["default"]) {
        auto k = parse_kernel_choice(n.as<std::string>());
        if (!k) throw std::runtime_error("unknown kernel default '" + n.as<std::string>() + "'");
        out.default_choice = *k;
    }
}

void from_yaml(const YAML::Node& node, MirrorConfig& out) {
    out.enabled = get_or<bool>(node, "enabled", out.enabled);
    out.mirrorlist = get_or<std::string>(node, "mirrorlist", out.mirrorlist);
    out.max_age_hours = get_or<int>(node, "max_age_hours", out.max_age_hours);
}

void from_yaml(const YAML::Node& node, AurConfig& out) {
    out.helper = get_or<std::string>(node, "helper", out.helper);
    out.group = get_or<std::string>(node, "group", out.group);
    out.bootstrap = get_or<bool>(node, "bootstrap", out.bootstrap);
    out.repository = get_or<std::string>(node, "repository", out.repository);
}

void from_yaml(const YAML::Node& node, ServiceConfig& out) {
    out.system = string_list(node["system"]);
    out.user = string_list(node["user"]);
}

void from_yaml(const YAML::Node& node, ReloadConfig& out) {
    out.process = get_or<std::string>(node, "process", "");
    out.command = string_list(node["command"]);
}

void from_yaml(const YAML::Node& node, const Context& ctx, VerifyConfig& out) {
    out.files = ctx.paths(node["files"]);
    out.commands = string_list(node["commands"]);
    out.services = string_list(node["services"]);
}

// Top-level mapper.
void from_yaml(const YAML::Node& root, const fs::path& base_dir, const std::string& home, ProvisionConfig& cfg) {
    Context ctx{base_dir, home};

    if (auto paths = root["paths"]) {
        if (auto n = paths["repo"]) ctx.repo = expand_path(n.as<std::string>(), base_dir, home);
        cfg.repo_dir = ctx.repo;
        cfg.package_dir = ctx.path(get_or<std::string>(paths, "package_groups", "packages"));
        cfg.state_file = ctx.path(get_or<std::string>(paths, "state_file", cfg.state_file.string()));
        if (auto n = paths["log_file"]) cfg.log_file = ctx.path(n.as<std::string>());
    } else {
        cfg.repo_dir = ctx.repo;
        cfg.package_dir = ctx.path("packages");
    }

    cfg.fallback_region = get_or<std::string>(root, "fallback_region", cfg.fallback_region);

    if (auto n = root["prerequisites"]) cfg.prerequisites = string_list(n);

    if (auto n = root["kernel"]) from_yaml(n, cfg.kernel);
    if (auto n = root["mirrors"]) from_yaml(n, cfg.mirrors);
    if (auto n = root["aur"]) from_yaml(n, cfg.aur);

    if (auto n = root["permissions"]) {
        cfg.executable_dirs = ctx.paths(n["directories"]);
        cfg.executables = ctx.paths(n["files"]);
    }
    cfg.directories = ctx.paths(root["directories"]);

    for (const auto& item : root["config_files"]) {
        ConfigFileEntry e;
        from_yaml(item, ctx, e);
        cfg.config_files.push_back(e);
    }
    for (const auto& item : root["system_files"]) {
        SystemFileEntry e;
        from_yaml(item, ctx, e);
        cfg.system_files.push_back(e);
    }

    if (auto n = root["services"]) from_yaml(n, cfg.services);
    if (auto n = root["reload"]) from_yaml(n, cfg.reload);
    if (auto n = root["verify"]) from_yaml(n, ctx, cfg.verify);
}

} // namespace

bool gpu_has_vendor(GpuConfig config, GpuConfig vendor) {
    switch (vendor) {
        case GpuConfig::Intel:
            return config == GpuConfig::Intel || is_hybrid(config);
        case GpuConfig::Nvidia:
        case GpuConfig::Amd:
            return config == vendor || (is_hybrid(config) && discrete_component(config) == vendor);
        default:
            return false;
    }
}

bool HardwarePredicate::matches(const HardwareProfile& p) const {
    if (!listed(cpu, p.cpu_vendor)) return false;
    if (!listed(gpu, p.gpu_config)) return false;
    if (!gpu_vendor.empty()) {
        bool any = std::any_of(gpu_vendor.begin(), gpu_vendor.end(),
                               [&](GpuConfig v) { return gpu_has_vendor(p.gpu_config, v); });
        if (!any) return false;
    }
    if (!listed(platform, p.platform)) return false;
    if (!listed(oem, p.oem_family)) return false;
    for (Feature f : features) {
        if (!p.features.has(f)) return false;
    }
    return true;
}

bool HardwarePredicate::universal() const {
    return cpu.empty() && gpu.empty() && gpu_vendor.empty() && platform.empty() &&
           oem.empty() && features.empty();
}

std::string AurConfig::repository_url() const {
    if (!repository.empty()) return repository;
    return "https://aur.archlinux.org/" + helper + ".git";
}

fs::path expand_path(const std::string& raw, const fs::path& base, const std::string& home) {
    if (raw == "~") return fs::path(home);
    if (raw.rfind("~/", 0) == 0) return fs::path(home) / raw.substr(2);
    fs::path p(raw);
    if (p.is_absolute() || raw.empty()) return p;
    return base / p;
}

ConfigLoadResult parse_provision_config(const std::string& yaml_text, const fs::path& base_dir, const std::string& home) {
    ConfigLoadResult r;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root && !root.IsNull() && !root.IsMap()) {
            r.error = "top level must be a mapping";
            return r;
        }
        from_yaml(root, base_dir, home, r.config);
        r.ok = true;
    } catch (const std::exception& ex) {
        r.error = ex.what();
    }
    return r;
}

ConfigLoadResult load_provision_config(const fs::path& path) {
    std::ifstream f(path);
    if (!f) {
        ConfigLoadResult r;
        r.error = path.string() + ": cannot open";
        return r;
    }
    std::ostringstream ss;
    ss << f.rdbuf();

    const char* home = std::getenv("HOME");
    std::error_code ec;
    fs::path base = fs::absolute(path, ec).parent_path();
    if (ec) base = path.parent_path();

    ConfigLoadResult r = parse_provision_config(ss.str(), base, home ? home : "");
    if (!r.ok) {
        r.error = path.string() + ": " + r.error;
        return r;
    }
    spdlog::debug("loaded manifest {} (repo {})", path.string(), r.config.repo_dir.string());
    return r;
}

ConfigLoadResult load_provision_config_or_defaults(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::debug("no manifest at {}, using built-in defaults", path.string());
        ConfigLoadResult r;
        r.ok = true;
        return r;
    }
    return load_provision_config(path);
}

} // namespace hwprov
