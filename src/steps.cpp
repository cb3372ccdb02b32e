#include "steps.hpp"

#include "hwprov.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

namespace hwprov {

namespace {

namespace fs = std::filesystem;

// Short failure detail for a command: exit status plus its last output line.
std::string command_detail(const CommandResult& r) {
    if (!r.started) return "could not be started";
    std::string out = "exit " + std::to_string(r.exit_code);
    std::vector<std::string> lines = split_lines(r.output);
    while (!lines.empty() && trim(lines.back()).empty()) lines.pop_back();
    if (!lines.empty()) out += ": " + trim(lines.back());
    return out;
}

std::string count_of(size_t n, const char* what) {
    return std::to_string(n) + " " + what;
}

bool has_owner_exec(const fs::file_status& st) {
    return (st.permissions() & fs::perms::owner_exec) != fs::perms::none;
}

std::vector<fs::path> sorted_entries(const fs::path& dir, std::error_code& ec) {
    std::vector<fs::path> out;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

// Installs what is missing. Already-installed packages are left alone and
// packages no enabled source knows about are reported, not attempted.
StepResult install_package_list(PackageManager& pm, const std::vector<std::string>& packages) {
    size_t installed = 0;
    size_t present = 0;
    std::vector<std::string> errors;

    for (const std::string& pkg : packages) {
        if (pm.is_installed(pkg)) {
            ++present;
            continue;
        }
        if (!pm.exists(pkg)) {
            spdlog::warn("{} is not in any enabled package source", pkg);
            errors.push_back(pkg + ": not found in any enabled package source");
            continue;
        }
        CommandResult r = pm.install(pkg);
        if (!r.ok()) {
            errors.push_back(pkg + ": install failed (" + command_detail(r) + ")");
            continue;
        }
        spdlog::info("installed {}", pkg);
        ++installed;
    }

    std::string summary = count_of(installed, "installed") + ", " + count_of(present, "already present");
    if (!errors.empty()) summary += ", " + count_of(errors.size(), "failed");
    return step_from_items(summary, std::move(errors), installed + present);
}

} // namespace

KernelChoice choose_kernel(StepContext& ctx) {
    if (ctx.kernel_override) return *ctx.kernel_override;

    const KernelConfig& k = ctx.config.kernel;
    if (ctx.packages.is_installed(k.performance_package)) {
        spdlog::info("{} already installed, keeping the performance kernel", k.performance_package);
        return KernelChoice::Performance;
    }
    if (ctx.interactive) {
        bool perf = ctx.prompter.confirm("Install the performance kernel (" + k.performance_package +
                                         ", recommended)? No installs " + k.stable_package);
        return perf ? KernelChoice::Performance : KernelChoice::Stable;
    }
    return k.default_choice;
}

std::vector<std::string> flatten_packages(const std::vector<PackageGroup>& groups) {
    std::vector<std::string> out;
    for (const PackageGroup& g : groups) {
        for (const std::string& pkg : g.packages) {
            if (std::find(out.begin(), out.end(), pkg) == out.end()) out.push_back(pkg);
        }
    }
    return out;
}

bool looks_like_script(const fs::path& p) {
    return p.extension() == ".sh" || !p.has_extension();
}

StepResult install_prerequisites(StepContext& ctx) {
    const std::vector<std::string>& pkgs = ctx.config.prerequisites;
    if (pkgs.empty()) return step_skipped("nothing configured");
    return install_package_list(ctx.packages, pkgs);
}

StepResult detect_hardware(StepContext& ctx) {
    RawSignals signals = ctx.collect ? ctx.collect() : collect_signals();
    ClassifyResult c = classify_with_reasons(signals, ctx.config.fallback_region);
    for (const std::string& reason : c.reasons) spdlog::info("  {}", reason);

    std::string error;
    if (!write_profile_env(ctx.config.state_file, c.profile, error)) {
        return step_failed("cannot persist hardware profile: " + error);
    }
    return step_succeeded(profile_summary(c.profile));
}

StepResult fix_permissions(StepContext& ctx) {
    const ProvisionConfig& cfg = ctx.config;
    if (cfg.executable_dirs.empty() && cfg.executables.empty()) return step_skipped("nothing configured");

    size_t changed = 0;
    size_t already = 0;
    std::vector<std::string> errors;

    auto make_executable = [&](const fs::path& p) {
        std::error_code ec;
        fs::file_status st = fs::status(p, ec);
        if (ec || !fs::is_regular_file(st)) {
            errors.push_back(p.string() + ": not a regular file");
            return;
        }
        if (has_owner_exec(st)) {
            ++already;
            return;
        }
        fs::permissions(p, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add, ec);
        if (ec) {
            errors.push_back("chmod +x " + p.string() + ": " + ec.message());
            return;
        }
        spdlog::debug("chmod +x {}", p.string());
        ++changed;
    };

    for (const fs::path& dir : cfg.executable_dirs) {
        std::error_code ec;
        std::vector<fs::path> entries = sorted_entries(dir, ec);
        if (ec) {
            errors.push_back(dir.string() + ": " + ec.message());
            continue;
        }
        for (const fs::path& p : entries) {
            std::error_code fec;
            if (fs::is_regular_file(p, fec) && looks_like_script(p)) make_executable(p);
        }
    }
    for (const fs::path& p : cfg.executables) make_executable(p);

    return step_from_items(count_of(changed, "made executable") + ", " + count_of(already, "already executable"),
                           std::move(errors), changed + already);
}

StepResult refresh_mirrors(StepContext& ctx) {
    const MirrorConfig& m = ctx.config.mirrors;
    if (!m.enabled) return step_skipped("disabled in manifest");

    ProfileParseResult p = ctx.load_profile();
    if (!p.ok) return step_failed("cannot load hardware profile: " + p.error);

    if (!ctx.runner.run({"reflector", "--version"}).ok()) {
        return step_failed("reflector is not installed; install it or set mirrors.enabled: false");
    }

    std::vector<std::string> argv = ctx.privileged({
        "reflector", "--country", p.profile.mirror_region,
        "--age", std::to_string(m.max_age_hours),
        "--protocol", "https", "--sort", "rate",
        "--connection-timeout", "2",
        "--save", m.mirrorlist,
    });
    CommandResult r = ctx.runner.run(argv);
    if (!r.ok()) {
        return step_failed("mirror refresh failed (" + command_detail(r) + "); retry with: " + describe_command(argv));
    }
    return step_succeeded("mirrors for " + p.profile.mirror_region + " saved to " + m.mirrorlist);
}

StepResult sync_package_database(StepContext& ctx) {
    CommandResult r = ctx.packages.sync_database();
    if (!r.ok()) {
        return step_failed("package database sync failed (" + command_detail(r) + "); retry with: sudo pacman -Sy");
    }
    return step_succeeded("package database synchronized");
}

StepResult install_packages(StepContext& ctx) {
    ProfileParseResult p = ctx.load_profile();
    if (!p.ok) return step_failed("cannot load hardware profile: " + p.error);

    KernelChoice kernel = choose_kernel(ctx);
    std::vector<std::string> keys = resolve(p.profile, kernel);
    spdlog::info("package groups: {}", join(keys, ", "));

    FlatFilePackageGroupStore store(ctx.config.package_dir);
    ResolvedPackages resolved = load_groups(keys, store);
    std::vector<std::string> packages = flatten_packages(resolved.groups);
    spdlog::debug("{} package(s) listed across {} group(s), {} unique", resolved.package_count(),
                  resolved.groups.size(), packages.size());
    if (packages.empty()) {
        return step_failed("no package lists found under " + ctx.config.package_dir.string());
    }

    StepResult r = install_package_list(ctx.packages, packages);
    if (!resolved.warnings.empty()) {
        r.summary += ", " + count_of(resolved.warnings.size(), "group(s) without a package list");
    }
    return r;
}

StepResult install_aur_packages(StepContext& ctx) {
    const AurConfig& aur = ctx.config.aur;
    FlatFilePackageGroupStore store(ctx.config.package_dir);
    std::optional<PackageGroup> group = store.load(aur.group);
    if (!group || group->packages.empty()) return step_skipped("no AUR package list");

    if (!ctx.aur.available()) {
        std::string manual = aur.helper + " -S --needed " + join(group->packages, " ");
        if (!aur.bootstrap) {
            return step_failed(aur.helper + " is not installed; install it, then run: " + manual);
        }
        StepResult b = bootstrap_aur_helper(ctx);
        if (b.state != StepState::Succeeded) {
            b.errors.push_back("install " + aur.helper + " by hand, then run: " + manual);
            return b;
        }
    }
    return install_package_list(ctx.aur, group->packages);
}

StepResult bootstrap_aur_helper(StepContext& ctx) {
    const AurConfig& aur = ctx.config.aur;
    spdlog::info("{} is not installed, building it from the AUR", aur.helper);

    StepResult deps = install_package_list(ctx.packages, {"base-devel", "git"});
    if (deps.state != StepState::Succeeded) {
        return step_failed("cannot install build dependencies for " + aur.helper + ": " + join(deps.errors, "; "));
    }

    std::error_code ec;
    fs::path build_dir = fs::temp_directory_path(ec);
    if (ec) build_dir = "/tmp";
    build_dir /= "hwprov-" + aur.helper + "-build";
    fs::remove_all(build_dir, ec);
    if (ec) return step_failed("cannot clear " + build_dir.string() + ": " + ec.message());

    std::vector<std::string> clone = {"git", "clone", "--depth", "1", aur.repository_url(), build_dir.string()};
    CommandResult r = ctx.runner.run(clone);
    if (!r.ok()) {
        return step_failed("clone failed (" + command_detail(r) + "); retry with: " + describe_command(clone));
    }

    // makepkg refuses to run as root and calls sudo itself for -i.
    std::vector<std::string> build = {"sh", "-c", "cd \"$1\" && makepkg -si --noconfirm", "sh", build_dir.string()};
    r = ctx.runner.run(build);
    fs::remove_all(build_dir, ec);
    if (!r.ok()) {
        return step_failed("building " + aur.helper + " failed (" + command_detail(r) + ")");
    }

    if (!ctx.aur.available()) return step_failed(aur.helper + " still not available after building it");
    spdlog::info("installed {}", aur.helper);
    return step_succeeded(aur.helper + " built and installed");
}

StepResult create_directories(StepContext& ctx) {
    const std::vector<fs::path>& dirs = ctx.config.directories;
    if (dirs.empty()) return step_skipped("nothing configured");

    size_t created = 0;
    size_t present = 0;
    std::vector<std::string> errors;
    for (const fs::path& d : dirs) {
        std::error_code ec;
        if (fs::is_directory(d, ec)) {
            ++present;
            continue;
        }
        fs::create_directories(d, ec);
        if (ec) {
            errors.push_back("mkdir -p " + d.string() + ": " + ec.message());
            continue;
        }
        ++created;
    }
    return step_from_items(count_of(created, "created") + ", " + count_of(present, "already present"),
                           std::move(errors), created + present);
}

StepResult migrate_config_files(StepContext& ctx) {
    const std::vector<ConfigFileEntry>& files = ctx.config.config_files;
    if (files.empty()) return step_skipped("nothing configured");

    size_t installed = 0;
    size_t replaced = 0;
    size_t unchanged = 0;
    std::vector<std::string> errors;

    for (const ConfigFileEntry& f : files) {
        FileInstallResult r = ctx.user_files.install(f.source, f.destination, f.executable);
        switch (r.outcome) {
            case InstallOutcome::Installed: ++installed; break;
            case InstallOutcome::Replaced: ++replaced; break;
            case InstallOutcome::Unchanged: ++unchanged; break;
            case InstallOutcome::Failed:
                errors.push_back(f.source.string() + " -> " + f.destination.string() + ": " + r.error);
                break;
        }
    }

    return step_from_items(count_of(installed, "installed") + ", " + count_of(replaced, "replaced (backed up)") +
                               ", " + count_of(unchanged, "unchanged"),
                           std::move(errors), installed + replaced + unchanged);
}

StepResult install_system_files(StepContext& ctx) {
    const std::vector<SystemFileEntry>& files = ctx.config.system_files;
    if (files.empty()) return step_skipped("nothing configured");

    ProfileParseResult p = ctx.load_profile();
    if (!p.ok) return step_failed("cannot load hardware profile: " + p.error);

    size_t written = 0;
    size_t unchanged = 0;
    size_t not_applicable = 0;
    size_t modules_changed = 0;
    std::vector<std::string> errors;

    for (const SystemFileEntry& f : files) {
        if (!f.when.matches(p.profile)) {
            spdlog::debug("{}: not for this hardware", f.destination.string());
            ++not_applicable;
            continue;
        }

        FileInstallResult r = ctx.system_files.install(f.source, f.destination, false);
        if (r.outcome == InstallOutcome::Failed) {
            errors.push_back(f.source.string() + " -> " + f.destination.string() + ": " + r.error);
            continue;
        }
        if (!r.changed()) {
            ++unchanged;
            continue;
        }
        spdlog::info("{} {}", install_outcome_name(r.outcome), f.destination.string());
        ++written;
        if (f.kernel_module) ++modules_changed;
    }

    std::string summary = count_of(written, "written") + ", " + count_of(unchanged, "unchanged") + ", " +
                          count_of(not_applicable, "not applicable");

    // One initramfs rebuild for the whole batch.
    if (modules_changed > 0) {
        std::vector<std::string> argv = ctx.privileged({"mkinitcpio", "-P"});
        CommandResult r = ctx.runner.run(argv);
        if (r.ok()) {
            summary += ", initramfs regenerated";
        } else {
            errors.push_back("initramfs regeneration failed (" + command_detail(r) +
                             "); retry with: " + describe_command(argv));
        }
    }

    return step_from_items(summary, std::move(errors), written + unchanged);
}

StepResult enable_services(StepContext& ctx) {
    const ServiceConfig& svc = ctx.config.services;
    if (svc.system.empty() && svc.user.empty()) return step_skipped("nothing configured");

    struct Unit {
        std::string name;
        ServiceScope scope;
    };
    std::vector<Unit> pending;
    size_t already = 0;

    for (const std::string& s : svc.system) {
        if (ctx.services.is_enabled(s, ServiceScope::System)) ++already;
        else pending.push_back({s, ServiceScope::System});
    }
    for (const std::string& s : svc.user) {
        if (ctx.services.is_enabled(s, ServiceScope::User)) ++already;
        else pending.push_back({s, ServiceScope::User});
    }
    if (pending.empty()) return step_succeeded("all " + count_of(already, "service(s) already enabled"));

    std::vector<std::string> errors;
    for (ServiceScope scope : {ServiceScope::System, ServiceScope::User}) {
        bool needed = std::any_of(pending.begin(), pending.end(), [&](const Unit& u) { return u.scope == scope; });
        if (!needed) continue;
        CommandResult r = ctx.services.daemon_reload(scope);
        if (!r.ok()) {
            errors.push_back(std::string(scope == ServiceScope::User ? "user " : "") +
                             "daemon-reload failed (" + command_detail(r) + ")");
        }
    }

    size_t enabled = 0;
    for (const Unit& u : pending) {
        CommandResult r = ctx.services.enable(u.name, u.scope);
        if (!r.ok()) {
            errors.push_back(u.name + ": enable failed (" + command_detail(r) + "); retry with: systemctl " +
                             (u.scope == ServiceScope::User ? "--user " : "") + "enable " + u.name);
            continue;
        }
        spdlog::info("enabled {}{}", u.name, u.scope == ServiceScope::User ? " (user)" : "");
        ++enabled;
    }

    return step_from_items(count_of(enabled, "enabled") + ", " + count_of(already, "already enabled"),
                           std::move(errors), enabled + already);
}

StepResult reload_configuration(StepContext& ctx) {
    const ReloadConfig& r = ctx.config.reload;
    if (r.process.empty() || r.command.empty()) return step_skipped("nothing configured");

    if (!ctx.runner.run({"pgrep", "-x", r.process}).ok()) {
        return step_skipped(r.process + " is not running");
    }
    CommandResult res = ctx.runner.run(r.command);
    if (!res.ok()) {
        return step_failed(describe_command(r.command) + " failed (" + command_detail(res) + ")");
    }
    return step_succeeded(r.process + " reloaded");
}

StepResult verify_installation(StepContext& ctx) {
    const ProvisionConfig& cfg = ctx.config;
    size_t passed = 0;
    std::vector<std::string> problems;

    for (const fs::path& f : cfg.verify.files) {
        std::error_code ec;
        if (fs::exists(f, ec)) ++passed;
        else problems.push_back("missing file " + f.string());
    }

    for (const std::string& cmd : cfg.verify.commands) {
        // The name is passed as $1, never spliced into the script.
        if (ctx.runner.run({"sh", "-c", "command -v \"$1\" >/dev/null", "sh", cmd}).ok()) ++passed;
        else problems.push_back("command not found: " + cmd);
    }

    for (const std::string& unit : cfg.verify.services) {
        if (ctx.services.is_enabled(unit, ServiceScope::System) || ctx.services.is_enabled(unit, ServiceScope::User)) {
            ++passed;
        } else {
            problems.push_back("service not enabled: " + unit);
        }
    }

    if (!cfg.system_files.empty()) {
        ProfileParseResult p = ctx.load_profile();
        if (!p.ok) {
            problems.push_back("cannot check system files: " + p.error);
        } else {
            for (const SystemFileEntry& f : cfg.system_files) {
                if (!f.when.matches(p.profile)) continue;
                std::error_code ec;
                if (fs::exists(f.destination, ec)) ++passed;
                else problems.push_back("missing system file " + f.destination.string());
            }
        }
    }

    if (passed == 0 && problems.empty()) return step_skipped("nothing to check");
    return step_from_items(count_of(passed, "check(s) passed") + ", " + count_of(problems.size(), "failed"),
                           std::move(problems), passed);
}

std::vector<ProvisioningStep> build_pipeline() {
    return {
        {"install-prerequisites", "Install the hardware detection tools", false, install_prerequisites},
        {"detect-hardware", "Detect and classify hardware", false, detect_hardware},
        {"fix-permissions", "Make repository scripts executable", true, fix_permissions},
        {"refresh-mirrors", "Refresh the pacman mirror list for this region", true, refresh_mirrors},
        {"sync-package-database", "Synchronize the package database", true, sync_package_database},
        {"install-packages", "Install hardware-specific package groups", true, install_packages},
        {"install-aur-packages", "Install AUR packages", true, install_aur_packages},
        {"create-directories", "Create required directories", true, create_directories},
        {"migrate-config-files", "Copy configuration files (existing files are backed up)", true, migrate_config_files},
        {"install-system-files", "Install hardware-specific system files", true, install_system_files},
        {"enable-services", "Enable system and user services", true, enable_services},
        {"reload-configuration", "Reload the running desktop session", true, reload_configuration},
        {"verify-installation", "Verify the installation", false, verify_installation},
    };
}

ProvisioningStep pipeline_step(const std::string& name) {
    for (ProvisioningStep& s : build_pipeline()) {
        if (s.name == name) return s;
    }
    throw std::out_of_range("no pipeline step named " + name);
}

} // namespace hwprov
