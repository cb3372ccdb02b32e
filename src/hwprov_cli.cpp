#include "config.hpp"
#include "env_file.hpp"
#include "hwprov.hpp"
#include "logging.hpp"
#include "package_groups.hpp"
#include "pipeline.hpp"
#include "steps.hpp"
#include "system.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace hwprov;

namespace {

struct CliOptions {
    std::string command = "detect";
    bool want_env = false;
    bool want_json = false;
    bool want_reason = false;
    bool want_signals = false;
    bool want_write = false;
    bool want_yes = false;
    bool want_help = false;
    bool want_version = false;
    spdlog::level::level_enum level = spdlog::level::info;
    std::string config_path = "data/manifest.yaml";
    std::optional<std::string> state_path;
    std::optional<KernelChoice> kernel;
};

void print_usage() {
    std::cout << "Usage: hwprov [command] [options]\n"
                 "Commands:\n"
                 "  detect      Classify this machine (default).\n"
                 "  resolve     Print the package groups for the saved profile.\n"
                 "  provision   Run the provisioning pipeline.\n"
                 "  verify      Check the result of a previous run.\n"
                 "Options:\n"
                 "  --env            detect: print the profile as KEY=\"value\" lines.\n"
                 "  --json           detect: print the profile as JSON.\n"
                 "  --reason         detect: explain each classification.\n"
                 "  --signals        detect: print the raw signals.\n"
                 "  --write          detect: save the profile to the state file.\n"
                 "  --state PATH     Profile file (default from the manifest, else " << ProvisionConfig{}.state_file.string() << ").\n"
                 "  --config PATH    Manifest (default data/manifest.yaml).\n"
                 "  --kernel K       performance or stable.\n"
                 "  --yes            Answer yes to every prompt.\n"
                 "  --verbose        Debug logging.\n"
                 "  --quiet          Warnings and errors only.\n"
                 "  --version        Show version.\n"
                 "  -h, --help       Show this help.\n";
}

// Returns false on a usage error, after printing it.
bool parse_args(int argc, char** argv, CliOptions& opt) {
    bool have_command = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "hwprov: " << flag << " needs a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--env") {
            opt.want_env = true;
        } else if (arg == "--json") {
            opt.want_json = true;
        } else if (arg == "--reason") {
            opt.want_reason = true;
        } else if (arg == "--signals") {
            opt.want_signals = true;
        } else if (arg == "--write") {
            opt.want_write = true;
        } else if (arg == "--yes" || arg == "-y") {
            opt.want_yes = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opt.level = spdlog::level::debug;
        } else if (arg == "--quiet" || arg == "-q") {
            opt.level = spdlog::level::warn;
        } else if (arg == "--help" || arg == "-h") {
            opt.want_help = true;
        } else if (arg == "--version") {
            opt.want_version = true;
        } else if (arg == "--state") {
            auto v = value("--state");
            if (!v) return false;
            opt.state_path = *v;
        } else if (arg == "--config") {
            auto v = value("--config");
            if (!v) return false;
            opt.config_path = *v;
        } else if (arg == "--kernel") {
            auto v = value("--kernel");
            if (!v) return false;
            opt.kernel = parse_kernel_choice(*v);
            if (!opt.kernel) {
                std::cerr << "hwprov: unknown kernel '" << *v << "' (performance or stable)\n";
                return false;
            }
        } else if (!have_command && !arg.empty() && arg[0] != '-') {
            opt.command = arg;
            have_command = true;
        } else {
            std::cerr << "hwprov: unknown argument '" << arg << "'\n";
            return false;
        }
    }

    if (opt.command != "detect" && opt.command != "resolve" && opt.command != "provision" &&
        opt.command != "verify") {
        std::cerr << "hwprov: unknown command '" << opt.command << "'\n";
        return false;
    }
    return true;
}

void print_signals(const RawSignals& s) {
    std::cout << "cpu_vendor_string=" << s.cpu_vendor_string << "\n";
    for (const std::string& c : s.display_controllers) std::cout << "display_controller=" << c << "\n";
    std::cout << "chassis_type=" << s.chassis_type << "\n";
    std::cout << "system_manufacturer=" << s.system_manufacturer << "\n";
    std::cout << "system_product_name=" << s.system_product_name << "\n";
    std::cout << "system_product_version=" << s.system_product_version << "\n";
    std::cout << "has_battery=" << (s.has_battery ? "true" : "false") << "\n";
    std::cout << "locale=" << s.locale << "\n";
    std::cout << "fan_control_interface=" << (s.fan_control_interface ? "true" : "false") << "\n";
    std::cout << "pci_devices=" << s.pci_devices.size() << "\n";
    for (const std::string& d : s.input_devices) std::cout << "input_device=" << d << "\n";
    for (const std::string& d : s.usb_devices) std::cout << "usb_device=" << d << "\n";
}

// detect and resolve read the manifest when there is one, for the state file
// and fallback region; without one the built-in defaults apply.
bool load_settings(const CliOptions& opt, ProvisionConfig& config) {
    ConfigLoadResult loaded = load_provision_config_or_defaults(opt.config_path);
    if (!loaded.ok) {
        spdlog::error("{}", loaded.error);
        return false;
    }
    config = std::move(loaded.config);
    if (opt.state_path) config.state_file = *opt.state_path;
    return true;
}

int run_detect(const CliOptions& opt) {
    if (opt.want_env && opt.want_json) {
        std::cerr << "hwprov: --env and --json are mutually exclusive\n";
        return 1;
    }
    ProvisionConfig config;
    if (!load_settings(opt, config)) return 1;

    RawSignals signals = collect_signals();
    if (opt.want_signals) {
        print_signals(signals);
        std::cout << "\n";
    }

    ClassifyResult result = classify_with_reasons(signals, config.fallback_region);
    if (opt.want_json) {
        std::vector<std::string> reasons;
        if (opt.want_reason) reasons = result.reasons;
        std::cout << format_profile_json(result.profile, reasons) << "\n";
    } else {
        if (opt.want_env) std::cout << format_profile_env(result.profile);
        else std::cout << profile_summary(result.profile) << "\n";
        if (opt.want_reason) {
            for (const std::string& r : result.reasons) std::cout << "  " << r << "\n";
        }
    }

    if (opt.want_write) {
        std::string error;
        if (!write_profile_env(config.state_file, result.profile, error)) {
            spdlog::error("cannot write {}: {}", config.state_file.string(), error);
            return 1;
        }
        spdlog::info("profile saved to {}", config.state_file.string());
    }
    return 0;
}

int run_resolve(const CliOptions& opt) {
    ProvisionConfig config;
    if (!load_settings(opt, config)) return 1;

    ProfileParseResult loaded = load_profile_env(config.state_file);
    if (!loaded.ok) {
        spdlog::error("{}", loaded.error);
        spdlog::error("run 'hwprov detect --write' first");
        return 1;
    }
    KernelChoice kernel = opt.kernel.value_or(config.kernel.default_choice);
    for (const std::string& key : resolve(loaded.profile, kernel)) {
        std::cout << key << "\n";
    }
    return 0;
}

// provision and verify share the same collaborators.
int run_pipeline(const CliOptions& opt, bool verify_only) {
    ConfigLoadResult loaded = load_provision_config(opt.config_path);
    if (!loaded.ok) {
        spdlog::error("{}", loaded.error);
        return 1;
    }
    ProvisionConfig& config = loaded.config;
    if (opt.state_path) config.state_file = *opt.state_path;

    if (!config.log_file.empty()) {
        hwprov::logging::init({opt.level, config.log_file});
    }

    const bool as_root = running_as_root();
    const bool interactive = !opt.want_yes;
    const std::string stamp = backup_timestamp(std::chrono::system_clock::now());

    PosixCommandRunner runner;
    PacmanPackageManager pacman(runner, "pacman", !as_root);
    PacmanPackageManager aur(runner, config.aur.helper, false);
    SystemctlServiceControl services(runner, !as_root);

    std::unique_ptr<Prompter> prompter;
    if (interactive) prompter = std::make_unique<StreamPrompter>(std::cin, std::cout);
    else prompter = std::make_unique<FixedPrompter>(true);

    LocalFileInstaller user_files(stamp);
    std::unique_ptr<FileInstaller> system_files;
    if (as_root) system_files = std::make_unique<LocalFileInstaller>(stamp);
    else system_files = std::make_unique<ElevatedFileInstaller>(runner, stamp);

    StepContext ctx{config, runner, pacman, aur, services, *prompter, user_files, *system_files};
    ctx.use_sudo = !as_root;
    ctx.interactive = interactive;
    ctx.kernel_override = opt.kernel;

    if (verify_only) {
        Orchestrator orchestrator({pipeline_step("verify-installation")});
        RunReport report = orchestrator.run(ctx);
        print_summary(report, std::cout);
        return report.fully_succeeded() ? 0 : 2;
    }

    if (interactive && !prompter->confirm("Provision this machine using " + opt.config_path + "? Continue")) {
        std::cout << "Nothing done.\n";
        return 0;
    }

    Orchestrator orchestrator(build_pipeline());
    RunReport report = orchestrator.run(ctx);
    print_summary(report, std::cout);
    return report.fully_succeeded() ? 0 : 2;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opt;
    if (!parse_args(argc, argv, opt)) {
        std::cerr << "Try 'hwprov --help'.\n";
        return 1;
    }

    if (opt.want_help) {
        print_usage();
        return 0;
    }

    if (opt.want_version) {
        std::cout << "hwprov " << HWPROV_VERSION << "\n";
        return 0;
    }

    hwprov::logging::init({opt.level, {}});

    if (opt.command == "resolve") return run_resolve(opt);
    if (opt.command == "provision") return run_pipeline(opt, false);
    if (opt.command == "verify") return run_pipeline(opt, true);
    return run_detect(opt);
}
