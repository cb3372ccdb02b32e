#include "config.hpp"

#include "fakes.hpp"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace hwprov;
using hwprov::testing::TempDir;

namespace fs = std::filesystem;

namespace {

const char* kManifest = R"(
paths:
  package_groups: packages
  state_file: /tmp/hardware-detection.env
  log_file: ~/.cache/hwprov.log
fallback_region: DE
kernel:
  performance_package: linux-zen
  stable_package: linux
  default: stable
mirrors:
  enabled: false
permissions:
  directories: [scripts]
  files: [bin/setup]
directories:
  - ~/.config/hypr
  - ~/Pictures/Screenshots
config_files:
  - source: config/hypr/hyprland.conf
    destination: ~/.config/hypr/hyprland.conf
  - source: scripts/screenshot.sh
    destination: ~/.local/bin/screenshot.sh
    executable: true
system_files:
  - source: system/modprobe.d/nvidia.conf
    destination: /etc/modprobe.d/nvidia.conf
    kernel_module: true
    when:
      gpu_vendor: nvidia
  - source: system/modprobe.d/thinkpad_acpi.conf
    destination: /etc/modprobe.d/thinkpad_acpi.conf
    kernel_module: true
    when:
      oem: thinkpad
      features: [fan_control]
  - source: system/modprobe.d/blacklist-ucsi.conf
    destination: /etc/modprobe.d/blacklist-ucsi.conf
services:
  system: [bluetooth.service, sshd.service]
  user: pipewire.service
reload:
  process: Hyprland
  command: [hyprctl, reload]
verify:
  files: [~/.config/hypr/hyprland.conf]
  commands: [hyprctl]
  services: [bluetooth.service]
)";

HardwareProfile thinkpad() {
    HardwareProfile p;
    p.cpu_vendor = CpuVendor::Intel;
    p.gpu_config = GpuConfig::HybridIntelNvidia;
    p.platform = Platform::Laptop;
    p.oem_family = OemFamily::ThinkPad;
    p.features.set(Feature::FanControl);
    return p;
}

} // namespace

TEST_CASE("Manifest maps onto the provisioning config") {
    ConfigLoadResult r = parse_provision_config(kManifest, "/srv/dotfiles", "/home/ada");
    REQUIRE(r.ok);
    const ProvisionConfig& c = r.config;

    REQUIRE(c.repo_dir == "/srv/dotfiles");
    REQUIRE(c.package_dir == "/srv/dotfiles/packages");
    REQUIRE(c.state_file == "/tmp/hardware-detection.env");
    REQUIRE(c.log_file == "/home/ada/.cache/hwprov.log");
    REQUIRE(c.fallback_region == "DE");
    REQUIRE(c.kernel.default_choice == KernelChoice::Stable);
    REQUIRE_FALSE(c.mirrors.enabled);

    REQUIRE(c.executable_dirs == std::vector<fs::path>{"/srv/dotfiles/scripts"});
    REQUIRE(c.executables == std::vector<fs::path>{"/srv/dotfiles/bin/setup"});
    REQUIRE(c.directories.size() == 2);
    REQUIRE(c.directories[0] == "/home/ada/.config/hypr");

    REQUIRE(c.config_files.size() == 2);
    REQUIRE(c.config_files[0].source == "/srv/dotfiles/config/hypr/hyprland.conf");
    REQUIRE_FALSE(c.config_files[0].executable);
    REQUIRE(c.config_files[1].executable);

    REQUIRE(c.system_files.size() == 3);
    REQUIRE(c.system_files[0].kernel_module);
    REQUIRE(c.system_files[2].when.universal());

    REQUIRE(c.services.system.size() == 2);
    REQUIRE(c.services.user == std::vector<std::string>{"pipewire.service"});
    REQUIRE(c.reload.command == std::vector<std::string>{"hyprctl", "reload"});
    REQUIRE(c.verify.files[0] == "/home/ada/.config/hypr/hyprland.conf");
}

TEST_CASE("Missing sections fall back to defaults") {
    ConfigLoadResult r = parse_provision_config("", "/srv/dotfiles", "/home/ada");
    REQUIRE(r.ok);
    REQUIRE(r.config.repo_dir == "/srv/dotfiles");
    REQUIRE(r.config.package_dir == "/srv/dotfiles/packages");
    REQUIRE(r.config.state_file == "/tmp/hardware-detection.env");
    REQUIRE(r.config.kernel.performance_package == "linux-zen");
    REQUIRE(r.config.kernel.default_choice == KernelChoice::Performance);
    REQUIRE(r.config.mirrors.enabled);
    REQUIRE(r.config.aur.helper == "paru");
    REQUIRE(r.config.aur.bootstrap);
    REQUIRE(r.config.aur.repository_url() == "https://aur.archlinux.org/paru.git");
    REQUIRE(r.config.prerequisites == std::vector<std::string>{"dmidecode", "pciutils", "usbutils", "reflector"});
    REQUIRE(r.config.system_files.empty());
}

TEST_CASE("Prerequisites and AUR bootstrap are configurable") {
    ConfigLoadResult r = parse_provision_config("prerequisites: [dmidecode]\n"
                                                "aur:\n  helper: yay\n  bootstrap: false\n",
                                                "/r", "/h");
    REQUIRE(r.ok);
    REQUIRE(r.config.prerequisites == std::vector<std::string>{"dmidecode"});
    REQUIRE_FALSE(r.config.aur.bootstrap);
    REQUIRE(r.config.aur.repository_url() == "https://aur.archlinux.org/yay.git");

    ConfigLoadResult none = parse_provision_config("prerequisites: []\n", "/r", "/h");
    REQUIRE(none.ok);
    REQUIRE(none.config.prerequisites.empty());
}

TEST_CASE("Bad manifests are load errors") {
    REQUIRE_FALSE(parse_provision_config("- just\n- a list\n", "/r", "/h").ok);
    REQUIRE_FALSE(parse_provision_config("kernel:\n  default: lts\n", "/r", "/h").ok);
    REQUIRE_FALSE(parse_provision_config("mirrors:\n  enabled: maybe\n", "/r", "/h").ok);
    REQUIRE_FALSE(parse_provision_config("config_files:\n  - destination: /x\n", "/r", "/h").ok);
    REQUIRE_FALSE(parse_provision_config("system_files:\n  - source: a\n    destination: /b\n    when: {gpu: voodoo}\n",
                                         "/r", "/h").ok);
    REQUIRE_FALSE(parse_provision_config("paths: [unclosed\n", "/r", "/h").ok);
}

TEST_CASE("Predicates gate system files by hardware") {
    ConfigLoadResult r = parse_provision_config(kManifest, "/srv/dotfiles", "/home/ada");
    REQUIRE(r.ok);
    const HardwarePredicate& nvidia = r.config.system_files[0].when;
    const HardwarePredicate& thinkpad_fan = r.config.system_files[1].when;

    HardwareProfile tp = thinkpad();
    REQUIRE(nvidia.matches(tp));
    REQUIRE(thinkpad_fan.matches(tp));

    HardwareProfile intel_desktop;
    intel_desktop.cpu_vendor = CpuVendor::Intel;
    intel_desktop.gpu_config = GpuConfig::Intel;
    REQUIRE_FALSE(nvidia.matches(intel_desktop));
    REQUIRE_FALSE(thinkpad_fan.matches(intel_desktop));

    // Both axes must hold.
    tp.features = FeatureFlags{};
    REQUIRE_FALSE(thinkpad_fan.matches(tp));
}

TEST_CASE("GPU vendor presence covers hybrids") {
    REQUIRE(gpu_has_vendor(GpuConfig::HybridIntelNvidia, GpuConfig::Nvidia));
    REQUIRE(gpu_has_vendor(GpuConfig::HybridIntelNvidia, GpuConfig::Intel));
    REQUIRE_FALSE(gpu_has_vendor(GpuConfig::HybridIntelNvidia, GpuConfig::Amd));
    REQUIRE(gpu_has_vendor(GpuConfig::HybridIntelAmd, GpuConfig::Amd));
    REQUIRE_FALSE(gpu_has_vendor(GpuConfig::Amd, GpuConfig::Intel));
    REQUIRE_FALSE(gpu_has_vendor(GpuConfig::Unknown, GpuConfig::Nvidia));
}

TEST_CASE("Path expansion") {
    REQUIRE(expand_path("~", "/repo", "/home/ada") == "/home/ada");
    REQUIRE(expand_path("~/.config", "/repo", "/home/ada") == "/home/ada/.config");
    REQUIRE(expand_path("/etc/x", "/repo", "/home/ada") == "/etc/x");
    REQUIRE(expand_path("config/x", "/repo", "/home/ada") == "/repo/config/x");
}

TEST_CASE("Manifest file is read relative to its own directory") {
    TempDir dir;
    fs::path manifest = dir.write("manifest.yaml", "paths:\n  package_groups: lists\n");

    ConfigLoadResult r = load_provision_config(manifest);
    REQUIRE(r.ok);
    REQUIRE(r.config.package_dir == dir / "lists");

    ConfigLoadResult missing = load_provision_config(dir / "absent.yaml");
    REQUIRE_FALSE(missing.ok);
    REQUIRE(missing.error.find("absent.yaml") != std::string::npos);
}

TEST_CASE("Detection settings come from the manifest when there is one") {
    TempDir dir;
    fs::path manifest = dir.write("manifest.yaml", "fallback_region: DE\npaths:\n  state_file: state/profile.env\n");

    ConfigLoadResult r = load_provision_config_or_defaults(manifest);
    REQUIRE(r.ok);
    REQUIRE(r.config.fallback_region == "DE");
    REQUIRE(r.config.state_file == dir / "state/profile.env");

    ConfigLoadResult absent = load_provision_config_or_defaults(dir / "absent.yaml");
    REQUIRE(absent.ok);
    REQUIRE(absent.config.fallback_region == "US");
    REQUIRE(absent.config.state_file == "/tmp/hardware-detection.env");

    dir.write("broken.yaml", "kernel:\n  default: lts\n");
    REQUIRE_FALSE(load_provision_config_or_defaults(dir / "broken.yaml").ok);
}
