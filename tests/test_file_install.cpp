#include "file_install.hpp"

#include "fakes.hpp"

#include <chrono>
#include <filesystem>

#include <catch2/catch_test_macros.hpp>

using namespace hwprov;
using hwprov::testing::FakeCommandRunner;
using hwprov::testing::TempDir;
using hwprov::testing::count_with_prefix;
using hwprov::testing::read_file;

namespace fs = std::filesystem;

TEST_CASE("Backup stamp uses date and time") {
    std::string stamp = backup_timestamp(std::chrono::system_clock::now());
    REQUIRE(stamp.size() == 15);
    REQUIRE(stamp[8] == '_');
}

TEST_CASE("Backup names never collide") {
    TempDir dir;
    fs::path dest = dir.write("hyprland.conf", "old");

    REQUIRE(backup_path_for(dest, "20250101_120000") == dir / "hyprland.conf.bak.20250101_120000");
    dir.write("hyprland.conf.bak.20250101_120000", "older");
    REQUIRE(backup_path_for(dest, "20250101_120000") == dir / "hyprland.conf.bak.20250101_120000-1");
}

TEST_CASE("Fresh destination is installed without a backup") {
    TempDir dir;
    fs::path src = dir.write("repo/config/kitty.conf", "font_size 11\n");
    fs::path dest = dir / "home/.config/kitty/kitty.conf";

    LocalFileInstaller installer("20250101_120000");
    FileInstallResult r = installer.install(src, dest, false);

    REQUIRE(r.outcome == InstallOutcome::Installed);
    REQUIRE(r.backup.empty());
    REQUIRE(read_file(dest) == "font_size 11\n");
    REQUIRE(count_with_prefix(dest.parent_path(), "kitty.conf.bak.") == 0);
}

TEST_CASE("Existing destination is backed up exactly once before overwrite") {
    TempDir dir;
    fs::path src = dir.write("repo/kitty.conf", "font_size 11\n");
    fs::path dest = dir.write("home/kitty.conf", "font_size 14\n");

    LocalFileInstaller installer("20250101_120000");
    FileInstallResult r = installer.install(src, dest, false);

    REQUIRE(r.outcome == InstallOutcome::Replaced);
    REQUIRE(read_file(dest) == "font_size 11\n");
    REQUIRE(count_with_prefix(dest.parent_path(), "kitty.conf.bak.") == 1);
    REQUIRE(read_file(r.backup) == "font_size 14\n");

    // Same content again: nothing to back up.
    FileInstallResult again = installer.install(src, dest, false);
    REQUIRE(again.outcome == InstallOutcome::Unchanged);
    REQUIRE(count_with_prefix(dest.parent_path(), "kitty.conf.bak.") == 1);
}

TEST_CASE("Executable flag is applied") {
    TempDir dir;
    fs::path src = dir.write("repo/launch.sh", "#!/bin/sh\n");
    fs::path dest = dir / "bin/launch.sh";

    LocalFileInstaller installer("20250101_120000");
    REQUIRE(installer.install(src, dest, true).outcome == InstallOutcome::Installed);
    REQUIRE((fs::status(dest).permissions() & fs::perms::owner_exec) != fs::perms::none);
}

TEST_CASE("Missing source fails without touching the destination") {
    TempDir dir;
    fs::path dest = dir.write("home/kitty.conf", "keep me");

    LocalFileInstaller installer("20250101_120000");
    FileInstallResult r = installer.install(dir / "repo/absent.conf", dest, false);

    REQUIRE(r.outcome == InstallOutcome::Failed);
    REQUIRE_FALSE(r.error.empty());
    REQUIRE(read_file(dest) == "keep me");
}

TEST_CASE("Elevated installer backs up through sudo before installing") {
    TempDir dir;
    fs::path src = dir.write("repo/nvidia.conf", "options nvidia_drm modeset=1\n");
    const std::string dest = "/etc/modprobe.d/nvidia.conf";
    const std::string stamp = "20250101_120000";

    FakeCommandRunner runner;
    runner.fail("sudo cmp -s " + src.string() + " " + dest);

    ElevatedFileInstaller installer(runner, stamp);
    FileInstallResult r = installer.install(src, dest, false);

    REQUIRE(r.outcome == InstallOutcome::Replaced);
    REQUIRE(runner.calls.size() == 4);
    REQUIRE(runner.calls[2] == std::vector<std::string>{"sudo", "cp", "-p", dest, dest + ".bak." + stamp});
    REQUIRE(runner.calls[3] == std::vector<std::string>{"sudo", "install", "-D", "-m", "0644", src.string(), dest});
}

TEST_CASE("Elevated installer stops when the backup fails") {
    TempDir dir;
    fs::path src = dir.write("repo/nvidia.conf", "options nvidia_drm modeset=1\n");
    const std::string dest = "/etc/modprobe.d/nvidia.conf";
    const std::string stamp = "20250101_120000";

    FakeCommandRunner runner;
    runner.fail("sudo cmp -s " + src.string() + " " + dest);
    runner.fail("sudo cp -p " + dest + " " + dest + ".bak." + stamp, 1, "cp: No space left on device");

    ElevatedFileInstaller installer(runner, stamp);
    FileInstallResult r = installer.install(src, dest, false);

    REQUIRE(r.outcome == InstallOutcome::Failed);
    REQUIRE(runner.count("sudo install -D -m 0644 " + src.string() + " " + dest) == 0);
}

TEST_CASE("Elevated installer leaves identical files alone") {
    TempDir dir;
    fs::path src = dir.write("repo/thinkpad_acpi.conf", "options thinkpad_acpi fan_control=1\n");

    FakeCommandRunner runner;
    ElevatedFileInstaller installer(runner, "20250101_120000");
    FileInstallResult r = installer.install(src, "/etc/modprobe.d/thinkpad_acpi.conf", false);

    REQUIRE(r.outcome == InstallOutcome::Unchanged);
    REQUIRE(runner.calls.size() == 2);
}
