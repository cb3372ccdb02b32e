#include "file_install.hpp"

#include "system.hpp"

#include <algorithm>
#include <array>
#include <ctime>
#include <fstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace hwprov {

namespace {

namespace fs = std::filesystem;

FileInstallResult failed(std::string error) {
    FileInstallResult r;
    r.outcome = InstallOutcome::Failed;
    r.error = std::move(error);
    return r;
}

bool is_regular(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

bool path_exists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

void add_exec_bits(const fs::path& p, std::error_code& ec) {
    fs::permissions(p,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
}

bool has_owner_exec(const fs::path& p) {
    std::error_code ec;
    auto st = fs::status(p, ec);
    return !ec && (st.permissions() & fs::perms::owner_exec) != fs::perms::none;
}

} // namespace

const char* install_outcome_name(InstallOutcome o) {
    switch (o) {
        case InstallOutcome::Installed: return "installed";
        case InstallOutcome::Replaced: return "replaced";
        case InstallOutcome::Unchanged: return "unchanged";
        case InstallOutcome::Failed: return "failed";
    }
    return "failed";
}

std::string backup_timestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::array<char, 32> buf{};
    std::strftime(buf.data(), buf.size(), "%Y%m%d_%H%M%S", &tm);
    return buf.data();
}

fs::path backup_path_for(const fs::path& destination, const std::string& stamp) {
    fs::path base = destination;
    base += ".bak." + stamp;
    if (!path_exists(base)) return base;

    for (int n = 1;; ++n) {
        fs::path candidate = base;
        candidate += "-" + std::to_string(n);
        if (!path_exists(candidate)) return candidate;
    }
}

bool files_identical(const fs::path& a, const fs::path& b) {
    std::error_code ec1, ec2;
    auto sa = fs::file_size(a, ec1);
    auto sb = fs::file_size(b, ec2);
    if (ec1 || ec2 || sa != sb) return false;

    std::ifstream fa(a, std::ios::binary);
    std::ifstream fb(b, std::ios::binary);
    if (!fa || !fb) return false;

    std::array<char, 8192> ba{};
    std::array<char, 8192> bb{};
    while (fa && fb) {
        fa.read(ba.data(), ba.size());
        fb.read(bb.data(), bb.size());
        if (fa.gcount() != fb.gcount()) return false;
        if (!std::equal(ba.begin(), ba.begin() + fa.gcount(), bb.begin())) return false;
    }
    return true;
}

// ---------- local ----------

LocalFileInstaller::LocalFileInstaller(std::string backup_stamp) : stamp_(std::move(backup_stamp)) {}

FileInstallResult LocalFileInstaller::install(const fs::path& source, const fs::path& destination, bool executable) {
    if (!is_regular(source)) return failed("source not found: " + source.string());

    std::error_code ec;
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
        if (ec) return failed("cannot create " + destination.parent_path().string() + ": " + ec.message());
    }

    FileInstallResult result;
    result.outcome = InstallOutcome::Installed;

    if (path_exists(destination)) {
        if (files_identical(source, destination)) {
            if (executable && !has_owner_exec(destination)) {
                add_exec_bits(destination, ec);
                if (ec) return failed("chmod " + destination.string() + ": " + ec.message());
            }
            result.outcome = InstallOutcome::Unchanged;
            return result;
        }

        fs::path backup = backup_path_for(destination, stamp_);
        fs::copy_file(destination, backup, fs::copy_options::none, ec);
        if (ec) return failed("backup of " + destination.string() + " failed: " + ec.message());
        spdlog::info("backed up {} -> {}", destination.string(), backup.string());

        result.outcome = InstallOutcome::Replaced;
        result.backup = backup;
    }

    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) return failed("copy " + source.string() + " -> " + destination.string() + ": " + ec.message());

    if (executable) {
        add_exec_bits(destination, ec);
        if (ec) return failed("chmod " + destination.string() + ": " + ec.message());
    }
    return result;
}

// ---------- sudo ----------

ElevatedFileInstaller::ElevatedFileInstaller(CommandRunner& runner, std::string backup_stamp)
    : runner_(runner), stamp_(std::move(backup_stamp)) {}

FileInstallResult ElevatedFileInstaller::install(const fs::path& source, const fs::path& destination, bool executable) {
    if (!is_regular(source)) return failed("source not found: " + source.string());

    FileInstallResult result;
    result.outcome = InstallOutcome::Installed;

    if (runner_.run({"sudo", "test", "-e", destination.string()}).ok()) {
        // cmp: 0 identical, 1 different, 2 trouble
        CommandResult cmp = runner_.run({"sudo", "cmp", "-s", source.string(), destination.string()});
        if (cmp.ok()) {
            result.outcome = InstallOutcome::Unchanged;
            return result;
        }

        fs::path backup = backup_path_for(destination, stamp_);
        CommandResult cp = runner_.run({"sudo", "cp", "-p", destination.string(), backup.string()});
        if (!cp.ok()) {
            return failed("backup of " + destination.string() + " failed: " + cp.output);
        }
        spdlog::info("backed up {} -> {}", destination.string(), backup.string());

        result.outcome = InstallOutcome::Replaced;
        result.backup = backup;
    }

    CommandResult inst = runner_.run({"sudo", "install", "-D", "-m", executable ? "0755" : "0644",
                                      source.string(), destination.string()});
    if (!inst.ok()) {
        return failed("install " + source.string() + " -> " + destination.string() + ": " + inst.output);
    }
    return result;
}

} // namespace hwprov
