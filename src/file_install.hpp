#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace hwprov {

class CommandRunner;

enum class InstallOutcome {
    Installed,   // destination did not exist
    Replaced,    // destination existed, was backed up, then overwritten
    Unchanged,   // destination already matched the source
    Failed
};

const char* install_outcome_name(InstallOutcome o);

struct FileInstallResult {
    InstallOutcome outcome = InstallOutcome::Failed;
    std::filesystem::path backup;   // set for Replaced
    std::string error;              // set for Failed

    bool changed() const { return outcome == InstallOutcome::Installed || outcome == InstallOutcome::Replaced; }
};

// "20250908_234501"
std::string backup_timestamp(std::chrono::system_clock::time_point when);

// "<dest>.bak.<stamp>", with "-N" appended if that name is already taken.
std::filesystem::path backup_path_for(const std::filesystem::path& destination, const std::string& stamp);

bool files_identical(const std::filesystem::path& a, const std::filesystem::path& b);

// Copies one file into place. An existing, different destination is always
// copied aside first; if that backup fails the destination is left untouched.
class FileInstaller {
public:
    virtual ~FileInstaller() = default;
    virtual FileInstallResult install(const std::filesystem::path& source,
                                      const std::filesystem::path& destination,
                                      bool executable) = 0;
};

class LocalFileInstaller : public FileInstaller {
public:
    explicit LocalFileInstaller(std::string backup_stamp);

    FileInstallResult install(const std::filesystem::path& source,
                              const std::filesystem::path& destination,
                              bool executable) override;

private:
    std::string stamp_;
};

// For destinations the current user cannot write (/etc/...): the same steps
// through `sudo cp` / `sudo install`.
class ElevatedFileInstaller : public FileInstaller {
public:
    ElevatedFileInstaller(CommandRunner& runner, std::string backup_stamp);

    FileInstallResult install(const std::filesystem::path& source,
                              const std::filesystem::path& destination,
                              bool executable) override;

private:
    CommandRunner& runner_;
    std::string stamp_;
};

} // namespace hwprov
