#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace hwprov {

struct CommandResult {
    bool started = false;   // false when the program could not be executed at all
    int exit_code = -1;
    std::string output;     // stdout and stderr, interleaved

    bool ok() const { return started && exit_code == 0; }
};

std::string describe_command(const std::vector<std::string>& argv);

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp with a pipe; blocks until the child exits.
class PosixCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv) override;
};

bool running_as_root();

class PackageManager {
public:
    virtual ~PackageManager() = default;

    virtual bool available() = 0;
    virtual CommandResult sync_database() = 0;
    virtual CommandResult install(const std::string& package) = 0;   // no-op if already present
    virtual bool is_installed(const std::string& package) = 0;
    virtual bool exists(const std::string& package) = 0;             // in any enabled source
};

// pacman, or a pacman-compatible AUR helper (paru, yay) when `program` says so.
class PacmanPackageManager : public PackageManager {
public:
    PacmanPackageManager(CommandRunner& runner, std::string program, bool use_sudo);

    bool available() override;
    CommandResult sync_database() override;
    CommandResult install(const std::string& package) override;
    bool is_installed(const std::string& package) override;
    bool exists(const std::string& package) override;

private:
    std::vector<std::string> privileged(std::vector<std::string> argv) const;

    CommandRunner& runner_;
    std::string program_;
    bool use_sudo_;
};

enum class ServiceScope {
    System,
    User
};

class ServiceControl {
public:
    virtual ~ServiceControl() = default;

    virtual bool is_enabled(const std::string& unit, ServiceScope scope) = 0;
    virtual CommandResult enable(const std::string& unit, ServiceScope scope) = 0;
    virtual CommandResult daemon_reload(ServiceScope scope) = 0;
};

class SystemctlServiceControl : public ServiceControl {
public:
    SystemctlServiceControl(CommandRunner& runner, bool use_sudo);

    bool is_enabled(const std::string& unit, ServiceScope scope) override;
    CommandResult enable(const std::string& unit, ServiceScope scope) override;
    CommandResult daemon_reload(ServiceScope scope) override;

private:
    std::vector<std::string> command(ServiceScope scope, std::vector<std::string> args) const;

    CommandRunner& runner_;
    bool use_sudo_;
};

// Operator confirmation for a step.
class Prompter {
public:
    virtual ~Prompter() = default;
    virtual bool confirm(const std::string& question) = 0;
};

// Asks on a stream until it gets y/yes or n/no. End of input counts as "no".
class StreamPrompter : public Prompter {
public:
    StreamPrompter(std::istream& in, std::ostream& out);
    bool confirm(const std::string& question) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

// Same answer to every question (--yes, or tests).
class FixedPrompter : public Prompter {
public:
    explicit FixedPrompter(bool answer) : answer_(answer) {}
    bool confirm(const std::string&) override { return answer_; }

private:
    bool answer_;
};

} // namespace hwprov
