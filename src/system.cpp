#include "system.hpp"

#include "text_util.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <istream>
#include <ostream>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace hwprov {

std::string describe_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const std::string& arg : argv) {
        if (!out.empty()) out += ' ';
        if (arg.find_first_of(" \t'\"") != std::string::npos) {
            out += '\'' + arg + '\'';
        } else {
            out += arg;
        }
    }
    return out;
}

CommandResult PosixCommandRunner::run(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) return result;

    spdlog::debug("exec: {}", describe_command(argv));

    int fds[2];
    if (::pipe(fds) != 0) {
        result.output = std::string("pipe: ") + std::strerror(errno);
        return result;
    }
    // Carries errno from a failed execvp; closed by a successful exec.
    int exec_fds[2];
    if (::pipe2(exec_fds, O_CLOEXEC) != 0) {
        result.output = std::string("pipe: ") + std::strerror(errno);
        ::close(fds[0]);
        ::close(fds[1]);
        return result;
    }

    std::vector<char*> args;
    for (const std::string& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.output = std::string("fork: ") + std::strerror(errno);
        ::close(fds[0]);
        ::close(fds[1]);
        ::close(exec_fds[0]);
        ::close(exec_fds[1]);
        return result;
    }

    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        ::close(exec_fds[0]);
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(exec_fds[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(fds[1]);
    ::close(exec_fds[1]);

    std::array<char, 4096> buf{};
    for (;;) {
        ssize_t n = ::read(fds[0], buf.data(), buf.size());
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        result.output.append(buf.data(), (size_t)n);
    }
    ::close(fds[0]);

    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_fds[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    ::close(exec_fds[0]);
    const bool exec_failed = got == (ssize_t)sizeof(exec_errno);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.output += std::string("waitpid: ") + std::strerror(errno);
            return result;
        }
    }

    if (exec_failed) {
        result.started = false;
        result.exit_code = 127;
        result.output = std::string(argv[0]) + ": " + std::strerror(exec_errno);
    } else if (WIFEXITED(status)) {
        result.started = true;
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.started = true;
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (!result.started) {
        spdlog::debug("exec: {} could not be started", argv[0]);
    } else if (result.exit_code != 0) {
        spdlog::debug("exec: {} exited with {}", argv[0], result.exit_code);
    }
    return result;
}

bool running_as_root() {
    return ::geteuid() == 0;
}

// ---------- pacman ----------

PacmanPackageManager::PacmanPackageManager(CommandRunner& runner, std::string program, bool use_sudo)
    : runner_(runner), program_(std::move(program)), use_sudo_(use_sudo) {}

std::vector<std::string> PacmanPackageManager::privileged(std::vector<std::string> argv) const {
    if (use_sudo_) argv.insert(argv.begin(), "sudo");
    return argv;
}

bool PacmanPackageManager::available() {
    return runner_.run({program_, "--version"}).ok();
}

CommandResult PacmanPackageManager::sync_database() {
    return runner_.run(privileged({program_, "-Sy", "--noconfirm"}));
}

CommandResult PacmanPackageManager::install(const std::string& package) {
    return runner_.run(privileged({program_, "-S", "--needed", "--noconfirm", package}));
}

bool PacmanPackageManager::is_installed(const std::string& package) {
    return runner_.run({program_, "-Q", package}).ok();
}

bool PacmanPackageManager::exists(const std::string& package) {
    return runner_.run({program_, "-Si", package}).ok();
}

// ---------- systemctl ----------

SystemctlServiceControl::SystemctlServiceControl(CommandRunner& runner, bool use_sudo)
    : runner_(runner), use_sudo_(use_sudo) {}

std::vector<std::string> SystemctlServiceControl::command(ServiceScope scope, std::vector<std::string> args) const {
    std::vector<std::string> argv;
    if (scope == ServiceScope::System && use_sudo_) argv.push_back("sudo");
    argv.push_back("systemctl");
    if (scope == ServiceScope::User) argv.push_back("--user");
    for (std::string& a : args) argv.push_back(std::move(a));
    return argv;
}

bool SystemctlServiceControl::is_enabled(const std::string& unit, ServiceScope scope) {
    // Read-only query, never needs sudo.
    std::vector<std::string> argv = {"systemctl"};
    if (scope == ServiceScope::User) argv.push_back("--user");
    argv.insert(argv.end(), {"is-enabled", "--quiet", unit});
    return runner_.run(argv).ok();
}

CommandResult SystemctlServiceControl::enable(const std::string& unit, ServiceScope scope) {
    return runner_.run(command(scope, {"enable", unit}));
}

CommandResult SystemctlServiceControl::daemon_reload(ServiceScope scope) {
    return runner_.run(command(scope, {"daemon-reload"}));
}

// ---------- prompts ----------

StreamPrompter::StreamPrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

bool StreamPrompter::confirm(const std::string& question) {
    std::string response;
    while (true) {
        out_ << question << " (y/n): " << std::flush;
        if (!std::getline(in_, response)) {
            out_ << "\n";
            return false;
        }
        std::string r = to_lower(trim(response));
        if (r == "y" || r == "yes") return true;
        if (r == "n" || r == "no") return false;
        out_ << "Please answer yes (y) or no (n).\n";
    }
}

} // namespace hwprov
