#pragma once

#include "config.hpp"
#include "env_file.hpp"
#include "file_install.hpp"
#include "package_groups.hpp"
#include "signals.hpp"
#include "system.hpp"

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace hwprov {

// Pending -> Confirmed -> Running -> {Succeeded, Failed, PartiallyFailed};
// Skipped when the operator declines or the step finds nothing applies.
enum class StepState {
    Pending,
    Confirmed,
    Running,
    Succeeded,
    PartiallyFailed,
    Failed,
    Skipped
};

const char* step_state_name(StepState s);

struct StepResult {
    StepState state = StepState::Succeeded;
    std::string summary;
    std::vector<std::string> errors;   // one line per problem, enough to retry by hand
};

StepResult step_succeeded(std::string summary);
StepResult step_skipped(std::string summary);
StepResult step_failed(std::string error);

// Succeeded when `errors` is empty, PartiallyFailed when some items still
// went through, Failed otherwise.
StepResult step_from_items(std::string summary, std::vector<std::string> errors, size_t items_ok);

// Everything a step may touch. Collaborators are borrowed; the caller owns them.
struct StepContext {
    const ProvisionConfig& config;
    CommandRunner& runner;
    PackageManager& packages;
    PackageManager& aur;
    ServiceControl& services;
    Prompter& prompter;
    FileInstaller& user_files;     // destinations under $HOME
    FileInstaller& system_files;   // destinations under /etc and friends

    bool use_sudo = false;
    bool interactive = true;
    std::optional<KernelChoice> kernel_override;

    // Signal source for detect-hardware; collect_signals() on the live system when unset.
    std::function<RawSignals()> collect;

    // The persisted profile, re-read through the safe loader on every call.
    ProfileParseResult load_profile() const { return load_profile_env(config.state_file); }

    std::vector<std::string> privileged(std::vector<std::string> argv) const;
};

struct ProvisioningStep {
    std::string name;
    std::string description;
    bool confirmable = true;
    std::function<StepResult(StepContext&)> action;
};

struct StepRecord {
    std::string name;
    StepResult result;
};

struct RunReport {
    std::vector<StepRecord> records;

    size_t count(StepState s) const;
    bool fully_succeeded() const;   // nothing Failed or PartiallyFailed
};

// Runs every step in order. A failing or throwing step is recorded and the
// run moves on to the next one.
class Orchestrator {
public:
    explicit Orchestrator(std::vector<ProvisioningStep> steps);

    RunReport run(StepContext& ctx) const;
    const std::vector<ProvisioningStep>& steps() const { return steps_; }

private:
    StepResult run_step(const ProvisioningStep& step, StepContext& ctx) const;

    std::vector<ProvisioningStep> steps_;
};

void print_summary(const RunReport& report, std::ostream& out);

} // namespace hwprov
