#include "pipeline.hpp"

#include <exception>
#include <ostream>
#include <utility>

#include <spdlog/spdlog.h>

namespace hwprov {

const char* step_state_name(StepState s) {
    switch (s) {
        case StepState::Pending: return "pending";
        case StepState::Confirmed: return "confirmed";
        case StepState::Running: return "running";
        case StepState::Succeeded: return "succeeded";
        case StepState::PartiallyFailed: return "partially failed";
        case StepState::Failed: return "failed";
        case StepState::Skipped: return "skipped";
    }
    return "unknown";
}

StepResult step_succeeded(std::string summary) {
    StepResult r;
    r.state = StepState::Succeeded;
    r.summary = std::move(summary);
    return r;
}

StepResult step_skipped(std::string summary) {
    StepResult r;
    r.state = StepState::Skipped;
    r.summary = std::move(summary);
    return r;
}

StepResult step_failed(std::string error) {
    StepResult r;
    r.state = StepState::Failed;
    r.summary = error;
    r.errors.push_back(std::move(error));
    return r;
}

StepResult step_from_items(std::string summary, std::vector<std::string> errors, size_t items_ok) {
    StepResult r;
    r.summary = std::move(summary);
    if (errors.empty()) {
        r.state = StepState::Succeeded;
    } else {
        r.state = items_ok > 0 ? StepState::PartiallyFailed : StepState::Failed;
    }
    r.errors = std::move(errors);
    return r;
}

std::vector<std::string> StepContext::privileged(std::vector<std::string> argv) const {
    if (use_sudo) argv.insert(argv.begin(), "sudo");
    return argv;
}

size_t RunReport::count(StepState s) const {
    size_t n = 0;
    for (const StepRecord& r : records) {
        if (r.result.state == s) ++n;
    }
    return n;
}

bool RunReport::fully_succeeded() const {
    return count(StepState::Failed) == 0 && count(StepState::PartiallyFailed) == 0;
}

Orchestrator::Orchestrator(std::vector<ProvisioningStep> steps) : steps_(std::move(steps)) {}

StepResult Orchestrator::run_step(const ProvisioningStep& step, StepContext& ctx) const {
    spdlog::debug("{}: {}", step.name, step_state_name(StepState::Pending));

    if (step.confirmable && !ctx.prompter.confirm(step.description + "?")) {
        return step_skipped("declined by operator");
    }
    spdlog::debug("{}: {}", step.name, step_state_name(StepState::Confirmed));

    spdlog::info("==> {}", step.description);
    spdlog::debug("{}: {}", step.name, step_state_name(StepState::Running));

    if (!step.action) return step_failed("step has no action");

    try {
        return step.action(ctx);
    } catch (const std::exception& ex) {
        return step_failed(std::string("unexpected error: ") + ex.what());
    }
}

RunReport Orchestrator::run(StepContext& ctx) const {
    RunReport report;

    for (const ProvisioningStep& step : steps_) {
        StepResult result = run_step(step, ctx);

        switch (result.state) {
            case StepState::Succeeded:
                spdlog::info("{}: {}", step.name, result.summary);
                break;
            case StepState::Skipped:
                spdlog::info("{}: skipped ({})", step.name, result.summary);
                break;
            case StepState::PartiallyFailed:
            case StepState::Failed:
                spdlog::error("{}: {} ({})", step.name, step_state_name(result.state), result.summary);
                for (const std::string& e : result.errors) spdlog::error("  {}", e);
                break;
            default:
                // An action must finish in a terminal state.
                result = step_failed("step returned non-terminal state " +
                                     std::string(step_state_name(result.state)));
                spdlog::error("{}: {}", step.name, result.summary);
                break;
        }

        report.records.push_back({step.name, std::move(result)});
    }
    return report;
}

void print_summary(const RunReport& report, std::ostream& out) {
    out << "\nProvisioning summary\n";
    for (const StepRecord& r : report.records) {
        out << "  " << r.name << ": " << step_state_name(r.result.state);
        if (!r.result.summary.empty()) out << " - " << r.result.summary;
        out << "\n";
    }

    out << "\n"
        << report.count(StepState::Succeeded) << " succeeded, "
        << report.count(StepState::Skipped) << " skipped, "
        << report.count(StepState::PartiallyFailed) << " partially failed, "
        << report.count(StepState::Failed) << " failed\n";

    if (report.fully_succeeded()) return;

    out << "\nNeeds attention:\n";
    for (const StepRecord& r : report.records) {
        if (r.result.state != StepState::Failed && r.result.state != StepState::PartiallyFailed) continue;
        for (const std::string& e : r.result.errors) {
            out << "  [" << r.name << "] " << e << "\n";
        }
    }
}

} // namespace hwprov
