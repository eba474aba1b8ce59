#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol/run_plan_contract.hpp"

namespace tryrun::protocol {

enum class CommandStep {
    Install,
    Test,
    Build,
    Start,
    Lint,
    Run
};

enum class VerificationStatus {
    Verified,
    Partial,
    Failed,
    Skipped
};

enum class RunFailureClass {
    MissingEnv,
    MissingDeps,
    PortConflict,
    TestFail,
    Permission,
    Unknown
};

// An empty classification means the command succeeded.
using Classification = std::optional<RunFailureClass>;

struct CommandExecution {
    std::string command;
    std::vector<std::string> args;
    CommandStep step = CommandStep::Run;
    bool help_mode = false;
    std::string cwd;
    std::int64_t duration_ms = 0;
    // Empty when the process died from a signal; -1 when it never spawned.
    std::optional<int> exit_code;
    bool timed_out = false;
    std::string stdout_snippet;
    std::string stderr_snippet;
    Classification classification;
    VerificationStatus verification_status = VerificationStatus::Skipped;
    std::string verification_evidence;
    std::vector<std::string> probable_fixes;
};

struct RunAttemptResult {
    bool attempted = false;
    RunPlan planner;
    std::vector<CommandExecution> executions;
    std::string summary;
};

inline std::string to_string(const CommandStep step) {
    switch (step) {
        case CommandStep::Install:
            return "install";
        case CommandStep::Test:
            return "test";
        case CommandStep::Build:
            return "build";
        case CommandStep::Start:
            return "start";
        case CommandStep::Lint:
            return "lint";
        case CommandStep::Run:
            return "run";
        default:
            return "unknown";
    }
}

inline std::string to_string(const VerificationStatus status) {
    switch (status) {
        case VerificationStatus::Verified:
            return "verified";
        case VerificationStatus::Partial:
            return "partial";
        case VerificationStatus::Failed:
            return "failed";
        case VerificationStatus::Skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

inline std::string to_string(const RunFailureClass failure) {
    switch (failure) {
        case RunFailureClass::MissingEnv:
            return "missing-env";
        case RunFailureClass::MissingDeps:
            return "missing-deps";
        case RunFailureClass::PortConflict:
            return "port-conflict";
        case RunFailureClass::TestFail:
            return "test-fail";
        case RunFailureClass::Permission:
            return "permission";
        case RunFailureClass::Unknown:
            return "unknown";
        default:
            return "unknown";
    }
}

inline std::string to_string(const Classification& classification) {
    return classification.has_value() ? to_string(classification.value())
                                      : "success";
}

}  // namespace tryrun::protocol
