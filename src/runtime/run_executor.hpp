#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/tryrun_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_execution_contract.hpp"

namespace tryrun::runtime {

struct ExecuteRequest {
    std::filesystem::path source_repo_path;
    protocol::RunPlan plan;
    std::uint32_t timeout_seconds = 120;
    std::size_t max_output_chars = 200000;
    std::uint32_t progress_interval_ms = 5000;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Runs the authorized commands of a plan one at a time inside a fresh sandbox
// copy of the repository. Stops at the first failure unless a timed-out help
// run of a start command has a later help-mode start command to fall back
// to. Only sandbox setup failures are returned as errors.
core::errors::Result<protocol::RunAttemptResult> execute_run_plan(
    const ExecuteRequest& request, const protocol::CommandEventSink& on_event = nullptr);

// True when the command at failed_index was a start help-mode run that timed out
// and a later authorized command is also a start help-mode run.
bool should_continue_with_fallback(protocol::CommandStep step, bool help_mode,
                                   bool timed_out, std::size_t failed_index,
                                   const std::vector<protocol::PlannedCommand>& commands);

std::string summarize_attempt(const std::vector<protocol::CommandExecution>& executions,
                              bool fallback_attempted);

}  // namespace tryrun::runtime
