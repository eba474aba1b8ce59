#include "runtime/run_executor.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include "classify/failure_classifier.hpp"
#include "core/logging/logger.hpp"
#include "runtime/step_inference.hpp"
#include "sandbox/sandbox.hpp"
#include "tools/process_runner.hpp"
#include "verify/verifier.hpp"

namespace tryrun::runtime {

using protocol::CommandEndEvent;
using protocol::CommandEventHeader;
using protocol::CommandExecution;
using protocol::CommandFallbackEvent;
using protocol::CommandProgressEvent;
using protocol::CommandStartEvent;
using protocol::CommandStep;
using protocol::PlannedCommand;
using protocol::RunAttemptResult;
using protocol::VerificationStatus;

namespace {

constexpr std::uint64_t kMaxTimeoutMs = 0xFFFFFFFFu;

std::string clamp_tail(const std::string& text, const std::size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }
    std::string snippet;
    tools::append_tail(snippet, text.data(), text.size(), max_chars);
    return snippet;
}

std::uint32_t to_timeout_ms(const std::uint32_t seconds) {
    const std::uint64_t ms = static_cast<std::uint64_t>(seconds) * 1000u;
    return static_cast<std::uint32_t>(std::min(ms, kMaxTimeoutMs));
}

void emit(const protocol::CommandEventSink& on_event, protocol::RunCommandEvent event) {
    if (on_event) {
        on_event(event);
    }
}

std::string success_summary(const std::vector<CommandExecution>& executions) {
    const auto start = std::find_if(
        executions.begin(), executions.end(),
        [](const CommandExecution& e) { return e.step == CommandStep::Start; });
    if (start == executions.end()) {
        return "Run attempt completed successfully for selected commands.";
    }
    if (start->help_mode) {
        return "Run attempt completed successfully; start command ran in help mode only "
               "(startup not verified).";
    }
    if (start->verification_status == VerificationStatus::Verified) {
        return "Run attempt completed successfully; startup verification signal was detected.";
    }
    return "Run attempt completed successfully; startup signal was not strongly verified.";
}

}  // namespace

bool should_continue_with_fallback(const CommandStep step, const bool help_mode,
                                   const bool timed_out, const std::size_t failed_index,
                                   const std::vector<PlannedCommand>& commands) {
    if (step != CommandStep::Start || !help_mode || !timed_out) {
        return false;
    }
    for (std::size_t i = failed_index + 1; i < commands.size(); ++i) {
        const auto& candidate = commands[i];
        if (!candidate.run) {
            continue;
        }
        if (infer_step(candidate.command, candidate.args) == CommandStep::Start &&
            is_help_mode(candidate.args)) {
            return true;
        }
    }
    return false;
}

std::string summarize_attempt(const std::vector<CommandExecution>& executions,
                              const bool fallback_attempted) {
    if (executions.empty()) {
        return "No commands executed in sandbox.";
    }

    const CommandExecution* last_failed = nullptr;
    for (const auto& execution : executions) {
        if (execution.classification.has_value()) {
            last_failed = &execution;
        }
    }

    if (fallback_attempted && last_failed != nullptr &&
        !executions.back().classification.has_value()) {
        return "Run attempt recovered after start timeout via fallback command.";
    }
    if (last_failed != nullptr) {
        std::string args;
        for (const auto& arg : last_failed->args) {
            args += " " + arg;
        }
        return "Run attempt failed at '" + last_failed->command + args + "'.";
    }
    return success_summary(executions);
}

core::errors::Result<RunAttemptResult> execute_run_plan(
    const ExecuteRequest& request, const protocol::CommandEventSink& on_event) {
    RunAttemptResult result;
    result.planner = request.plan;

    const auto& commands = request.plan.executable_commands;
    const std::size_t total = static_cast<std::size_t>(std::count_if(
        commands.begin(), commands.end(), [](const PlannedCommand& c) { return c.run; }));
    if (total == 0) {
        result.attempted = false;
        result.summary = "No executable commands selected by planner.";
        TRYRUN_LOG_INFO("Executor: nothing authorized to run");
        return result;
    }

    auto sandbox_result = sandbox::Sandbox::create(request.source_repo_path);
    if (core::errors::is_error(sandbox_result)) {
        return core::errors::get_error(sandbox_result);
    }
    // Destroyed on every return path below, removing the sandbox tree.
    const std::unique_ptr<sandbox::Sandbox> box =
        std::move(core::errors::get_value(sandbox_result));
    const auto repo_path = box->repo_path();

    std::size_t run_index = 0;
    bool fallback_attempted = false;

    for (std::size_t i = 0; i < commands.size(); ++i) {
        const PlannedCommand& cmd = commands[i];
        if (!cmd.run) {
            continue;
        }

        ++run_index;
        CommandEventHeader header;
        header.index = run_index;
        header.total = total;
        header.step = infer_step(cmd.command, cmd.args);
        header.command_text = protocol::format_command(cmd.command, cmd.args);
        const bool help_mode = is_help_mode(cmd.args);
        const std::string step_name = protocol::to_string(header.step);

        CommandStartEvent start_event{header};
        start_event.header.note = "running " + step_name + ": " + header.command_text;
        emit(on_event, start_event);
        TRYRUN_LOG_DEBUG("Executor: [" + std::to_string(run_index) + "/" +
                         std::to_string(total) + "] " + start_event.header.note);

        tools::ProcessRequest process;
        process.command = cmd.command;
        process.args = cmd.args;
        process.working_directory = repo_path;
        process.timeout_ms = to_timeout_ms(request.timeout_seconds);
        process.max_output_chars = request.max_output_chars;
        process.cancel_token = request.cancel_token;

        std::int64_t next_progress_ms = request.progress_interval_ms;
        if (on_event && request.progress_interval_ms > 0) {
            process.on_tick = [&](const std::int64_t elapsed_ms) {
                if (elapsed_ms < next_progress_ms) {
                    return;
                }
                next_progress_ms += request.progress_interval_ms;
                CommandProgressEvent progress{header};
                progress.elapsed_seconds =
                    std::max<std::int64_t>(1, elapsed_ms / 1000);
                progress.header.note = "running " + step_name + ": " +
                                       header.command_text + " (" +
                                       std::to_string(progress.elapsed_seconds) +
                                       "s elapsed)";
                on_event(progress);
            };
        }

        const auto started_at = std::filesystem::file_time_type::clock::now();
        const tools::ProcessCapture capture = tools::run_process(process);

        const bool success =
            !capture.timed_out && !capture.cancelled && capture.exit_code == 0;

        CommandExecution execution;
        execution.command = capture.command;
        execution.args = capture.args;
        execution.step = header.step;
        execution.help_mode = help_mode;
        execution.cwd = capture.cwd;
        execution.duration_ms = capture.duration_ms;
        execution.exit_code = capture.exit_code;
        execution.timed_out = capture.timed_out;
        execution.stdout_snippet = clamp_tail(capture.stdout_text, request.max_output_chars);
        execution.stderr_snippet = clamp_tail(capture.stderr_text, request.max_output_chars);
        if (!success) {
            execution.classification =
                classify::classify_failure(capture.stderr_text, capture.stdout_text);
            execution.probable_fixes =
                classify::probable_fixes_for_failure(execution.classification.value());
        }

        verify::VerificationInput verification_input;
        verification_input.step = header.step;
        verification_input.help_mode = help_mode;
        verification_input.success = success;
        verification_input.timed_out = capture.timed_out;
        verification_input.cancelled = capture.cancelled;
        verification_input.exit_code = capture.exit_code;
        verification_input.stdout_text = capture.stdout_text;
        verification_input.stderr_text = capture.stderr_text;
        verification_input.sandbox_repo_path = repo_path;
        verification_input.command_started_at = started_at;
        verification_input.classification = execution.classification;
        const auto verification = verify::verify_execution(verification_input);
        execution.verification_status = verification.status;
        execution.verification_evidence = verification.evidence;

        CommandEndEvent end_event{header};
        end_event.elapsed_seconds = std::max<std::int64_t>(0, capture.duration_ms / 1000);
        end_event.exit_code = capture.exit_code;
        end_event.timed_out = capture.timed_out;
        end_event.verification_status = verification.status;
        end_event.header.note = "completed " + step_name + ": " + header.command_text +
                                " -> " + protocol::to_string(verification.status);

        result.executions.push_back(std::move(execution));
        emit(on_event, end_event);
        TRYRUN_LOG_DEBUG("Executor: " + end_event.header.note + " (" +
                         protocol::to_string(result.executions.back().classification) +
                         ")");

        if (success) {
            continue;
        }
        if (capture.cancelled) {
            TRYRUN_LOG_WARN("Executor: cancelled; remaining commands skipped");
            break;
        }
        if (should_continue_with_fallback(header.step, help_mode, capture.timed_out, i,
                                          commands)) {
            fallback_attempted = true;
            CommandFallbackEvent fallback{header};
            fallback.timed_out = capture.timed_out;
            fallback.header.note =
                "start command timed out in help mode; trying fallback start command";
            emit(on_event, fallback);
            TRYRUN_LOG_DEBUG("Executor: fallback after " + header.command_text);
            continue;
        }
        break;
    }

    result.attempted = !result.executions.empty();
    result.summary = summarize_attempt(result.executions, fallback_attempted);
    TRYRUN_LOG_INFO("Executor: " + result.summary);
    return result;
}

}  // namespace tryrun::runtime
