#include <signal.h>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include "app/cli_parser.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/tryrun_errors.hpp"
#include "core/logging/logger.hpp"
#include "planner/run_planner.hpp"
#include "policy/try_run_policy.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/run_executor.hpp"
#include "scanner/key_files.hpp"
#include "session/artifact_writer.hpp"
#include "session/attempt_json.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitCommandFailed = 1;
constexpr int kExitInputError = 2;
constexpr int kExitSandboxError = 3;
constexpr int kExitArtifactError = 6;

// Set before the handlers are installed and never reset.
std::atomic_bool* g_cancel_flag = nullptr;

extern "C" void handle_stop_signal(int) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

void install_stop_handlers(std::atomic_bool* flag) {
    g_cancel_flag = flag;
    struct sigaction action {};
    action.sa_handler = handle_stop_signal;
    sigemptyset(&action.sa_mask);
    static_cast<void>(sigaction(SIGINT, &action, nullptr));
    static_cast<void>(sigaction(SIGTERM, &action, nullptr));
}

void log_error(const std::string& what, const tryrun::core::errors::TryRunError& err) {
    TRYRUN_LOG_ERROR(what + " [" + tryrun::core::errors::to_string(err.category) + "/" +
                     err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        TRYRUN_LOG_INFO("Hint: " + err.hint);
    }
}

void log_event(const tryrun::protocol::RunCommandEvent& event) {
    const auto& header = tryrun::protocol::header_of(event);
    const std::string prefix =
        "[" + std::to_string(header.index) + "/" + std::to_string(header.total) + "] ";
    std::visit(
        [&](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, tryrun::protocol::CommandFallbackEvent>) {
                TRYRUN_LOG_WARN(prefix + e.header.note);
            } else {
                TRYRUN_LOG_INFO(prefix + e.header.note);
            }
        },
        event);
}

void print_plan(const tryrun::protocol::RunPlan& plan) {
    std::cout << "Strategy: " << tryrun::protocol::to_string(plan.strategy) << "\n";
    std::cout << "Reason: " << plan.reason << "\n";
    for (const auto& cmd : plan.executable_commands) {
        std::cout << "  [" << (cmd.run ? "run " : "skip") << "] "
                  << tryrun::protocol::format_command(cmd) << "\n"
                  << "         " << cmd.why << "\n";
    }
}

void print_attempt(const tryrun::protocol::RunAttemptResult& attempt) {
    print_plan(attempt.planner);
    for (const auto& exec : attempt.executions) {
        std::cout << "- " << tryrun::protocol::format_command(exec.command, exec.args)
                  << " | " << tryrun::protocol::to_string(exec.step)
                  << " | exit "
                  << (exec.exit_code.has_value() ? std::to_string(exec.exit_code.value())
                                                 : std::string("null"))
                  << (exec.timed_out ? " (timed out)" : "") << " | "
                  << tryrun::protocol::to_string(exec.classification) << " | "
                  << tryrun::protocol::to_string(exec.verification_status) << ": "
                  << exec.verification_evidence << "\n";
        for (const auto& fix : exec.probable_fixes) {
            std::cout << "    fix: " << fix << "\n";
        }
    }
    std::cout << "Summary: " << attempt.summary << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Generate a unique Run ID for this execution
    const std::string run_id = tryrun::core::config::generate_run_id();

    // 2. Register the Run ID with the Global Logger
    tryrun::core::logging::Logger::get().set_run_id(run_id);

    // 3. Parse CLI input and return normalized input errors
    auto parsed = tryrun::app::cli::parse_and_validate(argc, argv);
    if (tryrun::core::errors::is_error(parsed)) {
        log_error("Input error", tryrun::core::errors::get_error(parsed));
        return kExitInputError;
    }

    const auto& req = tryrun::core::errors::get_value(parsed);
    if (req.verbose) {
        tryrun::core::logging::Logger::get().set_min_level(
            tryrun::core::logging::LogLevel::DEBUG);
    }
    TRYRUN_LOG_INFO("Try-run for " + req.repo_path.string());

    // 4. Policy: a present but malformed file aborts the whole run
    auto loaded_policy = tryrun::policy::load_policy(req.repo_path, req.policy_path);
    if (tryrun::core::errors::is_error(loaded_policy)) {
        log_error("Policy error", tryrun::core::errors::get_error(loaded_policy));
        return kExitInputError;
    }

    tryrun::planner::PlanRequest plan_request;
    plan_request.root_dir = req.repo_path;
    plan_request.key_files = tryrun::scanner::detect_key_files(req.repo_path);
    plan_request.timeout_seconds = req.timeout_seconds;
    plan_request.allow_python = req.allow_python;
    plan_request.policy = tryrun::core::errors::get_value(loaded_policy);
    const auto plan = tryrun::planner::build_run_plan(plan_request);

    if (req.command == tryrun::protocol::CliCommand::Plan) {
        if (req.json_output) {
            std::cout << tryrun::session::dump_json(tryrun::session::plan_to_json(plan), 2)
                      << std::endl;
        } else {
            print_plan(plan);
        }
        return kExitOk;
    }

    tryrun::session::ArtifactWriter artifact_writer(req.artifacts_dir);
    auto request_artifact = artifact_writer.write_request(run_id, req);
    if (tryrun::core::errors::is_error(request_artifact)) {
        log_error("Failed to write request artifact",
                  tryrun::core::errors::get_error(request_artifact));
        return kExitArtifactError;
    }
    auto plan_artifact = artifact_writer.write_plan(run_id, plan);
    if (tryrun::core::errors::is_error(plan_artifact)) {
        log_error("Failed to write plan artifact",
                  tryrun::core::errors::get_error(plan_artifact));
        return kExitArtifactError;
    }

    // 5. Execute in a sandbox; Ctrl-C kills the running command and still
    //    lets the sandbox be removed.
    auto cancel_token = std::make_shared<std::atomic_bool>(false);
    install_stop_handlers(cancel_token.get());

    tryrun::runtime::ExecuteRequest execute_request;
    execute_request.source_repo_path = req.repo_path;
    execute_request.plan = plan;
    execute_request.timeout_seconds = req.timeout_seconds;
    execute_request.max_output_chars = req.max_output_chars;
    execute_request.cancel_token = cancel_token;

    auto executed = tryrun::runtime::execute_run_plan(execute_request, log_event);
    if (tryrun::core::errors::is_error(executed)) {
        log_error("Execution failed", tryrun::core::errors::get_error(executed));
        return kExitSandboxError;
    }
    const auto& attempt = tryrun::core::errors::get_value(executed);

    // 6. Artifacts
    for (const auto& execution : attempt.executions) {
        auto written = artifact_writer.write_execution(run_id, execution);
        if (tryrun::core::errors::is_error(written)) {
            log_error("Failed to write execution artifact",
                      tryrun::core::errors::get_error(written));
            return kExitArtifactError;
        }
    }
    auto final_artifact = artifact_writer.write_final(run_id, attempt);
    if (tryrun::core::errors::is_error(final_artifact)) {
        log_error("Failed to write final artifact",
                  tryrun::core::errors::get_error(final_artifact));
        return kExitArtifactError;
    }
    auto attempt_artifact = artifact_writer.write_attempt(run_id, attempt);
    if (tryrun::core::errors::is_error(attempt_artifact)) {
        log_error("Failed to write attempt artifact",
                  tryrun::core::errors::get_error(attempt_artifact));
        return kExitArtifactError;
    }
    TRYRUN_LOG_INFO("Artifacts: " +
                    tryrun::core::errors::get_value(final_artifact).string() + ", " +
                    tryrun::core::errors::get_value(attempt_artifact).string());

    // 7. Output
    if (req.json_output) {
        std::cout << tryrun::session::dump_json(tryrun::session::attempt_to_json(attempt), 2)
                  << std::endl;
    } else {
        print_attempt(attempt);
    }

    // A timed-out help-mode run recovered by a later fallback does not count.
    if (!attempt.executions.empty() &&
        attempt.executions.back().classification.has_value()) {
        return kExitCommandFailed;
    }
    return kExitOk;
}
