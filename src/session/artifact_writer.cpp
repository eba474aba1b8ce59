#include "session/artifact_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "session/attempt_json.hpp"

namespace tryrun::session {

using core::errors::ErrorCategory;
using core::errors::TryRunError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json make_event(const std::string& kind, const std::string& run_id, json payload) {
    json event;
    event["tsUnixMs"] = now_unix_ms();
    event["event"] = kind;
    event["runId"] = run_id;
    event["payload"] = std::move(payload);
    return event;
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path artifacts_dir)
    : artifacts_dir_(std::move(artifacts_dir)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::artifact_path(
    const std::string& run_id, const std::string& suffix) const {
    if (!core::config::is_valid_run_id(run_id)) {
        return TryRunError{ErrorCategory::Input, "Invalid run ID: '" + run_id + "'",
                           "invalid_run_id"};
    }

    std::error_code ec;
    if (std::filesystem::exists(artifacts_dir_, ec) &&
        !std::filesystem::is_directory(artifacts_dir_, ec)) {
        return TryRunError{ErrorCategory::Input,
                           "Artifacts path is not a directory: " + artifacts_dir_.string(),
                           "invalid_artifacts_dir"};
    }

    std::filesystem::create_directories(artifacts_dir_, ec);
    if (ec) {
        return TryRunError{ErrorCategory::Internal,
                           "Unable to create artifacts directory: " +
                               artifacts_dir_.string(),
                           "artifact_dir_create_failed"};
    }

    return artifacts_dir_ / (run_id + suffix);
}

core::errors::Result<std::filesystem::path> ArtifactWriter::run_log_path(
    const std::string& run_id) const {
    return artifact_path(run_id, ".jsonl");
}

core::errors::Result<std::filesystem::path> ArtifactWriter::append_event(
    const std::string& run_id, const std::string& event_json) const {
    auto run_path_result = run_log_path(run_id);
    if (core::errors::is_error(run_path_result)) {
        return core::errors::get_error(run_path_result);
    }
    const auto run_path = core::errors::get_value(run_path_result);

    std::ofstream out(run_path, std::ios::app);
    if (!out.is_open()) {
        return TryRunError{ErrorCategory::Internal,
                           "Unable to open artifact file: " + run_path.string(),
                           "artifact_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return TryRunError{ErrorCategory::Internal,
                           "Unable to write artifact event: " + run_path.string(),
                           "artifact_write_failed"};
    }

    return run_path;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_request(
    const std::string& run_id, const protocol::TryRunRequest& request) const {
    return append_event(run_id,
                        dump_json(make_event("request", run_id, request_to_json(request))));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_plan(
    const std::string& run_id, const protocol::RunPlan& plan) const {
    return append_event(run_id, dump_json(make_event("plan", run_id, plan_to_json(plan))));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_execution(
    const std::string& run_id, const protocol::CommandExecution& execution) const {
    return append_event(
        run_id, dump_json(make_event("execution", run_id, execution_to_json(execution))));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_final(
    const std::string& run_id, const protocol::RunAttemptResult& attempt) const {
    std::size_t failed = 0;
    for (const auto& execution : attempt.executions) {
        if (execution.classification.has_value()) {
            ++failed;
        }
    }

    json payload;
    payload["attempted"] = attempt.attempted;
    payload["executions"] = attempt.executions.size();
    payload["failed"] = failed;
    payload["summary"] = attempt.summary;
    return append_event(run_id, dump_json(make_event("final", run_id, payload)));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_attempt(
    const std::string& run_id, const protocol::RunAttemptResult& attempt) const {
    auto path_result = artifact_path(run_id, ".run-attempt.json");
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return TryRunError{ErrorCategory::Internal,
                           "Unable to open attempt file: " + path.string(),
                           "artifact_open_failed"};
    }

    out << dump_json(attempt_to_json(attempt), 2) << "\n";
    if (!out.good()) {
        return TryRunError{ErrorCategory::Internal,
                           "Unable to write attempt file: " + path.string(),
                           "artifact_write_failed"};
    }
    return path;
}

}  // namespace tryrun::session
