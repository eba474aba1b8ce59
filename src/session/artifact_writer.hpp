#pragma once

#include <filesystem>
#include <string>
#include "core/errors/tryrun_errors.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/run_plan_contract.hpp"
#include "protocol/run_request.hpp"

namespace tryrun::session {

// Persists one try-run as JSON lines (<run_id>.jsonl) plus the complete attempt
// document (<run_id>.run-attempt.json) under artifacts_dir.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path artifacts_dir);

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& run_id, const protocol::TryRunRequest& request) const;

    core::errors::Result<std::filesystem::path> write_plan(
        const std::string& run_id, const protocol::RunPlan& plan) const;

    core::errors::Result<std::filesystem::path> write_execution(
        const std::string& run_id, const protocol::CommandExecution& execution) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& run_id, const protocol::RunAttemptResult& attempt) const;

    core::errors::Result<std::filesystem::path> write_attempt(
        const std::string& run_id, const protocol::RunAttemptResult& attempt) const;

    core::errors::Result<std::filesystem::path> run_log_path(
        const std::string& run_id) const;

private:
    core::errors::Result<std::filesystem::path> artifact_path(
        const std::string& run_id, const std::string& suffix) const;

    core::errors::Result<std::filesystem::path> append_event(
        const std::string& run_id, const std::string& event_json) const;

    std::filesystem::path artifacts_dir_;
};

}  // namespace tryrun::session
