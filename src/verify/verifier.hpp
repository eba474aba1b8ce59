#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "protocol/run_execution_contract.hpp"

namespace tryrun::verify {

struct VerificationInput {
    protocol::CommandStep step = protocol::CommandStep::Run;
    bool help_mode = false;
    bool success = false;
    bool timed_out = false;
    bool cancelled = false;
    std::optional<int> exit_code;
    std::string stdout_text;
    std::string stderr_text;
    std::filesystem::path sandbox_repo_path;
    std::filesystem::file_time_type command_started_at{};
    protocol::Classification classification;
};

struct VerificationResult {
    protocol::VerificationStatus status = protocol::VerificationStatus::Failed;
    std::string evidence;
};

// Judges one finished command. The evidence string is never empty.
VerificationResult verify_execution(const VerificationInput& input);

// First port found in address:port, "listening on port N" or "port N" form.
std::optional<std::string> detect_port(const std::string& output);

// A build output directory (dist, build, out, .next, target) modified no
// earlier than one second before started_at, as "<name>/".
std::optional<std::string> detect_build_artifact(
    const std::filesystem::path& repo_path,
    std::filesystem::file_time_type started_at);

}  // namespace tryrun::verify
