#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace tryrun::protocol {

    enum class CliCommand {
        Plan,   // Build and print the run plan only
        Run     // Build the plan and execute it in a sandbox
    };

    // Validated operator input for one try-run invocation
    struct TryRunRequest {
        CliCommand command = CliCommand::Run;
        std::filesystem::path repo_path = std::filesystem::current_path();
        std::uint32_t timeout_seconds = 120;
        std::size_t max_output_chars = 200000;
        bool allow_python = false;
        std::optional<std::filesystem::path> policy_path;
        std::filesystem::path artifacts_dir = std::filesystem::current_path() / ".tryrun_runs";
        bool json_output = false;
        bool verbose = false;
    };

} // namespace tryrun::protocol
