#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tryrun::tools {

// Delay between the graceful SIGTERM and the forced SIGKILL on timeout.
inline constexpr std::uint32_t kKillGraceMs = 1500;

struct ProcessRequest {
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path working_directory = ".";
    // 0 disables the deadline.
    std::uint32_t timeout_ms = 120000;
    std::size_t max_output_chars = 200000;
    std::shared_ptr<std::atomic_bool> cancel_token;
    // Called from the wait loop roughly every 50 ms with elapsed time.
    std::function<void(std::int64_t elapsed_ms)> on_tick;
};

struct ProcessCapture {
    std::string command;
    std::vector<std::string> args;
    std::string cwd;
    std::int64_t duration_ms = 0;
    // Empty when the process was terminated by a signal, -1 when it could
    // not be started at all.
    std::optional<int> exit_code;
    bool timed_out = false;
    bool cancelled = false;
    bool spawn_failed = false;
    std::string stdout_text;
    std::string stderr_text;
};

// Runs command directly (no shell) in its own process group with stdin bound
// to /dev/null. Never throws and never returns an error: failures to start
// are reported inside the capture.
ProcessCapture run_process(const ProcessRequest& request);

// Appends data and keeps only the last max_chars bytes, never starting in the
// middle of a UTF-8 sequence.
void append_tail(std::string& buffer, const char* data, std::size_t size,
                 std::size_t max_chars);

}  // namespace tryrun::tools
