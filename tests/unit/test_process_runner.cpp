#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "tools/process_runner.hpp"

namespace {

using tryrun::tools::append_tail;
using tryrun::tools::ProcessRequest;
using tryrun::tools::run_process;

ProcessRequest shell(const std::string& script, std::uint32_t timeout_ms = 5000) {
    ProcessRequest request;
    request.command = "sh";
    request.args = {"-c", script};
    request.working_directory = std::filesystem::current_path();
    request.timeout_ms = timeout_ms;
    return request;
}

TEST(ProcessRunnerTest, CapturesStdoutStderrAndExitCode) {
    const auto capture = run_process(shell("echo out; echo err 1>&2; exit 3"));
    ASSERT_TRUE(capture.exit_code.has_value());
    EXPECT_EQ(capture.exit_code.value(), 3);
    EXPECT_FALSE(capture.timed_out);
    EXPECT_FALSE(capture.spawn_failed);
    EXPECT_EQ(capture.stdout_text, "out\n");
    EXPECT_EQ(capture.stderr_text, "err\n");
    EXPECT_EQ(capture.command, "sh");
    EXPECT_GE(capture.duration_ms, 0);
}

TEST(ProcessRunnerTest, RunsInWorkingDirectory) {
    auto request = shell("pwd");
    request.working_directory = std::filesystem::temp_directory_path();
    const auto capture = run_process(request);
    ASSERT_EQ(capture.exit_code, 0);
    EXPECT_TRUE(std::filesystem::equivalent(
        std::filesystem::path(capture.stdout_text.substr(0, capture.stdout_text.size() - 1)),
        std::filesystem::temp_directory_path()));
}

TEST(ProcessRunnerTest, StdinIsEmpty) {
    const auto capture = run_process(shell("cat; echo done"));
    ASSERT_EQ(capture.exit_code, 0);
    EXPECT_EQ(capture.stdout_text, "done\n");
}

TEST(ProcessRunnerTest, ArgumentsAreNotShellExpanded) {
    ProcessRequest request;
    request.command = "echo";
    request.args = {"$HOME", "a;b"};
    const auto capture = run_process(request);
    ASSERT_EQ(capture.exit_code, 0);
    EXPECT_EQ(capture.stdout_text, "$HOME a;b\n");
}

TEST(ProcessRunnerTest, MissingBinaryIsSpawnFailure) {
    ProcessRequest request;
    request.command = "definitely-not-a-real-binary-tryrun";
    const auto capture = run_process(request);
    EXPECT_TRUE(capture.spawn_failed);
    ASSERT_TRUE(capture.exit_code.has_value());
    EXPECT_EQ(capture.exit_code.value(), -1);
    EXPECT_FALSE(capture.timed_out);
    EXPECT_NE(capture.stderr_text.find("spawn definitely-not-a-real-binary-tryrun failed"),
              std::string::npos);
    EXPECT_NE(capture.stderr_text.find("No such file or directory"), std::string::npos);
}

TEST(ProcessRunnerTest, TimeoutTerminatesProcess) {
    const auto capture = run_process(shell("sleep 10", 300));
    EXPECT_TRUE(capture.timed_out);
    EXPECT_FALSE(capture.exit_code.has_value());
    EXPECT_LT(capture.duration_ms, 5000);
}

TEST(ProcessRunnerTest, IgnoredTermIsEscalatedToKill) {
    const auto capture =
        run_process(shell("trap '' TERM; while true; do sleep 1; done", 300));
    EXPECT_TRUE(capture.timed_out);
    EXPECT_FALSE(capture.exit_code.has_value());
    const auto grace = static_cast<std::int64_t>(tryrun::tools::kKillGraceMs);
    EXPECT_GE(capture.duration_ms, 300 + grace - 100);
    EXPECT_LT(capture.duration_ms, 300 + grace + 3000);
}

TEST(ProcessRunnerTest, OutputIsTailTruncated) {
    auto request = shell("i=0; while [ $i -lt 500 ]; do echo line$i; i=$((i+1)); done");
    request.max_output_chars = 64;
    const auto capture = run_process(request);
    ASSERT_EQ(capture.exit_code, 0);
    EXPECT_LE(capture.stdout_text.size(), 64u);
    EXPECT_NE(capture.stdout_text.find("line499\n"), std::string::npos);
    EXPECT_EQ(capture.stdout_text.find("line0\n"), std::string::npos);
}

TEST(ProcessRunnerTest, CancelTokenKillsProcess) {
    auto request = shell("sleep 10", 0);
    request.cancel_token = std::make_shared<std::atomic_bool>(false);
    auto token = request.cancel_token;
    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token->store(true);
    });
    const auto capture = run_process(request);
    canceller.join();

    EXPECT_TRUE(capture.cancelled);
    EXPECT_FALSE(capture.timed_out);
    EXPECT_FALSE(capture.exit_code.has_value());
    EXPECT_NE(capture.stderr_text.find("Command cancelled."), std::string::npos);
}

TEST(ProcessRunnerTest, CancelledBeforeStartDoesNotSpawn) {
    auto request = shell("echo never");
    request.cancel_token = std::make_shared<std::atomic_bool>(true);
    const auto capture = run_process(request);
    EXPECT_TRUE(capture.cancelled);
    EXPECT_TRUE(capture.stdout_text.empty());
    EXPECT_EQ(capture.stderr_text, "Command cancelled before start.");
}

TEST(ProcessRunnerTest, TickCallbackReceivesElapsedTime) {
    auto request = shell("sleep 0.3");
    std::vector<std::int64_t> ticks;
    request.on_tick = [&ticks](std::int64_t elapsed_ms) { ticks.push_back(elapsed_ms); };
    const auto capture = run_process(request);
    ASSERT_EQ(capture.exit_code, 0);
    ASSERT_FALSE(ticks.empty());
    for (std::size_t i = 1; i < ticks.size(); ++i) {
        EXPECT_GE(ticks[i], ticks[i - 1]);
    }
}

TEST(AppendTailTest, KeepsLastBytes) {
    std::string buffer = "abc";
    const std::string more = "defgh";
    append_tail(buffer, more.data(), more.size(), 4);
    EXPECT_EQ(buffer, "efgh");
}

TEST(AppendTailTest, DoesNotStartInsideUtf8Sequence) {
    std::string buffer;
    // "x" followed by U+00E9 (2 bytes) and "yz"; keeping 3 bytes would start
    // on the continuation byte.
    const std::string text = "x\xC3\xA9yz";
    append_tail(buffer, text.data(), text.size(), 3);
    EXPECT_EQ(buffer, "yz");
}

}  // namespace
