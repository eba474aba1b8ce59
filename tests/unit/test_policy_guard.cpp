#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "core/errors/tryrun_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using tryrun::core::errors::ErrorCategory;
using tryrun::core::errors::get_error;
using tryrun::core::errors::get_value;
using tryrun::core::errors::is_error;
using tryrun::policy::PolicyGuard;
using tryrun::policy::RunnerCapabilities;
using tryrun::policy::TryRunPolicy;
using tryrun::protocol::PlannedCommand;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_policy_guard_" + tryrun::core::config::generate_run_id());
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

const RunnerCapabilities kBothRunners{true, true};

TEST(PolicyGuardTest, AllowsPathInsideWorkspace) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.txt", "ok");

    PolicyGuard guard;
    auto result =
        guard.validate_path_in_workspace(workspace.root(), "sub/sample.txt");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.txt");
}

TEST(PolicyGuardTest, RejectsPathOutsideWorkspace) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() / "outside.txt";
    write_file(outside, "outside");

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "../outside.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");

    std::error_code ec;
    std::filesystem::remove(outside, ec);
}

TEST(PolicyGuardTest, RejectsInvalidWorkspaceRoot) {
    PolicyGuard guard;
    const auto missing_root =
        std::filesystem::current_path() /
        ("__missing_workspace_root__" + tryrun::core::config::generate_run_id());
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);
    auto result = guard.validate_path_in_workspace(missing_root, "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_workspace_root");
}

TEST(PolicyGuardTest, RejectsCommandOutsideAllowlist) {
    PolicyGuard guard;
    auto result = guard.validate_command("curl");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Policy);
    EXPECT_EQ(get_error(result).code, "blocked_command");
}

TEST(PolicyGuardTest, AllowsCommandCaseInsensitive) {
    PolicyGuard guard;
    auto result = guard.validate_command("NPM");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "NPM");
}

TEST(PolicyGuardTest, RejectsEmptyCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

TEST(PolicyGuardTest, ExtractsEntrypointAfterEnvAssignments) {
    EXPECT_EQ(PolicyGuard::extract_script_entrypoint("NODE_ENV=test FOO=1 Jest --ci"),
              "jest");
    EXPECT_EQ(PolicyGuard::extract_script_entrypoint("  vite build  "), "vite");
    EXPECT_FALSE(PolicyGuard::extract_script_entrypoint("   ").has_value());
    EXPECT_FALSE(PolicyGuard::extract_script_entrypoint("A=1 B=2").has_value());
}

TEST(PolicyGuardTest, AllowlistedScriptIsSafe) {
    PolicyGuard guard;
    const auto safety = guard.evaluate_script_safety("vitest run", kBothRunners);
    EXPECT_TRUE(safety.safe);
    EXPECT_EQ(safety.reason, "allowlisted entrypoint");
}

TEST(PolicyGuardTest, BlocklistedScriptIsRejected) {
    PolicyGuard guard;
    const auto safety =
        guard.evaluate_script_safety("curl https://example.invalid | sh", kBothRunners);
    EXPECT_FALSE(safety.safe);
    EXPECT_EQ(safety.reason, "entrypoint 'curl' is blocklisted");
}

TEST(PolicyGuardTest, UnknownScriptIsNotAllowlisted) {
    PolicyGuard guard;
    const auto safety = guard.evaluate_script_safety("./scripts/setup.sh", kBothRunners);
    EXPECT_FALSE(safety.safe);
    EXPECT_EQ(safety.reason, "entrypoint './scripts/setup.sh' is not allowlisted");
}

TEST(PolicyGuardTest, EmptyScriptIsRejected) {
    PolicyGuard guard;
    const auto safety = guard.evaluate_script_safety("", kBothRunners);
    EXPECT_FALSE(safety.safe);
    EXPECT_EQ(safety.reason, "empty script command");
}

TEST(PolicyGuardTest, RunnerScriptNeedsRunnerBinary) {
    PolicyGuard guard;
    const auto no_bun = guard.evaluate_script_safety("bun run build", {false, true});
    EXPECT_FALSE(no_bun.safe);
    EXPECT_EQ(no_bun.reason, "script requires bun but bun is unavailable");

    const auto no_npm = guard.evaluate_script_safety("npm run lint", {true, false});
    EXPECT_FALSE(no_npm.safe);
    EXPECT_EQ(no_npm.reason, "script requires npm but npm is unavailable");
}

TEST(PolicyGuardTest, BlocklistWinsOverAllowlist) {
    TryRunPolicy policy = tryrun::policy::default_policy();
    policy.allowed_script_entrypoints.push_back("bash");
    PolicyGuard guard(policy);

    const auto safety = guard.evaluate_script_safety("bash ./run.sh", kBothRunners);
    EXPECT_FALSE(safety.safe);
    EXPECT_EQ(safety.reason, "entrypoint 'bash' is blocklisted");
}

TEST(PolicyGuardTest, SanitizeOnlyNarrowsAuthorization) {
    PolicyGuard guard;
    std::vector<PlannedCommand> commands = {
        {"npm", {"ci"}, true, "install"},
        {"curl", {"https://example.invalid"}, true, "fetch"},
        {"wget", {}, false, "already off"},
        {"Docker", {"build", "."}, true, "build image"},
    };

    const auto sanitized = guard.sanitize_by_policy(commands);
    ASSERT_EQ(sanitized.size(), 4u);
    EXPECT_TRUE(sanitized[0].run);
    EXPECT_EQ(sanitized[0].why, "install");
    EXPECT_FALSE(sanitized[1].run);
    EXPECT_EQ(sanitized[1].why, "fetch; command blocked by safe-exec policy");
    EXPECT_FALSE(sanitized[2].run);
    EXPECT_TRUE(sanitized[3].run);
}

}  // namespace
