#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "core/errors/tryrun_errors.hpp"
#include "policy/try_run_policy.hpp"

namespace {

using tryrun::core::errors::ErrorCategory;
using tryrun::core::errors::get_error;
using tryrun::core::errors::get_value;
using tryrun::core::errors::is_error;
using tryrun::policy::default_policy;
using tryrun::policy::load_policy;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_try_run_policy_" + tryrun::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
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

TEST(TryRunPolicyTest, DefaultsWhenNoPolicyFile) {
    TempWorkspace workspace;
    auto result = load_policy(workspace.root());
    ASSERT_FALSE(is_error(result));

    const auto& policy = get_value(result);
    EXPECT_EQ(policy.source, "default");
    EXPECT_EQ(policy.script_priority,
              (std::vector<std::string>{"test", "lint", "build", "start", "dev"}));
    EXPECT_EQ(policy.allowed_commands, default_policy().allowed_commands);
    EXPECT_EQ(policy.allowed_script_entrypoints.size(), 26u);
    EXPECT_EQ(policy.blocked_script_entrypoints.size(), 8u);
}

TEST(TryRunPolicyTest, MergesInRepoPolicyFile) {
    TempWorkspace workspace;
    write_file(workspace.root() / ".tryrun/try-run-policy.json",
               R"({"allowedCommands": [" NPM ", "make", "npm", ""],
                   "scriptPriority": ["build"],
                   "unknownKey": true})");

    auto result = load_policy(workspace.root());
    ASSERT_FALSE(is_error(result));

    const auto& policy = get_value(result);
    EXPECT_NE(policy.source, "default");
    EXPECT_EQ(policy.allowed_commands, (std::vector<std::string>{"npm", "make"}));
    EXPECT_EQ(policy.script_priority, (std::vector<std::string>{"build"}));
    EXPECT_EQ(policy.blocked_script_entrypoints,
              default_policy().blocked_script_entrypoints);
}

TEST(TryRunPolicyTest, EmptyOrNonArrayFieldsFallBackToDefaults) {
    TempWorkspace workspace;
    write_file(workspace.root() / ".tryrun-try-run-policy.json",
               R"({"allowedCommands": [], "scriptPriority": "test",
                   "blockedScriptEntrypoints": ["  ", 7]})");

    auto result = load_policy(workspace.root());
    ASSERT_FALSE(is_error(result));

    const auto& policy = get_value(result);
    EXPECT_EQ(policy.allowed_commands, default_policy().allowed_commands);
    EXPECT_EQ(policy.script_priority, default_policy().script_priority);
    EXPECT_EQ(policy.blocked_script_entrypoints,
              default_policy().blocked_script_entrypoints);
}

TEST(TryRunPolicyTest, FirstConventionalLocationWins) {
    TempWorkspace workspace;
    write_file(workspace.root() / ".tryrun/try-run-policy.json",
               R"({"allowedCommands": ["docker"]})");
    write_file(workspace.root() / ".tryrun-try-run-policy.json",
               R"({"allowedCommands": ["make"]})");

    auto result = load_policy(workspace.root());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).allowed_commands, (std::vector<std::string>{"docker"}));
}

TEST(TryRunPolicyTest, WhitespaceOnlyFileCountsAsAbsent) {
    TempWorkspace workspace;
    write_file(workspace.root() / ".tryrun/try-run-policy.json", "  \n\t ");
    write_file(workspace.root() / ".tryrun-try-run-policy.json",
               R"({"allowedCommands": ["make"]})");

    auto result = load_policy(workspace.root());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).allowed_commands, (std::vector<std::string>{"make"}));
}

TEST(TryRunPolicyTest, InvalidJsonIsConfigError) {
    TempWorkspace workspace;
    write_file(workspace.root() / ".tryrun/try-run-policy.json", "{ not json");

    auto result = load_policy(workspace.root());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Config);
    EXPECT_EQ(get_error(result).code, "invalid_policy_json");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(TryRunPolicyTest, RelativeOverrideResolvesAgainstRoot) {
    TempWorkspace workspace;
    write_file(workspace.root() / "config/policy.json",
               R"({"allowedCommands": ["pytest"]})");
    write_file(workspace.root() / ".tryrun/try-run-policy.json",
               R"({"allowedCommands": ["docker"]})");

    auto result = load_policy(workspace.root(), std::filesystem::path("config/policy.json"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).allowed_commands, (std::vector<std::string>{"pytest"}));
}

TEST(TryRunPolicyTest, MissingOverrideUsesDefaults) {
    TempWorkspace workspace;
    write_file(workspace.root() / ".tryrun/try-run-policy.json",
               R"({"allowedCommands": ["docker"]})");

    auto result = load_policy(workspace.root(), std::filesystem::path("missing.json"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).source, "default");
    EXPECT_EQ(get_value(result).allowed_commands, default_policy().allowed_commands);
}

}  // namespace
