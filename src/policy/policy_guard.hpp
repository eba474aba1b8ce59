#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "core/errors/tryrun_errors.hpp"
#include "policy/try_run_policy.hpp"
#include "protocol/run_plan_contract.hpp"

namespace tryrun::policy {

// Which package runners exist on this machine.
struct RunnerCapabilities {
    bool bun_available = false;
    bool npm_available = false;
};

struct ScriptSafety {
    bool safe = false;
    std::string reason;
};

class PolicyGuard {
public:
    explicit PolicyGuard(TryRunPolicy policy = default_policy());

    // Package-manager script gate. Leading KEY=value tokens are skipped; the
    // next token, lowercased, is the entrypoint. The blocklist is consulted
    // before the allowlist so a name present in both is always rejected.
    ScriptSafety evaluate_script_safety(const std::string& script_body,
                                        const RunnerCapabilities& capabilities) const;

    // Top-level command gate against allowed_commands.
    core::errors::Result<std::string> validate_command(const std::string& command) const;

    // Last-mile pass over a plan: a command outside allowed_commands gets
    // run=false and a note in why. Never turns run on.
    std::vector<protocol::PlannedCommand> sanitize_by_policy(
        std::vector<protocol::PlannedCommand> commands) const;

    // Resolves target_path (relative to workspace_root when relative) and
    // refuses anything that escapes the workspace.
    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    static std::optional<std::string> extract_script_entrypoint(
        const std::string& script_body);

    const TryRunPolicy& policy() const { return policy_; }

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::string lowercase(std::string value);
    static std::unordered_set<std::string> lowercase_set(
        const std::vector<std::string>& values);

    TryRunPolicy policy_;
    std::unordered_set<std::string> allowed_commands_;
    std::unordered_set<std::string> allowed_entrypoints_;
    std::unordered_set<std::string> blocked_entrypoints_;
};

}  // namespace tryrun::policy
