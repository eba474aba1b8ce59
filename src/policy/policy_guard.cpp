#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <utility>

namespace tryrun::policy {

using core::errors::ErrorCategory;
using core::errors::TryRunError;
using protocol::PlannedCommand;

namespace {

// FOO=bar style prefix: [A-Za-z_][A-Za-z0-9_]*=
bool is_env_assignment(const std::string& token) {
    if (token.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(token.front());
    if (std::isalpha(first) == 0 && token.front() != '_') {
        return false;
    }
    for (std::size_t i = 1; i < token.size(); ++i) {
        const char c = token[i];
        if (c == '=') {
            return true;
        }
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }
    return false;
}

}  // namespace

PolicyGuard::PolicyGuard(TryRunPolicy policy)
    : policy_(std::move(policy)),
      allowed_commands_(lowercase_set(policy_.allowed_commands)),
      allowed_entrypoints_(lowercase_set(policy_.allowed_script_entrypoints)),
      blocked_entrypoints_(lowercase_set(policy_.blocked_script_entrypoints)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::string PolicyGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::unordered_set<std::string> PolicyGuard::lowercase_set(
    const std::vector<std::string>& values) {
    std::unordered_set<std::string> out;
    for (const auto& value : values) {
        out.insert(lowercase(value));
    }
    return out;
}

std::optional<std::string> PolicyGuard::extract_script_entrypoint(
    const std::string& script_body) {
    std::istringstream in(script_body);
    std::string token;
    while (in >> token) {
        if (is_env_assignment(token)) {
            continue;
        }
        return lowercase(token);
    }
    return std::nullopt;
}

ScriptSafety PolicyGuard::evaluate_script_safety(
    const std::string& script_body, const RunnerCapabilities& capabilities) const {
    const auto entrypoint = extract_script_entrypoint(script_body);
    if (!entrypoint.has_value()) {
        return {false, "empty script command"};
    }
    const std::string& name = entrypoint.value();

    if (name == "bun" && !capabilities.bun_available) {
        return {false, "script requires bun but bun is unavailable"};
    }
    if (name == "npm" && !capabilities.npm_available) {
        return {false, "script requires npm but npm is unavailable"};
    }

    if (blocked_entrypoints_.count(name) > 0) {
        return {false, "entrypoint '" + name + "' is blocklisted"};
    }
    if (allowed_entrypoints_.count(name) == 0) {
        return {false, "entrypoint '" + name + "' is not allowlisted"};
    }

    return {true, "allowlisted entrypoint"};
}

core::errors::Result<std::string> PolicyGuard::validate_command(
    const std::string& command) const {
    if (command.empty()) {
        return TryRunError{ErrorCategory::Input, "Command cannot be empty.",
                           "empty_command"};
    }

    if (allowed_commands_.count(lowercase(command)) == 0) {
        return TryRunError{ErrorCategory::Policy,
                           "Command is not in the safe-exec allowlist: " + command,
                           "blocked_command"};
    }

    return command;
}

std::vector<PlannedCommand> PolicyGuard::sanitize_by_policy(
    std::vector<PlannedCommand> commands) const {
    for (auto& cmd : commands) {
        if (!core::errors::is_error(validate_command(cmd.command))) {
            continue;
        }
        cmd.run = false;
        cmd.why += "; command blocked by safe-exec policy";
    }
    return commands;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return TryRunError{ErrorCategory::Input,
                           "Workspace root does not exist: " +
                               workspace_root.string(),
                           "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return TryRunError{ErrorCategory::Input,
                           "Workspace root is not a directory: " +
                               workspace_root.string(),
                           "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return TryRunError{ErrorCategory::Input,
                           "Unable to resolve workspace root: " +
                               workspace_root.string(),
                           "invalid_workspace_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return TryRunError{ErrorCategory::Input,
                           "Unable to resolve target path: " + target_path.string(),
                           "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return TryRunError{ErrorCategory::Policy,
                           "Path escapes workspace root: " +
                               canonical_candidate.string(),
                           "path_outside_workspace"};
    }

    return canonical_candidate;
}

}  // namespace tryrun::policy
