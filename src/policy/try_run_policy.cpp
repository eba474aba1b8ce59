#include "policy/try_run_policy.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace tryrun::policy {

using core::errors::ErrorCategory;
using core::errors::TryRunError;
using nlohmann::json;

namespace {

TryRunPolicy build_default_policy() {
    TryRunPolicy policy;
    policy.source = "default";
    policy.script_priority = {"test", "lint", "build", "start", "dev"};
    policy.allowed_commands = {"docker", "bun", "npm", "pnpm",
                               "yarn", "make", "python", "pytest"};
    policy.allowed_script_entrypoints = {
        "node",   "npm",     "npx",           "bun",    "pnpm",     "yarn",
        "tsx",    "ts-node", "vite",          "vitest", "next",     "react-scripts",
        "jest",   "eslint",  "prettier",      "tsc",    "turbo",    "webpack",
        "rollup", "docker",  "make",          "python", "pytest",   "go",
        "cargo",  "uv"};
    policy.blocked_script_entrypoints = {"curl", "wget", "bash", "sh",
                                         "zsh",  "powershell", "pwsh", "cmd"};
    return policy;
}

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

// Non-empty array of strings -> trimmed, lowercased, de-duplicated in first
// seen order. Anything else (missing key, wrong type, nothing left after
// cleaning) keeps the built-in list.
std::vector<std::string> pick_string_array(const json& raw, const char* key,
                                           const std::vector<std::string>& fallback) {
    if (!raw.is_object()) {
        return fallback;
    }
    const auto it = raw.find(key);
    if (it == raw.end() || !it->is_array()) {
        return fallback;
    }

    std::vector<std::string> cleaned;
    std::unordered_set<std::string> seen;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            continue;
        }
        std::string value = lowercase(trim(item.get<std::string>()));
        if (value.empty()) {
            continue;
        }
        if (seen.insert(value).second) {
            cleaned.push_back(std::move(value));
        }
    }

    if (cleaned.empty()) {
        return fallback;
    }
    return cleaned;
}

TryRunPolicy merge_policy(const TryRunPolicy& base, const json& raw,
                          const std::string& source) {
    TryRunPolicy merged;
    merged.source = source;
    merged.script_priority =
        pick_string_array(raw, "scriptPriority", base.script_priority);
    merged.allowed_commands =
        pick_string_array(raw, "allowedCommands", base.allowed_commands);
    merged.allowed_script_entrypoints = pick_string_array(
        raw, "allowedScriptEntrypoints", base.allowed_script_entrypoints);
    merged.blocked_script_entrypoints = pick_string_array(
        raw, "blockedScriptEntrypoints", base.blocked_script_entrypoints);
    return merged;
}

// Unreadable and whitespace-only files both count as absent.
std::optional<std::string> read_policy_text(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    std::string text = buffer.str();
    if (trim(text).empty()) {
        return std::nullopt;
    }
    return text;
}

std::filesystem::path resolve_policy_path(const std::filesystem::path& root_dir,
                                          const std::filesystem::path& override_path) {
    if (override_path.is_absolute()) {
        return override_path;
    }
    return (root_dir / override_path).lexically_normal();
}

}  // namespace

const TryRunPolicy& default_policy() {
    static const TryRunPolicy kDefault = build_default_policy();
    return kDefault;
}

core::errors::Result<TryRunPolicy> load_policy(
    const std::filesystem::path& root_dir,
    const std::optional<std::filesystem::path>& override_path) {
    std::vector<std::filesystem::path> candidates;
    if (override_path.has_value()) {
        candidates.push_back(resolve_policy_path(root_dir, override_path.value()));
    } else {
        for (const char* relative : kRepoPolicyPaths) {
            candidates.push_back(root_dir / relative);
        }
    }

    for (const auto& candidate : candidates) {
        const auto text = read_policy_text(candidate);
        if (!text.has_value()) {
            TRYRUN_LOG_DEBUG("Policy: no policy at " + candidate.string());
            continue;
        }

        const json raw = json::parse(text.value(), nullptr, false);
        if (raw.is_discarded()) {
            return TryRunError{ErrorCategory::Config,
                               "Invalid try-run policy JSON at " + candidate.string(),
                               "invalid_policy_json",
                               "Fix the JSON syntax or remove the file to use the built-in policy."};
        }

        TRYRUN_LOG_INFO("Policy: loaded " + candidate.string());
        return merge_policy(default_policy(), raw, candidate.string());
    }

    if (override_path.has_value()) {
        TRYRUN_LOG_WARN("Policy: override " + candidates.front().string() +
                        " not found or empty; using built-in policy");
    }
    return default_policy();
}

}  // namespace tryrun::policy
