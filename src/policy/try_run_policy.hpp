#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/tryrun_errors.hpp"

namespace tryrun::policy {

struct TryRunPolicy {
    // "default" or the path of the policy file that was merged in.
    std::string source = "default";
    std::vector<std::string> script_priority;
    std::vector<std::string> allowed_commands;
    std::vector<std::string> allowed_script_entrypoints;
    std::vector<std::string> blocked_script_entrypoints;
};

// Conventional in-repo policy locations, tried in order.
inline const char* const kRepoPolicyPaths[] = {
    ".tryrun/try-run-policy.json",
    ".tryrun-try-run-policy.json",
};

// Built-in policy, constructed once and never mutated.
const TryRunPolicy& default_policy();

// Loads the policy for a repository. When override_path is set only that
// file is consulted (relative paths resolve against root_dir); otherwise the
// kRepoPolicyPaths are tried and the first non-empty file wins. A missing or
// empty file means "no policy supplied" and yields the defaults. A file that
// is present but not valid JSON is a Config error: callers must abort rather
// than run under a policy the operator did not intend.
core::errors::Result<TryRunPolicy> load_policy(
    const std::filesystem::path& root_dir,
    const std::optional<std::filesystem::path>& override_path = std::nullopt);

}  // namespace tryrun::policy
