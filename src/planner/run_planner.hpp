#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include "policy/try_run_policy.hpp"
#include "protocol/key_files.hpp"
#include "protocol/run_plan_contract.hpp"
#include "tools/command_lookup.hpp"

namespace tryrun::planner {

struct PlanRequest {
    std::filesystem::path root_dir;
    protocol::KeyFiles key_files;
    std::uint32_t timeout_seconds = 120;
    bool allow_python = false;
    policy::TryRunPolicy policy = policy::default_policy();
    tools::CommandLookup command_available = tools::command_exists;
};

// Image tag used by the container strategy's build-then-run pair.
inline constexpr const char* kContainerImageTag = "tryrun-target";

// Maximum number of package.json scripts proposed per plan.
inline constexpr std::size_t kMaxSelectedScripts = 3;

// Detection precedence: container descriptor > package manifest > Python
// project descriptor > none. Every emitted command has passed the policy's
// last-mile sanitization.
protocol::RunPlan build_run_plan(const PlanRequest& request);

}  // namespace tryrun::planner
