#include "planner/run_planner.hpp"

#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"

namespace tryrun::planner {

using nlohmann::json;
using policy::PolicyGuard;
using policy::RunnerCapabilities;
using protocol::KeyFiles;
using protocol::PlannedCommand;
using protocol::RunPlan;
using protocol::RunStrategy;

namespace {

constexpr std::uintmax_t kMaxManifestBytes = 600000;

struct PackageInfo {
    std::map<std::string, std::string> scripts;
    bool is_cli = false;
};

// Unreadable, oversized or unparseable manifests read as "no scripts".
std::optional<PackageInfo> load_package_json(const std::filesystem::path& root_dir,
                                             const std::string& relative_path,
                                             const PolicyGuard& guard) {
    auto resolved = guard.validate_path_in_workspace(root_dir, relative_path);
    if (core::errors::is_error(resolved)) {
        TRYRUN_LOG_WARN("Planner: ignoring package manifest: " +
                        core::errors::get_error(resolved).message);
        return std::nullopt;
    }
    const auto& manifest_path = core::errors::get_value(resolved);

    std::error_code ec;
    const auto size = std::filesystem::file_size(manifest_path, ec);
    if (ec || size > kMaxManifestBytes) {
        return std::nullopt;
    }

    std::ifstream in(manifest_path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    const json manifest = json::parse(buffer.str(), nullptr, false);
    if (manifest.is_discarded() || !manifest.is_object()) {
        return std::nullopt;
    }

    PackageInfo info;
    const auto scripts = manifest.find("scripts");
    if (scripts != manifest.end() && scripts->is_object()) {
        for (const auto& [name, body] : scripts->items()) {
            if (body.is_string()) {
                info.scripts.emplace(name, body.get<std::string>());
            }
        }
    }

    const auto bin = manifest.find("bin");
    if (bin != manifest.end()) {
        info.is_cli = (bin->is_string() && !bin->get<std::string>().empty()) ||
                      (bin->is_object() && !bin->empty());
    }
    return info;
}

std::vector<std::string> format_all(const std::vector<PlannedCommand>& commands) {
    std::vector<std::string> out;
    out.reserve(commands.size());
    for (const auto& cmd : commands) {
        out.push_back(protocol::format_command(cmd));
    }
    return out;
}

RunPlan finish_plan(RunStrategy strategy, std::string reason,
                    std::vector<PlannedCommand> commands, const PolicyGuard& guard) {
    RunPlan plan;
    plan.strategy = strategy;
    plan.reason = std::move(reason);
    plan.proposed_commands = format_all(commands);
    plan.executable_commands = guard.sanitize_by_policy(std::move(commands));
    return plan;
}

RunPlan plan_container(const PlanRequest& request, const PolicyGuard& guard) {
    const bool docker_available = request.command_available("docker");
    std::vector<PlannedCommand> commands;

    if (request.key_files.docker_compose.has_value()) {
        commands.push_back(PlannedCommand{
            "docker",
            {"compose", "up", "--build", "--abort-on-container-exit"},
            docker_available,
            docker_available ? "docker compose detected and docker binary available"
                             : "docker compose detected but docker binary missing"});
    } else {
        commands.push_back(PlannedCommand{
            "docker",
            {"build", "-t", kContainerImageTag, "."},
            docker_available,
            docker_available ? "dockerfile detected"
                             : "dockerfile detected but docker missing"});
        commands.push_back(PlannedCommand{
            "docker",
            {"run", "--rm", kContainerImageTag},
            docker_available,
            docker_available ? "run built image" : "docker missing"});
    }

    return finish_plan(RunStrategy::Container,
                       "Container descriptors found; prefer containerized run path.",
                       std::move(commands), guard);
}

std::string install_reason(const std::string& runner, bool has_bun_lock,
                           bool runner_available) {
    if (runner == "bun") {
        return "bun lockfile detected and bun available";
    }
    if (!runner_available) {
        return has_bun_lock
                   ? "bun lockfile detected but bun unavailable; npm fallback unavailable"
                   : "npm unavailable";
    }
    return has_bun_lock
               ? "bun lockfile detected but bun unavailable; falling back to npm"
               : "npm fallback for Node project";
}

RunPlan plan_package_manager(const PlanRequest& request, const PolicyGuard& guard) {
    const KeyFiles& key_files = request.key_files;
    const auto package_info =
        load_package_json(request.root_dir, key_files.package_json.value(), guard);

    RunnerCapabilities capabilities;
    capabilities.bun_available = request.command_available("bun");
    capabilities.npm_available = request.command_available("npm");

    const bool has_bun_lock = key_files.bun_lock.has_value();
    const std::string runner =
        has_bun_lock && capabilities.bun_available ? "bun" : "npm";
    const bool runner_available =
        runner == "bun" ? capabilities.bun_available : capabilities.npm_available;

    std::vector<PlannedCommand> commands;
    commands.push_back(PlannedCommand{
        runner,
        {runner == "bun" ? "install" : "ci"},
        runner_available,
        install_reason(runner, has_bun_lock, runner_available)});

    std::vector<std::string> selected;
    if (package_info.has_value()) {
        for (const auto& name : request.policy.script_priority) {
            if (selected.size() >= kMaxSelectedScripts) {
                break;
            }
            const auto it = package_info->scripts.find(name);
            if (it != package_info->scripts.end() && !it->second.empty()) {
                selected.push_back(name);
            }
        }
    }

    const bool is_cli = package_info.has_value() && package_info->is_cli;
    for (const auto& name : selected) {
        const auto safety = guard.evaluate_script_safety(
            package_info->scripts.at(name), capabilities);

        // A CLI's start/dev script would otherwise launch a long-lived process.
        const bool help_mode = is_cli && (name == "start" || name == "dev");
        std::vector<std::string> args = {"run", name};
        if (help_mode) {
            args.emplace_back("--");
            args.emplace_back("--help");
        }

        std::string why =
            safety.safe ? "package.json contains script '" + name + "'" +
                              (help_mode ? " (CLI help mode)" : "")
                        : "script '" + name + "' blocked by safe policy: " + safety.reason;
        commands.push_back(PlannedCommand{runner, std::move(args),
                                          runner_available && safety.safe,
                                          std::move(why)});
    }

    if (selected.empty()) {
        commands.push_back(PlannedCommand{runner, {"run", "start"}, false,
                                          "no preferred scripts found"});
    }

    return finish_plan(RunStrategy::PackageManager,
                       "package.json detected; using script-based execution path.",
                       std::move(commands), guard);
}

std::optional<std::string> first_python_entrypoint(const PlanRequest& request,
                                                   const PolicyGuard& guard) {
    for (const auto& entry : request.key_files.entrypoints) {
        if (std::filesystem::path(entry).extension() != ".py") {
            continue;
        }
        if (core::errors::is_error(
                guard.validate_path_in_workspace(request.root_dir, entry))) {
            continue;
        }
        return entry;
    }
    return std::nullopt;
}

RunPlan plan_python(const PlanRequest& request, const PolicyGuard& guard) {
    std::vector<PlannedCommand> commands;

    if (!request.allow_python) {
        std::vector<std::string> install_args = {"-m", "pip", "install"};
        if (request.key_files.requirements_txt.has_value()) {
            install_args.emplace_back("-r");
            install_args.push_back(request.key_files.requirements_txt.value());
        } else {
            install_args.emplace_back(".");
        }
        commands.push_back(PlannedCommand{
            "python", std::move(install_args), false,
            "Python run disabled unless python execution is explicitly allowed"});
    } else if (const auto entry = first_python_entrypoint(request, guard)) {
        commands.push_back(PlannedCommand{
            "python", {entry.value()}, request.command_available("python"),
            "python entrypoint guessed from repository structure"});
    } else {
        commands.push_back(PlannedCommand{
            "pytest", {}, request.command_available("pytest"),
            "no clear entrypoint; testing path attempted"});
    }

    return finish_plan(RunStrategy::Python, "Python project indicators detected.",
                       std::move(commands), guard);
}

}  // namespace

RunPlan build_run_plan(const PlanRequest& request) {
    const PolicyGuard guard(request.policy);
    const KeyFiles& key_files = request.key_files;

    RunPlan plan;
    if (key_files.docker_compose.has_value() || key_files.dockerfile.has_value()) {
        plan = plan_container(request, guard);
    } else if (key_files.package_json.has_value()) {
        plan = plan_package_manager(request, guard);
    } else if (key_files.requirements_txt.has_value() ||
               key_files.pyproject_toml.has_value()) {
        plan = plan_python(request, guard);
    } else {
        plan.strategy = RunStrategy::None;
        plan.reason = "No supported run strategy detected.";
    }

    std::size_t authorized = 0;
    for (const auto& cmd : plan.executable_commands) {
        if (cmd.run) {
            ++authorized;
        }
    }
    TRYRUN_LOG_INFO("Planner: strategy=" + protocol::to_string(plan.strategy) +
                    " commands=" + std::to_string(plan.executable_commands.size()) +
                    " authorized=" + std::to_string(authorized) +
                    " timeout=" + std::to_string(request.timeout_seconds) + "s");
    return plan;
}

}  // namespace tryrun::planner
