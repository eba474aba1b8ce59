#include "session/attempt_json.hpp"

namespace tryrun::session {

using nlohmann::json;

json request_to_json(const protocol::TryRunRequest& request) {
    json payload;
    payload["command"] =
        request.command == protocol::CliCommand::Plan ? "plan" : "run";
    payload["repoPath"] = request.repo_path.string();
    payload["timeoutSeconds"] = request.timeout_seconds;
    payload["maxOutputChars"] = request.max_output_chars;
    payload["allowPython"] = request.allow_python;
    payload["policyPath"] = request.policy_path.has_value()
                                ? json(request.policy_path.value().string())
                                : json(nullptr);
    payload["artifactsDir"] = request.artifacts_dir.string();
    return payload;
}

json planned_command_to_json(const protocol::PlannedCommand& command) {
    json payload;
    payload["command"] = command.command;
    payload["args"] = command.args;
    payload["run"] = command.run;
    payload["why"] = command.why;
    return payload;
}

json plan_to_json(const protocol::RunPlan& plan) {
    json commands = json::array();
    for (const auto& command : plan.executable_commands) {
        commands.push_back(planned_command_to_json(command));
    }

    json payload;
    payload["strategy"] = protocol::to_string(plan.strategy);
    payload["reason"] = plan.reason;
    payload["proposedCommands"] = plan.proposed_commands;
    payload["executableCommands"] = commands;
    return payload;
}

json execution_to_json(const protocol::CommandExecution& execution) {
    json payload;
    payload["command"] = execution.command;
    payload["args"] = execution.args;
    payload["step"] = protocol::to_string(execution.step);
    payload["helpMode"] = execution.help_mode;
    payload["cwd"] = execution.cwd;
    payload["durationMs"] = execution.duration_ms;
    payload["exitCode"] = execution.exit_code.has_value()
                              ? json(execution.exit_code.value())
                              : json(nullptr);
    payload["timedOut"] = execution.timed_out;
    payload["stdoutSnippet"] = execution.stdout_snippet;
    payload["stderrSnippet"] = execution.stderr_snippet;
    payload["classification"] = protocol::to_string(execution.classification);
    payload["verificationStatus"] = protocol::to_string(execution.verification_status);
    payload["verificationEvidence"] = execution.verification_evidence;
    payload["probableFixes"] = execution.probable_fixes;
    return payload;
}

json attempt_to_json(const protocol::RunAttemptResult& attempt) {
    json executions = json::array();
    for (const auto& execution : attempt.executions) {
        executions.push_back(execution_to_json(execution));
    }

    json payload;
    payload["attempted"] = attempt.attempted;
    payload["planner"] = plan_to_json(attempt.planner);
    payload["executions"] = executions;
    payload["summary"] = attempt.summary;
    return payload;
}

std::string dump_json(const nlohmann::json& value, const int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace tryrun::session
