#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "protocol/run_execution_contract.hpp"
#include "protocol/run_plan_contract.hpp"
#include "protocol/run_request.hpp"

namespace tryrun::session {

// camelCase keys, kebab-case enum tags, null for a missing exit code.
nlohmann::json request_to_json(const protocol::TryRunRequest& request);
nlohmann::json planned_command_to_json(const protocol::PlannedCommand& command);
nlohmann::json plan_to_json(const protocol::RunPlan& plan);
nlohmann::json execution_to_json(const protocol::CommandExecution& execution);
nlohmann::json attempt_to_json(const protocol::RunAttemptResult& attempt);

// Captured output is arbitrary bytes; invalid UTF-8 is written as U+FFFD
// instead of throwing. indent < 0 gives a single line.
std::string dump_json(const nlohmann::json& value, int indent = -1);

}  // namespace tryrun::session
