#pragma once

#include <string>
#include <vector>
#include "protocol/run_execution_contract.hpp"

namespace tryrun::runtime {

// Maps a planned command line onto the lifecycle step it most likely is.
protocol::CommandStep infer_step(const std::string& command,
                                 const std::vector<std::string>& args);

// True when any argument is "--help" or "-h" (trimmed, case-insensitive).
bool is_help_mode(const std::vector<std::string>& args);

}  // namespace tryrun::runtime
