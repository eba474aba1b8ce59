#pragma once

#include <functional>
#include <string>

namespace tryrun::tools {

// Answers "is this executable on PATH?". Injected into the planner so tests
// can pin availability.
using CommandLookup = std::function<bool(const std::string& command)>;

// Scans $PATH for an executable regular file named command. Names containing
// a slash are checked directly.
bool command_exists(const std::string& command);

}  // namespace tryrun::tools
