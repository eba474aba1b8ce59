#pragma once

#include <string>
#include <vector>

namespace tryrun::protocol {

// Mutually exclusive; the planner picks by precedence
// container > package-manager > python > none.
enum class RunStrategy {
    Container,
    PackageManager,
    Python,
    None
};

struct PlannedCommand {
    std::string command;
    std::vector<std::string> args;
    // Final authorization. Policy sanitization may only turn it off.
    bool run = false;
    std::string why;
};

struct RunPlan {
    RunStrategy strategy = RunStrategy::None;
    std::string reason;
    // Display strings, including commands that are not authorized.
    std::vector<std::string> proposed_commands;
    std::vector<PlannedCommand> executable_commands;
};

inline std::string to_string(const RunStrategy strategy) {
    switch (strategy) {
        case RunStrategy::Container:
            return "container";
        case RunStrategy::PackageManager:
            return "package-manager";
        case RunStrategy::Python:
            return "python";
        case RunStrategy::None:
            return "none";
        default:
            return "unknown";
    }
}

inline std::string format_command(const std::string& command,
                                  const std::vector<std::string>& args) {
    std::string text = command;
    for (const auto& arg : args) {
        text += " ";
        text += arg;
    }
    return text;
}

inline std::string format_command(const PlannedCommand& planned) {
    return format_command(planned.command, planned.args);
}

}  // namespace tryrun::protocol
