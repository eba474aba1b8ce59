#include "runtime/step_inference.hpp"

#include <algorithm>
#include <cctype>

namespace tryrun::runtime {

using protocol::CommandStep;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string trim(const std::string& value) {
    const auto not_space = [](const unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(value.begin(), value.end(), not_space);
    const auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool contains(const std::string& hay, const char* needle) {
    return hay.find(needle) != std::string::npos;
}

bool has_arg(const std::vector<std::string>& args, const char* value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

bool is_package_runner(const std::string& cmd) {
    return cmd == "npm" || cmd == "bun" || cmd == "pnpm" || cmd == "yarn";
}

}  // namespace

CommandStep infer_step(const std::string& command, const std::vector<std::string>& args) {
    const std::string cmd = lowercase(command);
    std::string full = cmd + " ";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            full += " ";
        }
        full += lowercase(args[i]);
    }

    if (cmd == "docker") {
        if (has_arg(args, "build")) {
            return CommandStep::Build;
        }
        if (has_arg(args, "compose") && has_arg(args, "up")) {
            return CommandStep::Start;
        }
        if (!args.empty() && args[0] == "run") {
            return CommandStep::Start;
        }
    }

    if (cmd == "pytest" || contains(full, " pytest")) {
        return CommandStep::Test;
    }
    if (cmd == "python" && args.size() >= 2 && args[0] == "-m" && args[1] == "pip") {
        return CommandStep::Install;
    }

    if (is_package_runner(cmd) && !args.empty()) {
        if (args[0] == "install" || args[0] == "ci") {
            return CommandStep::Install;
        }
        if (args[0] == "test") {
            return CommandStep::Test;
        }
        if (args[0] == "run" && args.size() >= 2 && !args[1].empty()) {
            const std::string script = lowercase(args[1]);
            if (contains(script, "test")) {
                return CommandStep::Test;
            }
            if (contains(script, "lint")) {
                return CommandStep::Lint;
            }
            if (contains(script, "build")) {
                return CommandStep::Build;
            }
            if (contains(script, "start") || contains(script, "dev") ||
                contains(script, "serve")) {
                return CommandStep::Start;
            }
            return CommandStep::Run;
        }
    }

    if (contains(full, " test")) {
        return CommandStep::Test;
    }
    if (contains(full, " lint")) {
        return CommandStep::Lint;
    }
    if (contains(full, " build")) {
        return CommandStep::Build;
    }
    if (contains(full, " start") || contains(full, " dev")) {
        return CommandStep::Start;
    }
    return CommandStep::Run;
}

bool is_help_mode(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        const std::string normalized = lowercase(trim(arg));
        if (normalized == "--help" || normalized == "-h") {
            return true;
        }
    }
    return false;
}

}  // namespace tryrun::runtime
