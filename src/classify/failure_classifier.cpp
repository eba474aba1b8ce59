#include "classify/failure_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace tryrun::classify {

using protocol::RunFailureClass;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool has(const std::string& hay, const char* needle) {
    return hay.find(needle) != std::string::npos;
}

}  // namespace

RunFailureClass classify_failure(const std::string& stderr_text,
                                 const std::string& stdout_text) {
    const std::string hay = lowercase(stderr_text + "\n" + stdout_text);

    if ((has(hay, "missing") && has(hay, "env")) || has(hay, "process.env") ||
        (has(hay, "must be set") && has(hay, "env")) ||
        (has(hay, "dotenv") && has(hay, "not found"))) {
        return RunFailureClass::MissingEnv;
    }

    if (has(hay, "module not found") || has(hay, "cannot find module") ||
        has(hay, "no such file or directory") || has(hay, "not installed") ||
        has(hay, "command not found")) {
        return RunFailureClass::MissingDeps;
    }

    if (has(hay, "eaddrinuse") || has(hay, "address already in use") ||
        has(hay, "port is already allocated")) {
        return RunFailureClass::PortConflict;
    }

    if (has(hay, "test failed") || has(hay, "failing tests") ||
        (has(hay, "assert") && has(hay, "failed"))) {
        return RunFailureClass::TestFail;
    }

    if (has(hay, "permission denied") || has(hay, "eacces")) {
        return RunFailureClass::Permission;
    }

    return RunFailureClass::Unknown;
}

std::vector<std::string> probable_fixes_for_failure(const RunFailureClass failure) {
    switch (failure) {
        case RunFailureClass::MissingEnv:
            return {"Create a .env file from .env.example if available.",
                    "Document required environment variables in README quickstart."};
        case RunFailureClass::MissingDeps:
            return {"Install dependencies with the detected package manager before running scripts.",
                    "Check lockfile consistency and runtime version requirements."};
        case RunFailureClass::PortConflict:
            return {"Change application port via environment variable or config.",
                    "Stop existing process already bound to the target port."};
        case RunFailureClass::TestFail:
            return {"Run a narrowed test subset to isolate failures.",
                    "Review stack trace and update brittle snapshots/fixtures."};
        case RunFailureClass::Permission:
            return {"Check file execution permissions and current user access.",
                    "Avoid writing to protected paths in setup scripts."};
        case RunFailureClass::Unknown:
        default:
            return {"Inspect stderr snippet for root cause and reproduce locally with full logs."};
    }
}

}  // namespace tryrun::classify
