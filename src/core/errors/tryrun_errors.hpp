#pragma once
#include <string>
#include <variant>

namespace tryrun::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., an invalid CLI flag or request field
        Config,     // E.g., a policy file that is present but not valid JSON
        Sandbox,    // E.g., the repository could not be copied into the sandbox
        Policy,     // E.g., a path or command crossed the trust boundary
        Internal    // E.g., an artifact could not be written
    };

    // The standardized error payload
    struct TryRunError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // Helpful tips for the operator
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a TryRunError.
    template <typename T>
    using Result = std::variant<T, TryRunError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<TryRunError>(result);
    }

    template <typename T>
    const TryRunError& get_error(const Result<T>& result) {
        return std::get<TryRunError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Config:    return "config";
            case ErrorCategory::Sandbox:   return "sandbox";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace tryrun::core::errors
