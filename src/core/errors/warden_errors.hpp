#pragma once
#include <string>
#include <variant>

namespace warden::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., empty command, unknown CLI flag
        Policy,     // E.g., path outside the workspace, dangerous call detected
        Execution,  // E.g., the interpreter exited non-zero
        Logging,    // E.g., the audit log could not be appended
        Config,     // E.g., .direct/config.yml is not valid YAML
        Internal    // E.g., unexpected filesystem state
    };

    // The standardized error payload
    struct WardenError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T or a WardenError.
    template <typename T>
    using Result = std::variant<T, WardenError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<WardenError>(result);
    }

    template <typename T>
    const WardenError& get_error(const Result<T>& result) {
        return std::get<WardenError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Logging:   return "logging";
            case ErrorCategory::Config:    return "config";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace warden::core::errors
