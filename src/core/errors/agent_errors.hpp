#pragma once
#include <string>
#include <variant>

namespace harbor::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., invalid CLI flag or missing operation parameter
        Execution,  // E.g., an operation or external command failed
        Provider,   // E.g., the backend process timed out
        Policy,     // E.g., a path escaped the session root
        Internal,   // E.g., filesystem or parsing failure inside the engine
        Cancelled   // Explicit cancellation or an overall deadline
    };

    // The standardized error payload
    struct AgentError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline bool is_boundary_violation(const AgentError& error) {
        return error.category == ErrorCategory::Policy;
    }

    inline bool is_cancellation(const AgentError& error) {
        return error.category == ErrorCategory::Cancelled;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Provider:  return "provider";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Internal:  return "internal";
            case ErrorCategory::Cancelled: return "cancelled";
            default: return "unknown";
        }
    }

} // namespace harbor::core::errors
