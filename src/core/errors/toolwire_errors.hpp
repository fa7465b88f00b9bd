#pragma once
#include <string>
#include <variant>

namespace toolwire::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., caller asked for a tool the server never declared
        Config,     // E.g., an agent profile references an unknown tool
        Launch,     // E.g., the tool server executable does not exist
        Transport,  // E.g., writing to the server's stdin failed
        Protocol,   // E.g., the server broke the JSON-RPC contract
        State,      // E.g., calling a tool on a closed session
        Internal    // E.g., pipe() or fork() failed
    };

    // The standardized error payload
    struct ToolwireError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a ToolwireError.
    template <typename T>
    using Result = std::variant<T, ToolwireError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ToolwireError>(result);
    }

    template <typename T>
    const ToolwireError& get_error(const Result<T>& result) {
        return std::get<ToolwireError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Config: return "config";
            case ErrorCategory::Launch: return "launch";
            case ErrorCategory::Transport: return "transport";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::State: return "state";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace toolwire::core::errors
