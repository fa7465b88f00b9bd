#pragma once
#include <map>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolwire::protocol {

    // A tool as declared by a server during discovery
    struct ToolDescriptor {
        std::string name;
        std::string description;
        std::map<std::string, std::string> parameters;  // parameter name -> JSON type ("string", "any", ...)
        std::vector<std::string> required;
        std::string server;                             // server that declared it
    };

    inline bool operator==(const ToolDescriptor& lhs, const ToolDescriptor& rhs) {
        return lhs.name == rhs.name && lhs.description == rhs.description &&
               lhs.parameters == rhs.parameters && lhs.required == rhs.required &&
               lhs.server == rhs.server;
    }

    enum class TransportErrorCause {
        Timeout,        // No response before the deadline
        ProcessExited,  // The server process died or closed its stdout
        SendFailed,     // Writing the request to the server failed
        SessionClosed   // The session was closed locally while the call was pending
    };

    // The tool ran and produced output
    struct ToolSuccess {
        std::string text;        // concatenated text content
        nlohmann::json payload;  // raw "result" object
    };

    // The tool ran (or the server refused the call) and reported a failure
    struct ToolError {
        std::string message;
        int code = 0;            // JSON-RPC error code, 0 for isError results
    };

    // We could not reach the tool
    struct TransportError {
        TransportErrorCause cause;
        std::string detail;
    };

    using ToolInvocationResult = std::variant<ToolSuccess, ToolError, TransportError>;

    // How a tool handler replies inside a tool server
    struct ToolReply {
        bool success = true;
        std::string output;
        std::string error_message;
        double duration_ms = 0.0;
    };

    inline std::string to_string(const TransportErrorCause cause) {
        switch (cause) {
            case TransportErrorCause::Timeout:
                return "timeout";
            case TransportErrorCause::ProcessExited:
                return "process_exited";
            case TransportErrorCause::SendFailed:
                return "send_failed";
            case TransportErrorCause::SessionClosed:
                return "session_closed";
            default:
                return "unknown";
        }
    }

    inline bool is_success(const ToolInvocationResult& result) {
        return std::holds_alternative<ToolSuccess>(result);
    }

    // Text suitable for showing to the user; non-success outcomes become a
    // fallback message instead of aborting the conversation.
    inline std::string render_for_user(const ToolInvocationResult& result) {
        if (const auto* success = std::get_if<ToolSuccess>(&result)) {
            return success->text;
        }
        if (const auto* error = std::get_if<ToolError>(&result)) {
            return "The tool reported an error: " + error->message;
        }
        const auto& transport = std::get<TransportError>(result);
        return "The tool could not be reached (" + to_string(transport.cause) + "): " +
               transport.detail;
    }

} // namespace toolwire::protocol
