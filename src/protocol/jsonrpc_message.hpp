#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/toolwire_errors.hpp"

namespace toolwire::protocol {

using RequestId = std::int64_t;

constexpr const char* kJsonRpcVersion = "2.0";

// Standard JSON-RPC 2.0 error codes
namespace error_codes {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
}  // namespace error_codes

struct Request {
    RequestId id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct Response {
    RequestId id = 0;
    nlohmann::json result = nlohmann::json::object();
};

// id is empty when the peer could not tell which request failed (e.g. parse errors)
struct ErrorResponse {
    std::optional<RequestId> id;
    int code = error_codes::kInternalError;
    std::string message;
};

struct Notification {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

using JsonRpcMessage = std::variant<Request, Response, ErrorResponse, Notification>;

bool operator==(const Request& lhs, const Request& rhs);
bool operator==(const Response& lhs, const Response& rhs);
bool operator==(const ErrorResponse& lhs, const ErrorResponse& rhs);
bool operator==(const Notification& lhs, const Notification& rhs);

nlohmann::json to_document(const JsonRpcMessage& message);

// Classifies a parsed JSON document into one of the four message shapes.
core::errors::Result<JsonRpcMessage> from_document(const nlohmann::json& document);

// Short human-readable form for logs, e.g. "request #3 tools/call".
std::string describe(const JsonRpcMessage& message);

}  // namespace toolwire::protocol
