#include "protocol/jsonrpc_message.hpp"

#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>

namespace toolwire::protocol {

using core::errors::ErrorCategory;
using core::errors::ToolwireError;
using nlohmann::json;

namespace {

ToolwireError malformed(const std::string& message) {
    return ToolwireError{ErrorCategory::Protocol, message, "malformed_frame"};
}

// Ids outside the signed 64-bit range are rejected rather than wrapped.
std::optional<RequestId> read_id(const json& value) {
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<RequestId>::max())) {
            return std::nullopt;
        }
        return static_cast<RequestId>(raw);
    }
    if (value.is_number_integer()) {
        return value.get<RequestId>();
    }
    return std::nullopt;
}

std::optional<int> read_error_code(const json& value) {
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    if (value.is_number_integer()) {
        const auto raw = value.get<std::int64_t>();
        if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(raw);
    }
    return std::nullopt;
}

core::errors::Result<json> read_params(const json& document) {
    const auto it = document.find("params");
    if (it == document.end() || it->is_null()) {
        return json::object();
    }
    if (!it->is_object() && !it->is_array()) {
        return malformed("params must be an object or an array");
    }
    return *it;
}

}  // namespace

bool operator==(const Request& lhs, const Request& rhs) {
    return lhs.id == rhs.id && lhs.method == rhs.method && lhs.params == rhs.params;
}

bool operator==(const Response& lhs, const Response& rhs) {
    return lhs.id == rhs.id && lhs.result == rhs.result;
}

bool operator==(const ErrorResponse& lhs, const ErrorResponse& rhs) {
    return lhs.id == rhs.id && lhs.code == rhs.code && lhs.message == rhs.message;
}

bool operator==(const Notification& lhs, const Notification& rhs) {
    return lhs.method == rhs.method && lhs.params == rhs.params;
}

json to_document(const JsonRpcMessage& message) {
    return std::visit(
        [](const auto& m) -> json {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, Request>) {
                return json{{"jsonrpc", kJsonRpcVersion},
                            {"id", m.id},
                            {"method", m.method},
                            {"params", m.params}};
            } else if constexpr (std::is_same_v<T, Response>) {
                return json{{"jsonrpc", kJsonRpcVersion}, {"id", m.id}, {"result", m.result}};
            } else if constexpr (std::is_same_v<T, ErrorResponse>) {
                json id = nullptr;
                if (m.id.has_value()) {
                    id = m.id.value();
                }
                return json{{"jsonrpc", kJsonRpcVersion},
                            {"id", id},
                            {"error", {{"code", m.code}, {"message", m.message}}}};
            } else {
                return json{{"jsonrpc", kJsonRpcVersion},
                            {"method", m.method},
                            {"params", m.params}};
            }
        },
        message);
}

core::errors::Result<JsonRpcMessage> from_document(const json& document) {
    if (!document.is_object()) {
        return malformed("frame is not a JSON object");
    }

    const auto version_it = document.find("jsonrpc");
    if (version_it != document.end() &&
        (!version_it->is_string() || *version_it != kJsonRpcVersion)) {
        return malformed("unsupported jsonrpc version");
    }

    const auto id_it = document.find("id");
    const auto method_it = document.find("method");

    if (method_it != document.end()) {
        if (!method_it->is_string()) {
            return malformed("method must be a string");
        }
        auto params = read_params(document);
        if (core::errors::is_error(params)) {
            return core::errors::get_error(params);
        }

        if (id_it == document.end()) {
            return Notification{method_it->get<std::string>(),
                                core::errors::get_value(params)};
        }
        const auto id = read_id(*id_it);
        if (!id.has_value()) {
            return malformed("request id must be an integer");
        }
        return Request{id.value(), method_it->get<std::string>(),
                       core::errors::get_value(params)};
    }

    if (id_it == document.end()) {
        return malformed("frame has neither method nor id");
    }

    const auto result_it = document.find("result");
    const auto error_it = document.find("error");
    if (result_it != document.end() && error_it != document.end()) {
        return malformed("frame has both result and error");
    }

    if (result_it != document.end()) {
        const auto id = read_id(*id_it);
        if (!id.has_value()) {
            return malformed("response id must be an integer");
        }
        return Response{id.value(), *result_it};
    }

    if (error_it != document.end()) {
        if (!error_it->is_object()) {
            return malformed("error must be an object");
        }
        const auto code_it = error_it->find("code");
        const auto message_it = error_it->find("message");
        const auto code = code_it == error_it->end() ? std::optional<int>{}
                                                     : read_error_code(*code_it);
        if (!code.has_value()) {
            return malformed("error.code must be a 32-bit integer");
        }
        if (message_it == error_it->end() || !message_it->is_string()) {
            return malformed("error.message must be a string");
        }

        ErrorResponse error;
        error.code = code.value();
        error.message = message_it->get<std::string>();
        if (!id_it->is_null()) {
            error.id = read_id(*id_it);
            if (!error.id.has_value()) {
                return malformed("error response id must be an integer or null");
            }
        }
        return error;
    }

    return malformed("response has neither result nor error");
}

std::string describe(const JsonRpcMessage& message) {
    return std::visit(
        [](const auto& m) -> std::string {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, Request>) {
                return "request #" + std::to_string(m.id) + " " + m.method;
            } else if constexpr (std::is_same_v<T, Response>) {
                return "response #" + std::to_string(m.id);
            } else if constexpr (std::is_same_v<T, ErrorResponse>) {
                return "error response #" +
                       (m.id.has_value() ? std::to_string(m.id.value()) : std::string("null")) +
                       " (" + std::to_string(m.code) + ": " + m.message + ")";
            } else {
                return "notification " + m.method;
            }
        },
        message);
}

}  // namespace toolwire::protocol
