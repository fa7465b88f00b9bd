#include "server/stdio_server.hpp"

#include <cerrno>
#include <chrono>
#include <exception>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "transport/frame_codec.hpp"

namespace toolwire::server {

using core::errors::ErrorCategory;
using core::errors::ToolwireError;
using nlohmann::json;
namespace error_codes = protocol::error_codes;

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";

json text_content(const std::string& text) {
    return json::array({{{"type", "text"}, {"text", text}}});
}

ToolwireError invalid_params(const std::string& message) {
    return ToolwireError{ErrorCategory::Input, message, "invalid_params"};
}

protocol::JsonRpcMessage to_reply(const protocol::RequestId id,
                                  const core::errors::Result<json>& result) {
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        const int code = err.category == ErrorCategory::Input ? error_codes::kInvalidParams
                                                              : error_codes::kInternalError;
        return protocol::ErrorResponse{id, code, err.message};
    }
    return protocol::Response{id, core::errors::get_value(result)};
}

}  // namespace

StdioServer::StdioServer(StdioServerOptions options, std::vector<ServedTool> tools)
    : options_(std::move(options)), tools_(std::move(tools)) {
    for (std::size_t i = 0; i < tools_.size(); ++i) {
        tool_index_[tools_[i].name] = i;
    }
}

void StdioServer::set_method_handler(const std::string& method, MethodHandler handler) {
    method_handlers_[method] = std::move(handler);
}

json StdioServer::handle_initialize(const json& params) const {
    std::string version = kProtocolVersion;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string() &&
        params["protocolVersion"].get<std::string>() != kProtocolVersion) {
        TOOLWIRE_LOG_WARN("StdioServer: client asked for protocol " +
                          params["protocolVersion"].get<std::string>() + ", offering " + version);
    }
    return json{{"protocolVersion", version},
                {"capabilities", {{"tools", json::object()}}},
                {"serverInfo", {{"name", options_.name}, {"version", options_.version}}}};
}

json StdioServer::handle_tools_list() const {
    json tools = json::array();
    for (const auto& tool : tools_) {
        tools.push_back({{"name", tool.name},
                         {"description", tool.description},
                         {"inputSchema", tool.input_schema}});
    }
    return json{{"tools", tools}};
}

core::errors::Result<json> StdioServer::handle_tools_call(const json& params) const {
    const auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return invalid_params("tools/call needs a string 'name'.");
    }
    json arguments = json::object();
    const auto args = params.find("arguments");
    if (args != params.end() && !args->is_null()) {
        if (!args->is_object()) {
            return invalid_params("tools/call 'arguments' must be an object.");
        }
        arguments = *args;
    }

    const auto index = tool_index_.find(name->get<std::string>());
    if (index == tool_index_.end()) {
        return invalid_params("Unknown tool: " + name->get<std::string>());
    }
    const ServedTool& tool = tools_[index->second];

    const auto required = tool.input_schema.find("required");
    if (required != tool.input_schema.end() && required->is_array()) {
        for (const auto& parameter : *required) {
            if (parameter.is_string() && !arguments.contains(parameter.get<std::string>())) {
                return invalid_params("Missing required argument: " + parameter.get<std::string>());
            }
        }
    }

    const auto started = std::chrono::steady_clock::now();
    protocol::ToolReply reply = tool.handler(arguments);
    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();
    TOOLWIRE_LOG_DEBUG("StdioServer: " + tool.name + (reply.success ? " ok" : " failed") +
                       " in " + std::to_string(elapsed_ms) + " ms");

    return json{{"content", text_content(reply.success ? reply.output : reply.error_message)},
                {"isError", !reply.success}};
}

protocol::JsonRpcMessage StdioServer::handle_request(const protocol::Request& request) const {
    try {
        const auto custom = method_handlers_.find(request.method);
        if (custom != method_handlers_.end()) {
            return to_reply(request.id, custom->second(request.params));
        }
        if (request.method == "initialize") {
            if (!request.params.is_object()) {
                return protocol::ErrorResponse{request.id, error_codes::kInvalidParams,
                                               "initialize params must be an object"};
            }
            return protocol::Response{request.id, handle_initialize(request.params)};
        }
        if (request.method == "tools/list") {
            return protocol::Response{request.id, handle_tools_list()};
        }
        if (request.method == "tools/call") {
            if (!request.params.is_object()) {
                return protocol::ErrorResponse{request.id, error_codes::kInvalidParams,
                                               "tools/call params must be an object"};
            }
            return to_reply(request.id, handle_tools_call(request.params));
        }
        if (request.method == "ping") {
            return protocol::Response{request.id, json::object()};
        }
    } catch (const std::exception& ex) {
        TOOLWIRE_LOG_ERROR("StdioServer: " + request.method + " failed: " + ex.what());
        return protocol::ErrorResponse{request.id, error_codes::kInternalError,
                                       std::string("internal error: ") + ex.what()};
    }
    return protocol::ErrorResponse{request.id, error_codes::kMethodNotFound,
                                   "Method not found: " + request.method};
}

void StdioServer::send(transport::FrameWriter& writer, const protocol::JsonRpcMessage& message) const {
    auto written = writer.write(message);
    if (core::errors::is_error(written)) {
        TOOLWIRE_LOG_ERROR("StdioServer: could not send " + protocol::describe(message) + ": " +
                           core::errors::get_error(written).message);
    }
}

void StdioServer::reap_finished(std::vector<Worker>& workers) {
    for (auto it = workers.begin(); it != workers.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
    worker_count_ = workers.size();
}

int StdioServer::run(const int in_fd, const int out_fd) {
    transport::FrameWriter writer(out_fd);
    transport::FrameDecoder decoder;
    std::vector<Worker> workers;
    char buffer[65536];

    TOOLWIRE_LOG_INFO("StdioServer: " + options_.name + " serving " +
                      std::to_string(tools_.size()) + " tool(s)");

    bool open = true;
    while (open) {
        const ssize_t n = read(in_fd, buffer, sizeof(buffer));
        if (n > 0) {
            static_cast<void>(decoder.feed(std::string_view(buffer, static_cast<std::size_t>(n))));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            // EOF, or a read error we cannot recover from: drain what we have.
            decoder.finish();
            open = false;
        }
        reap_finished(workers);

        while (auto frame = decoder.next()) {
            if (core::errors::is_error(*frame)) {
                const auto& err = core::errors::get_error(*frame);
                TOOLWIRE_LOG_WARN("StdioServer: bad frame: " + err.message);
                const int code = transport::is_parse_failure(err) ? error_codes::kParseError
                                                                  : error_codes::kInvalidRequest;
                send(writer, protocol::ErrorResponse{std::nullopt, code, err.message});
                continue;
            }

            const auto& message = core::errors::get_value(*frame);
            if (const auto* request = std::get_if<protocol::Request>(&message)) {
                if (options_.concurrent_calls && request->method == "tools/call") {
                    auto done = std::make_shared<std::atomic<bool>>(false);
                    std::thread thread([this, &writer, done, call = *request]() {
                        send(writer, handle_request(call));
                        *done = true;
                    });
                    workers.push_back(Worker{std::move(thread), std::move(done)});
                    worker_count_ = workers.size();
                } else {
                    send(writer, handle_request(*request));
                }
            } else if (const auto* notification = std::get_if<protocol::Notification>(&message)) {
                if (notification->method == "notifications/initialized") {
                    initialized_ = true;
                    TOOLWIRE_LOG_DEBUG("StdioServer: client initialized");
                }
            } else {
                TOOLWIRE_LOG_DEBUG("StdioServer: ignoring " + protocol::describe(message));
            }
        }
    }

    for (auto& worker : workers) {
        worker.thread.join();
    }
    worker_count_ = 0;
    TOOLWIRE_LOG_INFO("StdioServer: " + options_.name + " input closed, exiting");
    return 0;
}

}  // namespace toolwire::server
