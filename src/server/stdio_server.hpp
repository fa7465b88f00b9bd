#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/toolwire_errors.hpp"
#include "protocol/jsonrpc_message.hpp"
#include "protocol/tool_contract.hpp"
#include "transport/frame_writer.hpp"

namespace toolwire::server {

using ToolHandler = std::function<protocol::ToolReply(const nlohmann::json& arguments)>;

// A tool offered by this process.
struct ServedTool {
    std::string name;
    std::string description;
    nlohmann::json input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    ToolHandler handler;
};

// Input-category errors become -32602, everything else -32603.
using MethodHandler = std::function<core::errors::Result<nlohmann::json>(const nlohmann::json& params)>;

struct StdioServerOptions {
    std::string name;
    std::string version = "1.0.0";
    bool concurrent_calls = false;  // tools/call on worker threads; replies may reorder
};

// Server half of the protocol: newline-delimited JSON-RPC on a pair of fds.
class StdioServer {
public:
    StdioServer(StdioServerOptions options, std::vector<ServedTool> tools);

    // Overrides or adds a method; checked before the built-in ones.
    void set_method_handler(const std::string& method, MethodHandler handler);

    // Serves until in_fd reaches EOF. Returns the process exit code.
    int run(int in_fd, int out_fd);

    bool initialized() const { return initialized_.load(); }

    // Worker threads started for concurrent calls and not yet joined.
    std::size_t worker_count() const { return worker_count_.load(); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Joins workers whose reply has been sent.
    void reap_finished(std::vector<Worker>& workers);

    // The reply to a request.
    protocol::JsonRpcMessage handle_request(const protocol::Request& request) const;
    nlohmann::json handle_initialize(const nlohmann::json& params) const;
    nlohmann::json handle_tools_list() const;
    core::errors::Result<nlohmann::json> handle_tools_call(const nlohmann::json& params) const;
    void send(transport::FrameWriter& writer, const protocol::JsonRpcMessage& message) const;

    StdioServerOptions options_;
    std::vector<ServedTool> tools_;
    std::map<std::string, std::size_t> tool_index_;
    std::map<std::string, MethodHandler> method_handlers_;
    std::atomic<bool> initialized_{false};
    std::atomic<std::size_t> worker_count_{0};
};

}  // namespace toolwire::server
