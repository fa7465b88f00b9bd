#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/toolwire_errors.hpp"
#include "process/process_supervisor.hpp"
#include "protocol/tool_contract.hpp"
#include "rpc/rpc_correlator.hpp"

namespace toolwire::session {

constexpr const char* kProtocolVersion = "2024-11-05";

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    Closed
};

std::string to_string(SessionState state);

struct SessionOptions {
    std::chrono::milliseconds handshake_timeout{5000};
    std::string client_name = "toolwire";
    std::string client_version = "1.0.0";
};

// What the server told us about itself during initialize.
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
    nlohmann::json capabilities = nlohmann::json::object();
};

struct ToolCallHandle {
    std::string tool;
    rpc::PendingCallHandle call;
};

// One protocol session with one tool server process. A dedicated reader
// thread decodes the server's stdout, resolves pending calls, drains stderr
// and notices when the process goes away. Callers block only on their own
// call's future.
class Session {
public:
    Session(process::ProcessSupervisor& supervisor, SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Spawns the server, performs the handshake and caches the tool catalog.
    core::errors::Result<ServerInfo> open(const process::ServerSpec& spec);

    // The cached catalog; never sends a request.
    core::errors::Result<std::vector<protocol::ToolDescriptor>> discover_tools() const;
    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() const;

    // Validates and sends tools/call without waiting for the answer.
    core::errors::Result<ToolCallHandle> call_tool_async(const std::string& name,
                                                         const nlohmann::json& arguments);
    protocol::ToolInvocationResult wait(const ToolCallHandle& handle);

    core::errors::Result<protocol::ToolInvocationResult> call_tool(
        const std::string& name, const nlohmann::json& arguments);

    void close();

    const std::string& id() const { return id_; }
    const std::string& server_name() const { return server_name_; }
    SessionState state() const;
    ServerInfo server_info() const;

    std::size_t bytes_sent() const;
    std::uint64_t malformed_frames() const { return malformed_frames_.load(); }
    rpc::RpcStats rpc_stats() const;
    std::shared_ptr<process::ToolServerProcess> process() const { return process_; }

private:
    core::errors::Result<ServerInfo> fail_initialization(const std::string& reason);
    void shutdown_locked();
    bool set_state(SessionState next, const std::string& reason);
    void mark_closed(protocol::TransportErrorCause cause, const std::string& reason);
    void read_loop();
    void handle_frame(const core::errors::Result<protocol::JsonRpcMessage>& frame);
    void handle_exit();

    process::ProcessSupervisor& supervisor_;
    SessionOptions options_;
    std::string id_;
    std::string server_name_;
    std::chrono::milliseconds call_timeout_{5000};

    // Serializes open() against close().
    std::mutex lifecycle_mutex_;
    std::shared_ptr<process::ToolServerProcess> process_;
    std::unique_ptr<rpc::RpcCorrelator> correlator_;
    std::thread reader_;
    std::atomic<bool> stop_reader_{false};
    std::atomic<std::uint64_t> malformed_frames_{0};

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Uninitialized;
    ServerInfo server_info_;
    std::vector<protocol::ToolDescriptor> tools_;
    std::unordered_map<std::string, std::size_t> tool_index_;
};

}  // namespace toolwire::session
