#include "session/session.hpp"

#include <cerrno>
#include <poll.h>
#include <string_view>
#include <unistd.h>
#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "transport/frame_codec.hpp"

namespace toolwire::session {

using core::errors::ErrorCategory;
using core::errors::ToolwireError;
using protocol::ToolDescriptor;
using protocol::TransportErrorCause;

namespace {

constexpr int kReadPollMs = 50;
constexpr auto kExitReapWait = std::chrono::milliseconds(500);

std::string describe_failure(const rpc::RpcOutcome& outcome) {
    if (const auto* remote = std::get_if<rpc::RemoteError>(&outcome)) {
        return "server error " + std::to_string(remote->code) + ": " + remote->message;
    }
    if (const auto* transport = std::get_if<rpc::TransportFailure>(&outcome)) {
        return protocol::to_string(transport->cause) + ": " + transport->detail;
    }
    return "";
}

std::string concatenate_text(const nlohmann::json& result) {
    std::string text;
    const auto content = result.find("content");
    if (content == result.end() || !content->is_array()) {
        return text;
    }
    for (const auto& item : *content) {
        if (!item.is_object()) {
            continue;
        }
        const auto value = item.find("text");
        if (value != item.end() && value->is_string()) {
            if (!text.empty()) {
                text.push_back('\n');
            }
            text += value->get<std::string>();
        }
    }
    return text;
}

// Empty when absent or not a string.
std::string string_field(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string();
}

core::errors::Result<std::vector<ToolDescriptor>> parse_catalog(const nlohmann::json& result,
                                                                const std::string& server) {
    const auto tools = result.find("tools");
    if (tools == result.end() || !tools->is_array()) {
        return ToolwireError{ErrorCategory::Protocol, "tools/list result has no tools array.",
                             "malformed_frame"};
    }

    std::vector<ToolDescriptor> catalog;
    for (const auto& entry : *tools) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            TOOLWIRE_LOG_WARN("Session: skipping tool entry without a name from " + server);
            continue;
        }

        ToolDescriptor descriptor;
        descriptor.name = entry["name"].get<std::string>();
        descriptor.server = server;
        if (entry.contains("description") && entry["description"].is_string()) {
            descriptor.description = entry["description"].get<std::string>();
        }

        const auto schema = entry.find("inputSchema");
        if (schema != entry.end() && schema->is_object()) {
            const auto properties = schema->find("properties");
            if (properties != schema->end() && properties->is_object()) {
                for (const auto& [parameter, shape] : properties->items()) {
                    std::string type = "any";
                    if (shape.is_object() && shape.contains("type") && shape["type"].is_string()) {
                        type = shape["type"].get<std::string>();
                    }
                    descriptor.parameters[parameter] = type;
                }
            }
            const auto required = schema->find("required");
            if (required != schema->end() && required->is_array()) {
                for (const auto& name : *required) {
                    if (name.is_string()) {
                        descriptor.required.push_back(name.get<std::string>());
                    }
                }
            }
        }
        catalog.push_back(std::move(descriptor));
    }
    return catalog;
}

}  // namespace

std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Uninitialized:
            return "uninitialized";
        case SessionState::Initializing:
            return "initializing";
        case SessionState::Ready:
            return "ready";
        case SessionState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

Session::Session(process::ProcessSupervisor& supervisor, SessionOptions options)
    : supervisor_(supervisor),
      options_(std::move(options)),
      id_(core::config::generate_session_id()) {}

Session::~Session() {
    close();
}

bool Session::set_state(const SessionState next, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == next) {
        return true;
    }
    if (state_ == SessionState::Closed) {
        return false;
    }
    TOOLWIRE_LOG_INFO("Session: " + id_ + " (" + server_name_ + ") transition " +
                      to_string(state_) + " -> " + to_string(next) + " (" + reason + ")");
    state_ = next;
    return true;
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ServerInfo Session::server_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_;
}

core::errors::Result<ServerInfo> Session::open(const process::ServerSpec& spec) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Uninitialized) {
            return ToolwireError{ErrorCategory::State,
                                 "Session " + id_ + " was already opened (" +
                                     to_string(state_) + ").",
                                 "session_not_ready",
                                 "Create a new session to connect again."};
        }
        server_name_ = spec.name;
    }
    call_timeout_ = std::chrono::milliseconds(spec.call_timeout_ms);
    set_state(SessionState::Initializing, "opening " + spec.command);

    auto started = supervisor_.start(spec);
    if (core::errors::is_error(started)) {
        set_state(SessionState::Closed, "launch failed");
        return core::errors::get_error(started);
    }
    process_ = core::errors::get_value(started);

    auto process = process_;
    correlator_ = std::make_unique<rpc::RpcCorrelator>(
        [process](const protocol::JsonRpcMessage& message, const rpc::Clock::time_point deadline) {
            auto written = process->stdin_writer().write(message, deadline);
            if (core::errors::is_error(written)) {
                process->mark_degraded("write failed: " +
                                       core::errors::get_error(written).message);
            }
            return written;
        },
        spec.name);
    stop_reader_ = false;
    reader_ = std::thread(&Session::read_loop, this);

    nlohmann::json init_params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"clientInfo", {{"name", options_.client_name}, {"version", options_.client_version}}}};
    const auto initialized =
        correlator_->call("initialize", std::move(init_params), options_.handshake_timeout);
    const auto* init_result = std::get_if<nlohmann::json>(&initialized);
    if (init_result == nullptr) {
        return fail_initialization("initialize failed: " + describe_failure(initialized));
    }
    if (!init_result->is_object() || !init_result->contains("protocolVersion") ||
        !(*init_result)["protocolVersion"].is_string()) {
        return fail_initialization("initialize result carries no protocolVersion");
    }

    ServerInfo info;
    info.protocol_version = (*init_result)["protocolVersion"].get<std::string>();
    if (init_result->contains("capabilities") && (*init_result)["capabilities"].is_object()) {
        info.capabilities = (*init_result)["capabilities"];
    }
    const auto server_info = init_result->find("serverInfo");
    if (server_info != init_result->end() && server_info->is_object()) {
        info.name = string_field(*server_info, "name");
        info.version = string_field(*server_info, "version");
    }
    if (info.protocol_version != kProtocolVersion) {
        TOOLWIRE_LOG_WARN("Session: " + spec.name + " answered with protocol version " +
                          info.protocol_version);
    }

    auto notified = correlator_->notify("notifications/initialized");
    if (core::errors::is_error(notified)) {
        return fail_initialization("notifications/initialized failed: " +
                                   core::errors::get_error(notified).message);
    }

    const auto listed =
        correlator_->call("tools/list", nlohmann::json::object(), options_.handshake_timeout);
    const auto* list_result = std::get_if<nlohmann::json>(&listed);
    if (list_result == nullptr) {
        return fail_initialization("tools/list failed: " + describe_failure(listed));
    }
    auto catalog = parse_catalog(*list_result, spec.name);
    if (core::errors::is_error(catalog)) {
        return fail_initialization(core::errors::get_error(catalog).message);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        server_info_ = info;
        tools_ = core::errors::get_value(catalog);
        tool_index_.clear();
        for (std::size_t i = 0; i < tools_.size(); ++i) {
            tool_index_[tools_[i].name] = i;
        }
    }
    const bool ready = set_state(SessionState::Ready,
                                 std::to_string(tools_.size()) + " tool(s) from " +
                                     (info.name.empty() ? spec.name : info.name));
    if (!ready) {
        return fail_initialization("server went away during the handshake");
    }
    return info;
}

core::errors::Result<ServerInfo> Session::fail_initialization(const std::string& reason) {
    TOOLWIRE_LOG_ERROR("Session: " + id_ + " failed to initialize " + server_name_ + ": " +
                       reason);
    const std::string tail = process_ ? process_->stderr_tail() : "";
    shutdown_locked();
    return ToolwireError{ErrorCategory::Protocol,
                         "Failed to initialize tool server '" + server_name_ + "': " + reason,
                         "initialization_failed",
                         tail.empty() ? "Check the server's logs." : "Server stderr: " + tail};
}

core::errors::Result<std::vector<ToolDescriptor>> Session::discover_tools() const {
    return list_tools();
}

core::errors::Result<std::vector<ToolDescriptor>> Session::list_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Ready) {
        return ToolwireError{ErrorCategory::State,
                             "Session " + id_ + " is " + to_string(state_) + ".",
                             state_ == SessionState::Closed ? "session_closed"
                                                            : "session_not_ready"};
    }
    return tools_;
}

core::errors::Result<ToolCallHandle> Session::call_tool_async(const std::string& name,
                                                              const nlohmann::json& arguments) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closed) {
            return ToolwireError{ErrorCategory::State,
                                 "Session with '" + server_name_ + "' is closed.",
                                 "session_closed",
                                 "Reopen the server to make further calls."};
        }
        if (state_ != SessionState::Ready) {
            return ToolwireError{ErrorCategory::State,
                                 "Session with '" + server_name_ + "' is " + to_string(state_) +
                                     ".",
                                 "session_not_ready"};
        }
        if (tool_index_.find(name) == tool_index_.end()) {
            return ToolwireError{ErrorCategory::Input,
                                 "Tool '" + name + "' is not offered by '" + server_name_ + "'.",
                                 "unknown_tool"};
        }
    }
    if (!arguments.is_null() && !arguments.is_object()) {
        return ToolwireError{ErrorCategory::Input, "Tool arguments must be a JSON object.",
                             "invalid_arguments"};
    }

    nlohmann::json params = {
        {"name", name},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}};
    ToolCallHandle handle;
    handle.tool = name;
    handle.call = correlator_->begin_call("tools/call", std::move(params), call_timeout_);
    return handle;
}

protocol::ToolInvocationResult Session::wait(const ToolCallHandle& handle) {
    const auto outcome = correlator_->await(handle.call);

    if (const auto* result = std::get_if<nlohmann::json>(&outcome)) {
        std::string text = concatenate_text(*result);
        const auto is_error_flag = result->find("isError");
        if (is_error_flag != result->end() && is_error_flag->is_boolean() &&
            is_error_flag->get<bool>()) {
            return protocol::ToolError{text.empty() ? handle.tool + " reported an error" : text,
                                       0};
        }
        return protocol::ToolSuccess{std::move(text), *result};
    }
    if (const auto* remote = std::get_if<rpc::RemoteError>(&outcome)) {
        return protocol::ToolError{remote->message, remote->code};
    }

    const auto& failure = std::get<rpc::TransportFailure>(outcome);
    if (failure.cause == TransportErrorCause::ProcessExited ||
        failure.cause == TransportErrorCause::SendFailed) {
        mark_closed(failure.cause, failure.detail);
    }
    return protocol::TransportError{failure.cause, failure.detail};
}

core::errors::Result<protocol::ToolInvocationResult> Session::call_tool(
    const std::string& name, const nlohmann::json& arguments) {
    auto handle = call_tool_async(name, arguments);
    if (core::errors::is_error(handle)) {
        return core::errors::get_error(handle);
    }
    return wait(core::errors::get_value(handle));
}

void Session::mark_closed(const TransportErrorCause cause, const std::string& reason) {
    set_state(SessionState::Closed, protocol::to_string(cause) + ": " + reason);
    if (correlator_) {
        correlator_->fail_all(cause, reason);
    }
}

void Session::close() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    shutdown_locked();
}

void Session::shutdown_locked() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Uninitialized) {
            state_ = SessionState::Closed;
            return;
        }
    }
    set_state(SessionState::Closed, "closed locally");
    if (correlator_) {
        correlator_->fail_all(TransportErrorCause::SessionClosed, "session closed");
    }
    stop_reader_ = true;
    if (reader_.joinable()) {
        reader_.join();
    }
    if (process_ && process_->state() != process::ProcessState::Terminated) {
        supervisor_.stop(process_);
    }
}

std::size_t Session::bytes_sent() const {
    return process_ ? process_->stdin_writer().bytes_written() : 0;
}

rpc::RpcStats Session::rpc_stats() const {
    return correlator_ ? correlator_->stats() : rpc::RpcStats{};
}

void Session::read_loop() {
    transport::FrameDecoder decoder;
    const int stdout_fd = process_->stdout_fd();
    const int stderr_fd = process_->stderr_fd();
    bool stdout_open = stdout_fd >= 0;
    bool stderr_open = stderr_fd >= 0;
    char buffer[65536];

    while (!stop_reader_) {
        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, kReadPollMs));
        }

        if (stderr_open) {
            stderr_open = process_->pump_stderr();
        }

        while (stdout_open) {
            const ssize_t n = read(stdout_fd, buffer, sizeof(buffer));
            if (n > 0) {
                static_cast<void>(decoder.feed(std::string_view(buffer, static_cast<std::size_t>(n))));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                break;
            }
            decoder.finish();
            stdout_open = false;
        }

        while (auto frame = decoder.next()) {
            handle_frame(*frame);
        }
        correlator_->expire_overdue();

        if (!stdout_open) {
            handle_exit();
            return;
        }
    }
}

void Session::handle_frame(const core::errors::Result<protocol::JsonRpcMessage>& frame) {
    if (core::errors::is_error(frame)) {
        ++malformed_frames_;
        const auto& err = core::errors::get_error(frame);
        TOOLWIRE_LOG_WARN("Session: malformed frame from " + server_name_ + ": " + err.message);
        process_->mark_degraded("malformed frame");
        return;
    }

    const auto& message = core::errors::get_value(frame);
    if (const auto* request = std::get_if<protocol::Request>(&message)) {
        // Server-initiated requests: only ping is understood.
        protocol::JsonRpcMessage reply;
        if (request->method == "ping") {
            reply = protocol::Response{request->id, nlohmann::json::object()};
        } else {
            reply = protocol::ErrorResponse{request->id, protocol::error_codes::kMethodNotFound,
                                            "Method not found: " + request->method};
        }
        auto written =
            process_->stdin_writer().write(reply, rpc::Clock::now() + call_timeout_);
        if (core::errors::is_error(written)) {
            TOOLWIRE_LOG_WARN("Session: could not answer " + request->method + " from " +
                              server_name_);
        }
        return;
    }
    if (const auto* notification = std::get_if<protocol::Notification>(&message)) {
        TOOLWIRE_LOG_DEBUG("Session: notification from " + server_name_ + ": " +
                           notification->method);
        return;
    }

    if (correlator_->dispatch(message) == rpc::DispatchOutcome::Unmatched) {
        process_->mark_degraded("response for an unknown request id");
    }
}

void Session::handle_exit() {
    static_cast<void>(process_->reap(kExitReapWait));
    static_cast<void>(process_->pump_stderr());

    std::string detail = "tool server '" + server_name_ + "' " + process_->exit_description();
    const std::string tail = process_->stderr_tail();
    if (!tail.empty()) {
        detail += "; stderr: " + tail;
    }
    TOOLWIRE_LOG_WARN("Session: " + detail);

    // Closed before the pending calls learn about it, so no caller observes a
    // Ready session after its call failed with ProcessExited.
    set_state(SessionState::Closed, "process exited");
    correlator_->fail_all(TransportErrorCause::ProcessExited, detail);
}

}  // namespace toolwire::session
