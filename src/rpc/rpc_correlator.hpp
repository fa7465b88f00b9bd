#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/toolwire_errors.hpp"
#include "protocol/jsonrpc_message.hpp"
#include "protocol/tool_contract.hpp"

namespace toolwire::rpc {

// The peer answered with a JSON-RPC error object.
struct RemoteError {
    int code = 0;
    std::string message;
};

// The call never got an answer.
struct TransportFailure {
    protocol::TransportErrorCause cause;
    std::string detail;
};

// Exactly one of: the "result" object, a remote error, or a transport failure.
using RpcOutcome = std::variant<nlohmann::json, RemoteError, TransportFailure>;

using Clock = std::chrono::steady_clock;

// Writes one frame, giving up at the deadline. A "write_timeout" error means
// nothing was sent.
using FrameSink = std::function<core::errors::Result<std::size_t>(
    const protocol::JsonRpcMessage&, Clock::time_point deadline)>;

struct PendingCallHandle {
    protocol::RequestId id = 0;
    Clock::time_point deadline;
    std::shared_future<RpcOutcome> outcome;
};

enum class DispatchOutcome {
    Resolved,       // fulfilled a pending call
    LateDiscarded,  // answer to a call that already timed out
    Unmatched,      // id was never issued or already answered
    Ignored         // not a response
};

struct RpcStats {
    std::uint64_t issued = 0;
    std::uint64_t resolved = 0;
    std::uint64_t timed_out = 0;
    std::uint64_t late_discarded = 0;
    std::uint64_t protocol_violations = 0;
    std::uint64_t failed = 0;
};

// Matches responses to requests by id. Each pending call owns a promise that
// is fulfilled exactly once, by whichever path first removes the entry from
// the pending map (response, deadline, send failure or fail_all).
class RpcCorrelator {
public:
    RpcCorrelator(FrameSink sink, std::string label);
    ~RpcCorrelator();

    RpcCorrelator(const RpcCorrelator&) = delete;
    RpcCorrelator& operator=(const RpcCorrelator&) = delete;

    PendingCallHandle begin_call(const std::string& method, nlohmann::json params,
                                 std::chrono::milliseconds timeout);

    // Blocks until the outcome is known or the deadline passes.
    RpcOutcome await(const PendingCallHandle& handle);

    RpcOutcome call(const std::string& method, nlohmann::json params,
                    std::chrono::milliseconds timeout);

    core::errors::Result<std::size_t> notify(const std::string& method,
                                             nlohmann::json params = nlohmann::json::object(),
                                             std::chrono::milliseconds timeout =
                                                 std::chrono::milliseconds(5000));

    // Routes a Response or ErrorResponse read from the peer.
    DispatchOutcome dispatch(const protocol::JsonRpcMessage& message);

    // Resolves every call whose deadline is at or before `now` with Timeout.
    std::size_t expire_overdue(Clock::time_point now = Clock::now());

    // Resolves every pending call with `cause`; later calls fail immediately.
    void fail_all(protocol::TransportErrorCause cause, const std::string& detail);

    bool is_closed() const;
    std::size_t pending_count() const;
    RpcStats stats() const;

private:
    struct PendingCall {
        std::string method;
        Clock::time_point issued_at;
        Clock::time_point deadline;
        std::promise<RpcOutcome> promise;
    };

    bool expire(protocol::RequestId id);
    void remember_timed_out_locked(protocol::RequestId id);

    FrameSink sink_;
    std::string label_;

    mutable std::mutex mutex_;
    protocol::RequestId next_id_ = 1;
    std::unordered_map<protocol::RequestId, PendingCall> pending_;
    std::unordered_set<protocol::RequestId> timed_out_;
    std::deque<protocol::RequestId> timed_out_order_;
    bool closed_ = false;
    protocol::TransportErrorCause closed_cause_ = protocol::TransportErrorCause::SessionClosed;
    std::string closed_detail_;
    RpcStats stats_;
};

}  // namespace toolwire::rpc
