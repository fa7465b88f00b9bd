#include "rpc/rpc_correlator.hpp"

#include <optional>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolwire::rpc {

using protocol::TransportErrorCause;

namespace {

constexpr std::size_t kTimedOutMemory = 4096;

std::shared_future<RpcOutcome> resolved_future(RpcOutcome outcome) {
    std::promise<RpcOutcome> promise;
    promise.set_value(std::move(outcome));
    return promise.get_future().share();
}

}  // namespace

RpcCorrelator::RpcCorrelator(FrameSink sink, std::string label)
    : sink_(std::move(sink)), label_(std::move(label)) {}

RpcCorrelator::~RpcCorrelator() {
    fail_all(TransportErrorCause::SessionClosed, "correlator destroyed");
}

PendingCallHandle RpcCorrelator::begin_call(const std::string& method, nlohmann::json params,
                                            const std::chrono::milliseconds timeout) {
    PendingCallHandle handle;
    const auto now = Clock::now();
    handle.deadline = now + timeout;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            handle.outcome = resolved_future(TransportFailure{closed_cause_, closed_detail_});
            return handle;
        }
        handle.id = next_id_++;
        PendingCall call;
        call.method = method;
        call.issued_at = now;
        call.deadline = handle.deadline;
        handle.outcome = call.promise.get_future().share();
        pending_.emplace(handle.id, std::move(call));
        ++stats_.issued;
    }

    // Registered before sending so a fast response always finds its entry.
    auto sent = sink_(protocol::Request{handle.id, method, std::move(params)}, handle.deadline);
    if (core::errors::is_error(sent)) {
        const auto& err = core::errors::get_error(sent);
        const bool timed_out = err.code == "write_timeout";
        std::unique_lock<std::mutex> lock(mutex_);
        auto node = pending_.extract(handle.id);
        if (!node.empty()) {
            if (timed_out) {
                ++stats_.timed_out;
            } else {
                ++stats_.failed;
            }
            lock.unlock();
            TOOLWIRE_LOG_WARN("RpcCorrelator[" + label_ + "]: failed to send " + method +
                              " #" + std::to_string(handle.id) + ": " + err.message);
            node.mapped().promise.set_value(TransportFailure{
                timed_out ? TransportErrorCause::Timeout : TransportErrorCause::SendFailed,
                err.message});
        }
    }
    return handle;
}

RpcOutcome RpcCorrelator::await(const PendingCallHandle& handle) {
    if (handle.outcome.wait_until(handle.deadline) != std::future_status::ready) {
        static_cast<void>(expire(handle.id));
    }
    return handle.outcome.get();
}

RpcOutcome RpcCorrelator::call(const std::string& method, nlohmann::json params,
                               const std::chrono::milliseconds timeout) {
    return await(begin_call(method, std::move(params), timeout));
}

core::errors::Result<std::size_t> RpcCorrelator::notify(const std::string& method,
                                                        nlohmann::json params,
                                                        const std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return core::errors::ToolwireError{core::errors::ErrorCategory::State,
                                               "Cannot notify " + method + ": channel closed.",
                                               "session_closed"};
        }
    }
    return sink_(protocol::Notification{method, std::move(params)}, Clock::now() + timeout);
}

DispatchOutcome RpcCorrelator::dispatch(const protocol::JsonRpcMessage& message) {
    std::optional<protocol::RequestId> id;
    RpcOutcome outcome;
    if (const auto* response = std::get_if<protocol::Response>(&message)) {
        id = response->id;
        outcome = response->result;
    } else if (const auto* error = std::get_if<protocol::ErrorResponse>(&message)) {
        id = error->id;
        outcome = RemoteError{error->code, error->message};
    } else {
        return DispatchOutcome::Ignored;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (!id.has_value()) {
        ++stats_.protocol_violations;
        lock.unlock();
        TOOLWIRE_LOG_ERROR("RpcCorrelator[" + label_ + "]: error response without id: " +
                           protocol::describe(message));
        return DispatchOutcome::Unmatched;
    }

    auto node = pending_.extract(*id);
    if (node.empty()) {
        if (timed_out_.count(*id) > 0) {
            ++stats_.late_discarded;
            lock.unlock();
            TOOLWIRE_LOG_DEBUG("RpcCorrelator[" + label_ + "]: discarding late response #" +
                               std::to_string(*id));
            return DispatchOutcome::LateDiscarded;
        }
        ++stats_.protocol_violations;
        lock.unlock();
        TOOLWIRE_LOG_ERROR("RpcCorrelator[" + label_ + "]: response for unknown id #" +
                           std::to_string(*id));
        return DispatchOutcome::Unmatched;
    }
    ++stats_.resolved;
    lock.unlock();

    node.mapped().promise.set_value(std::move(outcome));
    return DispatchOutcome::Resolved;
}

bool RpcCorrelator::expire(const protocol::RequestId id) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto node = pending_.extract(id);
    if (node.empty()) {
        return false;
    }
    ++stats_.timed_out;
    remember_timed_out_locked(id);
    lock.unlock();

    const auto& call = node.mapped();
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - call.issued_at);
    TOOLWIRE_LOG_WARN("RpcCorrelator[" + label_ + "]: " + call.method + " #" +
                      std::to_string(id) + " timed out after " +
                      std::to_string(waited.count()) + " ms");
    node.mapped().promise.set_value(TransportFailure{
        TransportErrorCause::Timeout,
        call.method + " got no response within the deadline"});
    return true;
}

std::size_t RpcCorrelator::expire_overdue(const Clock::time_point now) {
    std::vector<protocol::RequestId> overdue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, call] : pending_) {
            if (call.deadline <= now) {
                overdue.push_back(id);
            }
        }
    }
    std::size_t expired = 0;
    for (const auto id : overdue) {
        if (expire(id)) {
            ++expired;
        }
    }
    return expired;
}

void RpcCorrelator::fail_all(const TransportErrorCause cause, const std::string& detail) {
    std::unordered_map<protocol::RequestId, PendingCall> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            closed_ = true;
            closed_cause_ = cause;
            closed_detail_ = detail;
        }
        failed.swap(pending_);
        stats_.failed += failed.size();
    }
    if (!failed.empty()) {
        TOOLWIRE_LOG_WARN("RpcCorrelator[" + label_ + "]: failing " +
                          std::to_string(failed.size()) + " pending call(s): " +
                          protocol::to_string(cause));
    }
    for (auto& [id, call] : failed) {
        call.promise.set_value(TransportFailure{cause, detail});
    }
}

void RpcCorrelator::remember_timed_out_locked(const protocol::RequestId id) {
    timed_out_.insert(id);
    timed_out_order_.push_back(id);
    while (timed_out_order_.size() > kTimedOutMemory) {
        timed_out_.erase(timed_out_order_.front());
        timed_out_order_.pop_front();
    }
}

bool RpcCorrelator::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t RpcCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

RpcStats RpcCorrelator::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace toolwire::rpc
