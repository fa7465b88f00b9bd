#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include "core/errors/toolwire_errors.hpp"
#include "protocol/jsonrpc_message.hpp"

namespace toolwire::transport {

// Single-writer half of a duplex channel. Whole frames are written under one
// lock so concurrent senders never interleave bytes.
//
// A write gives up at its deadline, both while queued behind another sender
// and while the peer is not draining the pipe. Giving up before the first
// byte reports "write_timeout" and leaves the channel usable; giving up in
// the middle of a frame reports "write_incomplete" and the channel is
// corrupt. close() never waits for a stalled writer: the writer that holds
// the lock releases the descriptor on its way out.
class FrameWriter {
public:
    using Clock = std::chrono::steady_clock;

    explicit FrameWriter(int fd);

    core::errors::Result<std::size_t> write(const protocol::JsonRpcMessage& message,
                                            Clock::time_point deadline = Clock::time_point::max());
    core::errors::Result<std::size_t> write_raw(const std::string& bytes,
                                                Clock::time_point deadline = Clock::time_point::max());
    void close();
    bool is_open() const;

    std::size_t bytes_written() const { return bytes_written_.load(); }

private:
    core::errors::Result<std::size_t> write_locked(const std::string& bytes,
                                                   Clock::time_point deadline);
    void close_if_requested();

    int fd_;
    std::timed_mutex mutex_;
    std::atomic<bool> closing_;
    std::atomic<std::size_t> bytes_written_{0};
};

}  // namespace toolwire::transport
