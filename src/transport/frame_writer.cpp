#include "transport/frame_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include "transport/frame_codec.hpp"

namespace toolwire::transport {

using core::errors::ErrorCategory;
using core::errors::ToolwireError;

namespace {

constexpr int kPollSliceMs = 50;

}  // namespace

FrameWriter::FrameWriter(const int fd) : fd_(fd), closing_(fd < 0) {}

core::errors::Result<std::size_t> FrameWriter::write(const protocol::JsonRpcMessage& message,
                                                     const Clock::time_point deadline) {
    return write_raw(encode(message), deadline);
}

core::errors::Result<std::size_t> FrameWriter::write_raw(const std::string& bytes,
                                                         const Clock::time_point deadline) {
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (deadline == Clock::time_point::max()) {
        lock.lock();
    } else if (!lock.try_lock_until(deadline)) {
        return ToolwireError{ErrorCategory::Transport,
                             "Timed out waiting for another sender to finish.", "write_timeout"};
    }

    auto written = write_locked(bytes, deadline);
    lock.unlock();
    close_if_requested();
    return written;
}

core::errors::Result<std::size_t> FrameWriter::write_locked(const std::string& bytes,
                                                            const Clock::time_point deadline) {
    if (fd_ < 0 || closing_.load()) {
        return ToolwireError{ErrorCategory::Transport, "Channel is not open.",
                             "write_failed"};
    }

    std::size_t offset = 0;
    while (offset < bytes.size()) {
        const ssize_t n = ::write(fd_, bytes.data() + offset, bytes.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            bytes_written_ += static_cast<std::size_t>(n);
            continue;
        }
        if (n == 0) {
            return ToolwireError{ErrorCategory::Transport, "Channel accepted no bytes.",
                                 "write_failed"};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (closing_.load()) {
                return ToolwireError{ErrorCategory::Transport, "Channel closed during write.",
                                     "write_failed"};
            }
            const auto now = Clock::now();
            if (now >= deadline) {
                if (offset == 0) {
                    return ToolwireError{ErrorCategory::Transport,
                                         "Peer did not accept the frame before the deadline.",
                                         "write_timeout"};
                }
                return ToolwireError{ErrorCategory::Transport,
                                     "Frame cut off after " + std::to_string(offset) + " of " +
                                         std::to_string(bytes.size()) + " bytes.",
                                     "write_incomplete"};
            }
            int slice = kPollSliceMs;
            if (deadline != Clock::time_point::max()) {
                const auto left =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
                slice = static_cast<int>(std::max<long long>(
                    1, std::min<long long>(left, kPollSliceMs)));
            }
            pollfd pfd{fd_, POLLOUT, 0};
            static_cast<void>(poll(&pfd, 1, slice));
            continue;
        }
        return ToolwireError{ErrorCategory::Transport,
                             std::string("Failed to write frame: ") + std::strerror(errno),
                             "write_failed"};
    }
    return offset;
}

void FrameWriter::close() {
    closing_ = true;
    close_if_requested();
}

void FrameWriter::close_if_requested() {
    if (!closing_.load()) {
        return;
    }
    std::unique_lock<std::timed_mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        // The sender holding the lock closes after it returns.
        return;
    }
    if (fd_ >= 0) {
        static_cast<void>(::close(fd_));
        fd_ = -1;
    }
}

bool FrameWriter::is_open() const {
    return !closing_.load();
}

}  // namespace toolwire::transport
