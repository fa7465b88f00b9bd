#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "core/errors/toolwire_errors.hpp"
#include "protocol/jsonrpc_message.hpp"

namespace toolwire::transport {

constexpr std::size_t kDefaultMaxFrameBytes = 16 * 1024 * 1024;

// One compact JSON document followed by a single '\n'.
std::string encode(const protocol::JsonRpcMessage& message);

// Parses one line (without its terminator) into a message.
core::errors::Result<protocol::JsonRpcMessage> decode_line(std::string_view line);

// True when a decode error means the line was not JSON at all, as opposed to
// JSON that fits no message shape.
bool is_parse_failure(const core::errors::ToolwireError& error);

// Incremental newline-delimited decoder. Bytes arrive in arbitrary chunks via
// feed(); next() hands out complete frames in arrival order. Once finish() has
// been called and the buffer is drained the decoder is exhausted for good.
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

    // Returns false (and drops the bytes) when the stream already ended.
    bool feed(std::string_view bytes);

    // Marks end of stream; a trailing unterminated line becomes a final frame.
    void finish();

    // A frame (or a MalformedFrame error for a bad line), or nullopt if no
    // complete line is buffered yet.
    std::optional<core::errors::Result<protocol::JsonRpcMessage>> next();

    bool exhausted() const;
    std::size_t buffered_bytes() const { return buffer_.size(); }

private:
    std::size_t max_frame_bytes_;
    std::string buffer_;
    std::size_t scan_from_ = 0;
    bool finished_ = false;
    bool discarding_ = false;
};

}  // namespace toolwire::transport
