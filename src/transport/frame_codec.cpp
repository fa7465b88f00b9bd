#include "transport/frame_codec.hpp"

#include <nlohmann/json.hpp>

namespace toolwire::transport {

using core::errors::ErrorCategory;
using core::errors::ToolwireError;

namespace {

constexpr std::string_view kNotJson = "Line is not valid JSON";
constexpr std::string_view kOversized = "Frame exceeds ";

bool is_blank(std::string_view line) {
    for (const char c : line) {
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string encode(const protocol::JsonRpcMessage& message) {
    std::string frame = protocol::to_document(message).dump();
    frame.push_back('\n');
    return frame;
}

core::errors::Result<protocol::JsonRpcMessage> decode_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    const auto document = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (document.is_discarded()) {
        constexpr std::size_t kPreviewLength = 80;
        std::string preview(line.substr(0, kPreviewLength));
        if (line.size() > kPreviewLength) {
            preview += "...";
        }
        return ToolwireError{ErrorCategory::Protocol, std::string(kNotJson) + ": " + preview,
                             "malformed_frame"};
    }
    return protocol::from_document(document);
}

bool is_parse_failure(const core::errors::ToolwireError& error) {
    const std::string_view message(error.message);
    return message.substr(0, kNotJson.size()) == kNotJson ||
           message.substr(0, kOversized.size()) == kOversized;
}

FrameDecoder::FrameDecoder(const std::size_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {}

bool FrameDecoder::feed(std::string_view bytes) {
    if (finished_) {
        return false;
    }
    buffer_.append(bytes.data(), bytes.size());
    return true;
}

void FrameDecoder::finish() {
    finished_ = true;
}

bool FrameDecoder::exhausted() const {
    return finished_ && buffer_.empty();
}

std::optional<core::errors::Result<protocol::JsonRpcMessage>> FrameDecoder::next() {
    while (true) {
        const auto newline = buffer_.find('\n', scan_from_);
        if (newline == std::string::npos) {
            scan_from_ = buffer_.size();

            if (discarding_) {
                buffer_.clear();
                scan_from_ = 0;
                if (finished_) {
                    discarding_ = false;
                }
                return std::nullopt;
            }

            if (buffer_.size() > max_frame_bytes_) {
                buffer_.clear();
                scan_from_ = 0;
                discarding_ = !finished_;
                return ToolwireError{ErrorCategory::Protocol,
                                     std::string(kOversized) + std::to_string(max_frame_bytes_) +
                                         " bytes without a newline",
                                     "malformed_frame"};
            }

            if (finished_ && !buffer_.empty()) {
                std::string tail;
                tail.swap(buffer_);
                scan_from_ = 0;
                if (is_blank(tail)) {
                    return std::nullopt;
                }
                return decode_line(tail);
            }
            return std::nullopt;
        }

        std::string line = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);
        scan_from_ = 0;

        if (discarding_) {
            // Tail end of an oversized frame that was already reported.
            discarding_ = false;
            continue;
        }
        if (is_blank(line)) {
            continue;
        }
        if (line.size() > max_frame_bytes_) {
            return ToolwireError{ErrorCategory::Protocol,
                                 std::string(kOversized) + std::to_string(max_frame_bytes_) +
                                     " bytes",
                                 "malformed_frame"};
        }
        return decode_line(line);
    }
}

}  // namespace toolwire::transport
