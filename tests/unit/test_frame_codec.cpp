#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/jsonrpc_message.hpp"
#include "transport/frame_codec.hpp"

namespace {

using nlohmann::json;
using toolwire::core::errors::get_error;
using toolwire::core::errors::get_value;
using toolwire::core::errors::is_error;
using toolwire::protocol::JsonRpcMessage;
using toolwire::protocol::Notification;
using toolwire::protocol::Request;
using toolwire::protocol::Response;
using toolwire::transport::encode;
using toolwire::transport::FrameDecoder;

std::vector<JsonRpcMessage> drain(FrameDecoder& decoder) {
    std::vector<JsonRpcMessage> out;
    while (auto frame = decoder.next()) {
        EXPECT_FALSE(is_error(*frame));
        if (!is_error(*frame)) {
            out.push_back(get_value(*frame));
        }
    }
    return out;
}

TEST(FrameCodecTest, EncodesOneCompactLine) {
    const std::string frame = encode(Request{1, "tools/list", json::object()});
    EXPECT_EQ(frame.find('\n'), frame.size() - 1);
    EXPECT_EQ(json::parse(frame)["method"], "tools/list");
}

TEST(FrameCodecTest, BuffersPartialReads) {
    const std::string frame = encode(Response{4, json{{"text", "hello"}}});
    FrameDecoder decoder;

    for (std::size_t i = 0; i + 1 < frame.size(); ++i) {
        ASSERT_TRUE(decoder.feed(std::string_view(&frame[i], 1)));
        EXPECT_FALSE(decoder.next().has_value());
    }
    ASSERT_TRUE(decoder.feed("\n"));
    const auto messages = drain(decoder);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], JsonRpcMessage(Response{4, json{{"text", "hello"}}}));
}

TEST(FrameCodecTest, SplitsSeveralFramesInOneChunk) {
    const std::string chunk = encode(Request{1, "a", json::object()}) +
                              encode(Notification{"b", json::object()}) +
                              encode(Response{1, json::object()});
    FrameDecoder decoder;
    decoder.feed(chunk);
    const auto messages = drain(decoder);
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<Request>(messages[0]));
    EXPECT_TRUE(std::holds_alternative<Notification>(messages[1]));
    EXPECT_TRUE(std::holds_alternative<Response>(messages[2]));
}

TEST(FrameCodecTest, ToleratesCarriageReturnAndBlankLines) {
    FrameDecoder decoder;
    decoder.feed("\n  \r\n{\"id\":2,\"result\":{}}\r\n\n");
    const auto messages = drain(decoder);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], JsonRpcMessage(Response{2, json::object()}));
}

TEST(FrameCodecTest, MalformedLineDoesNotPoisonTheStream) {
    FrameDecoder decoder;
    decoder.feed("not json\n{\"id\":1}\n{\"id\":5,\"result\":{}}\n");

    auto first = decoder.next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(is_error(*first));
    EXPECT_EQ(get_error(*first).code, "malformed_frame");
    EXPECT_TRUE(toolwire::transport::is_parse_failure(get_error(*first)));

    auto second = decoder.next();
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(is_error(*second));
    EXPECT_FALSE(toolwire::transport::is_parse_failure(get_error(*second)));

    auto third = decoder.next();
    ASSERT_TRUE(third.has_value());
    ASSERT_FALSE(is_error(*third));
    EXPECT_EQ(get_value(*third), JsonRpcMessage(Response{5, json::object()}));
}

TEST(FrameCodecTest, RejectsOversizedFrameAndResynchronizes) {
    FrameDecoder decoder(32);
    decoder.feed(std::string(40, 'x'));

    auto oversized = decoder.next();
    ASSERT_TRUE(oversized.has_value());
    ASSERT_TRUE(is_error(*oversized));
    EXPECT_EQ(get_error(*oversized).code, "malformed_frame");
    EXPECT_EQ(decoder.buffered_bytes(), 0u);

    // Remainder of the long line is dropped; the next line decodes normally.
    decoder.feed(std::string(10, 'y') + "\n{\"id\":9,\"result\":{}}\n");
    const auto messages = drain(decoder);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], JsonRpcMessage(Response{9, json::object()}));
}

TEST(FrameCodecTest, FinishFlushesUnterminatedTailAndStops) {
    FrameDecoder decoder;
    decoder.feed("{\"method\":\"bye\"}");
    EXPECT_FALSE(decoder.next().has_value());

    decoder.finish();
    const auto messages = drain(decoder);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], JsonRpcMessage(Notification{"bye", json::object()}));
    EXPECT_TRUE(decoder.exhausted());

    EXPECT_FALSE(decoder.feed("{\"method\":\"late\"}\n"));
    EXPECT_FALSE(decoder.next().has_value());
}

}  // namespace
