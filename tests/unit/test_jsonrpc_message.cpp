#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/jsonrpc_message.hpp"
#include "transport/frame_codec.hpp"

namespace {

using nlohmann::json;
using toolwire::core::errors::get_error;
using toolwire::core::errors::get_value;
using toolwire::core::errors::is_error;
using toolwire::protocol::ErrorResponse;
using toolwire::protocol::from_document;
using toolwire::protocol::JsonRpcMessage;
using toolwire::protocol::Notification;
using toolwire::protocol::Request;
using toolwire::protocol::Response;
using toolwire::protocol::to_document;

JsonRpcMessage through_the_wire(const JsonRpcMessage& message) {
    const std::string frame = toolwire::transport::encode(message);
    EXPECT_EQ(frame.back(), '\n');
    auto decoded = toolwire::transport::decode_line(
        std::string_view(frame).substr(0, frame.size() - 1));
    EXPECT_FALSE(is_error(decoded));
    return get_value(decoded);
}

TEST(JsonRpcMessageTest, EveryShapeSurvivesTheWire) {
    const JsonRpcMessage request =
        Request{7, "tools/call", json{{"name", "read_file"}, {"arguments", {{"file_path", "a.txt"}}}}};
    const JsonRpcMessage response = Response{7, json{{"content", json::array()}}};
    const JsonRpcMessage error = ErrorResponse{7, -32601, "Method not found"};
    const JsonRpcMessage anonymous_error = ErrorResponse{std::nullopt, -32700, "Parse error"};
    const JsonRpcMessage notification = Notification{"notifications/initialized", json::object()};

    EXPECT_EQ(through_the_wire(request), request);
    EXPECT_EQ(through_the_wire(response), response);
    EXPECT_EQ(through_the_wire(error), error);
    EXPECT_EQ(through_the_wire(anonymous_error), anonymous_error);
    EXPECT_EQ(through_the_wire(notification), notification);
}

TEST(JsonRpcMessageTest, EncodesVersionAndNullId) {
    const auto document = to_document(ErrorResponse{std::nullopt, -32700, "bad"});
    EXPECT_EQ(document["jsonrpc"], "2.0");
    EXPECT_TRUE(document["id"].is_null());
    EXPECT_EQ(document["error"]["code"], -32700);

    const auto request = to_document(Request{1, "initialize", json::object()});
    EXPECT_EQ(request["jsonrpc"], "2.0");
    EXPECT_EQ(request["id"], 1);
    EXPECT_TRUE(request["params"].is_object());
}

TEST(JsonRpcMessageTest, AcceptsFramesWithoutVersion) {
    auto decoded = from_document(json{{"id", 3}, {"result", {{"ok", true}}}});
    ASSERT_FALSE(is_error(decoded));
    const auto* response = std::get_if<Response>(&get_value(decoded));
    ASSERT_NE(response, nullptr);
    EXPECT_EQ(response->id, 3);
}

TEST(JsonRpcMessageTest, MissingParamsBecomeEmptyObject) {
    auto decoded = from_document(json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    ASSERT_FALSE(is_error(decoded));
    const auto* request = std::get_if<Request>(&get_value(decoded));
    ASSERT_NE(request, nullptr);
    EXPECT_EQ(request->params, json::object());
}

TEST(JsonRpcMessageTest, RejectsShapesThatMatchNoVariant) {
    const json cases[] = {
        json::array({1, 2}),
        json{{"jsonrpc", "1.0"}, {"id", 1}, {"result", json::object()}},
        json{{"id", 1}},
        json{{"id", 1}, {"result", json::object()}, {"error", {{"code", 1}, {"message", "x"}}}},
        json{{"id", "abc"}, {"method", "x"}},
        json{{"id", 1}, {"method", 5}},
        json{{"id", 1}, {"method", "x"}, {"params", "scalar"}},
        json{{"id", 1}, {"error", {{"code", "bad"}, {"message", "x"}}}},
        json{{"id", 1}, {"error", {{"code", 1}}}},
        json{{"method", "x"}, {"id", 1.5}},
    };
    for (const auto& document : cases) {
        auto decoded = from_document(document);
        ASSERT_TRUE(is_error(decoded)) << document.dump();
        EXPECT_EQ(get_error(decoded).code, "malformed_frame");
    }
}

TEST(JsonRpcMessageTest, RejectsNumbersThatWouldWrap) {
    const char* frames[] = {
        R"({"jsonrpc":"2.0","id":18446744073709551615,"result":{}})",
        R"({"jsonrpc":"2.0","id":9223372036854775808,"method":"ping"})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":4294967296,"message":"x"}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-2147483649,"message":"x"}})",
        R"({"jsonrpc":"2.0","id":1,"error":{"code":2147483648,"message":"x"}})",
    };
    for (const char* frame : frames) {
        auto decoded = toolwire::transport::decode_line(frame);
        ASSERT_TRUE(is_error(decoded)) << frame;
        EXPECT_EQ(get_error(decoded).code, "malformed_frame");
    }
}

TEST(JsonRpcMessageTest, AcceptsNumbersAtTheirLimits) {
    auto largest_id =
        toolwire::transport::decode_line(R"({"jsonrpc":"2.0","id":9223372036854775807,"result":{}})");
    ASSERT_FALSE(is_error(largest_id));
    EXPECT_EQ(std::get<Response>(get_value(largest_id)).id, 9223372036854775807LL);

    auto lowest_code = toolwire::transport::decode_line(
        R"({"jsonrpc":"2.0","id":2,"error":{"code":-2147483648,"message":"x"}})");
    ASSERT_FALSE(is_error(lowest_code));
    EXPECT_EQ(std::get<ErrorResponse>(get_value(lowest_code)).code, -2147483647 - 1);
}

TEST(JsonRpcMessageTest, DescribesMessagesForLogs) {
    EXPECT_EQ(toolwire::protocol::describe(Request{3, "tools/call", json::object()}),
              "request #3 tools/call");
    EXPECT_EQ(toolwire::protocol::describe(Notification{"ping", json::object()}),
              "notification ping");
    EXPECT_EQ(toolwire::protocol::describe(ErrorResponse{std::nullopt, -32700, "x"}),
              "error response #null (-32700: x)");
}

}  // namespace
