// Scriptable tool server for the integration tests.
//
//   --concurrent        handle tools/call on worker threads
//   --garbage-on-start  write a non-JSON line before serving
//   --fail-initialize   answer initialize with a JSON-RPC error
//   --no-initialize     never answer initialize
//   --exit-immediately  exit with status 3 before reading anything
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "core/errors/toolwire_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc_message.hpp"
#include "server/stdio_server.hpp"
#include "transport/frame_writer.hpp"

namespace {

using nlohmann::json;
using toolwire::protocol::ToolReply;
using toolwire::server::ServedTool;

json schema(const json& properties, const json& required = json::array()) {
    return json{{"type", "object"}, {"properties", properties}, {"required", required}};
}

std::vector<ServedTool> fixture_tools() {
    std::vector<ServedTool> tools;

    tools.push_back(ServedTool{
        "echo", "Returns its text argument.",
        schema({{"text", {{"type", "string"}}}}, json::array({"text"})),
        [](const json& arguments) {
            return ToolReply{true, arguments.value("text", ""), "", 0.0};
        }});

    tools.push_back(ServedTool{
        "slow", "Sleeps delay_ms, then returns text.",
        schema({{"delay_ms", {{"type", "integer"}}}, {"text", {{"type", "string"}}}}),
        [](const json& arguments) {
            const int delay = arguments.value("delay_ms", 0);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            return ToolReply{true, arguments.value("text", "done"), "", static_cast<double>(delay)};
        }});

    tools.push_back(ServedTool{
        "fail", "Always reports a tool error.",
        schema({{"message", {{"type", "string"}}}}),
        [](const json& arguments) {
            return ToolReply{false, "", arguments.value("message", "failed on purpose"), 0.0};
        }});

    tools.push_back(ServedTool{
        "crash", "Exits the process without answering.",
        schema({{"code", {{"type", "integer"}}}}),
        [](const json& arguments) -> ToolReply {
            std::_Exit(arguments.value("code", 7));
        }});

    tools.push_back(ServedTool{
        "crash_once", "Exits the first time it sees a new marker path, then answers.",
        schema({{"marker", {{"type", "string"}}}}, json::array({"marker"})),
        [](const json& arguments) -> ToolReply {
            const std::string marker = arguments.value("marker", "");
            if (std::ifstream(marker).good()) {
                return ToolReply{true, "recovered", "", 0.0};
            }
            std::ofstream(marker) << "crashed\n";
            std::_Exit(7);
        }});

    tools.push_back(ServedTool{
        "garbage", "Writes a malformed line and an unmatched response, then answers.",
        schema(json::object()),
        [](const json&) {
            toolwire::transport::FrameWriter raw(STDOUT_FILENO);
            static_cast<void>(raw.write_raw("this is not json\n"));
            static_cast<void>(raw.write(toolwire::protocol::Response{987654, json::object()}));
            return ToolReply{true, "ok", "", 0.0};
        }});

    return tools;
}

}  // namespace

int main(int argc, char* argv[]) {
    toolwire::core::logging::Logger::get().set_context("fake_tool_server");
    toolwire::core::logging::Logger::get().set_min_level(toolwire::core::logging::LogLevel::DEBUG);

    bool concurrent = false;
    bool garbage_on_start = false;
    bool fail_initialize = false;
    bool no_initialize = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--concurrent") concurrent = true;
        else if (arg == "--garbage-on-start") garbage_on_start = true;
        else if (arg == "--fail-initialize") fail_initialize = true;
        else if (arg == "--no-initialize") no_initialize = true;
        else if (arg == "--exit-immediately") return 3;
    }

    if (garbage_on_start) {
        toolwire::transport::FrameWriter raw(STDOUT_FILENO);
        static_cast<void>(raw.write_raw("{not json at all\n"));
    }

    toolwire::server::StdioServer server(
        toolwire::server::StdioServerOptions{"fake-tool-server", "0.1.0", concurrent},
        fixture_tools());
    if (fail_initialize) {
        server.set_method_handler("initialize", [](const json&) -> toolwire::core::errors::Result<json> {
            return toolwire::core::errors::ToolwireError{
                toolwire::core::errors::ErrorCategory::Internal, "initialize refused by fixture",
                "fixture"};
        });
    }
    if (no_initialize) {
        server.set_method_handler("initialize", [](const json&) -> toolwire::core::errors::Result<json> {
            std::this_thread::sleep_for(std::chrono::seconds(30));
            return json::object();
        });
    }

    TOOLWIRE_LOG_INFO("fake_tool_server: ready");
    return server.run(STDIN_FILENO, STDOUT_FILENO);
}
