#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "process/process_supervisor.hpp"
#include "session/session.hpp"
#include "session/sync_bridge.hpp"

namespace {

using nlohmann::json;
using toolwire::core::errors::get_error;
using toolwire::core::errors::get_value;
using toolwire::core::errors::is_error;
using toolwire::process::ProcessSupervisor;
using toolwire::process::ServerSpec;
using toolwire::protocol::ToolSuccess;
using toolwire::session::Session;
using toolwire::session::SyncBridge;

using namespace std::chrono_literals;

ServerSpec concurrent_fake(const std::string& name) {
    ServerSpec spec;
    spec.name = name;
    spec.command = TOOLWIRE_FAKE_SERVER_PATH;
    spec.args = {"--concurrent"};
    return spec;
}

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

TEST(SyncBridgeTest, ReturnsToolOutput) {
    ProcessSupervisor supervisor;
    Session session(supervisor);
    ASSERT_FALSE(is_error(session.open(concurrent_fake("bridge"))));
    SyncBridge bridge;

    auto result = bridge.invoke(session, "echo", json{{"text", "through the bridge"}});
    ASSERT_FALSE(is_error(result));
    const auto* success = std::get_if<ToolSuccess>(&get_value(result));
    ASSERT_NE(success, nullptr);
    EXPECT_EQ(success->text, "through the bridge");
    EXPECT_EQ(bridge.lane_count(), 0u);
}

TEST(SyncBridgeTest, PassesRejectionsThrough) {
    ProcessSupervisor supervisor;
    Session session(supervisor);
    ASSERT_FALSE(is_error(session.open(concurrent_fake("bridge"))));
    SyncBridge bridge;

    auto result = bridge.invoke(session, "missing_tool", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_tool");
}

TEST(SyncBridgeTest, SerializesCallsOnOneSession) {
    ProcessSupervisor supervisor;
    Session session(supervisor);
    ASSERT_FALSE(is_error(session.open(concurrent_fake("serial"))));
    SyncBridge bridge;

    constexpr int kCallers = 3;
    const auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&bridge, &session]() {
            auto result = bridge.invoke(session, "slow", json{{"delay_ms", 200}});
            EXPECT_FALSE(is_error(result));
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    // The server could run them in parallel; the bridge must not let it.
    EXPECT_GE(elapsed_since(start), 580ms);
    EXPECT_EQ(bridge.lane_count(), 0u);
}

TEST(SyncBridgeTest, DifferentSessionsRunInParallel) {
    ProcessSupervisor supervisor;
    Session first(supervisor);
    Session second(supervisor);
    ASSERT_FALSE(is_error(first.open(concurrent_fake("left"))));
    ASSERT_FALSE(is_error(second.open(concurrent_fake("right"))));
    SyncBridge bridge;

    const auto start = std::chrono::steady_clock::now();
    std::thread left([&]() {
        EXPECT_FALSE(is_error(bridge.invoke(first, "slow", json{{"delay_ms", 500}})));
    });
    std::thread right([&]() {
        EXPECT_FALSE(is_error(bridge.invoke(second, "slow", json{{"delay_ms", 500}})));
    });
    left.join();
    right.join();

    EXPECT_LT(elapsed_since(start), 950ms);
    EXPECT_EQ(bridge.lane_count(), 0u);
}

TEST(SyncBridgeTest, LanesLastOnlyWhileCallsAreInFlight) {
    ProcessSupervisor supervisor;
    SyncBridge bridge;

    Session busy(supervisor);
    ASSERT_FALSE(is_error(busy.open(concurrent_fake("busy"))));
    std::thread caller([&]() {
        EXPECT_FALSE(is_error(bridge.invoke(busy, "slow", json{{"delay_ms", 400}})));
    });
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(bridge.lane_count(), 1u);
    caller.join();
    EXPECT_EQ(bridge.lane_count(), 0u);

    // Sessions that are opened, used and closed one after another.
    for (int i = 0; i < 5; ++i) {
        Session session(supervisor);
        ASSERT_FALSE(is_error(session.open(concurrent_fake("churn" + std::to_string(i)))));
        EXPECT_FALSE(is_error(bridge.invoke(session, "echo", json{{"text", "hi"}})));
        session.close();
    }
    EXPECT_EQ(bridge.lane_count(), 0u);
}

}  // namespace
