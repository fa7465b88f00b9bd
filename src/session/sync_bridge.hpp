#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/toolwire_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "session/session.hpp"

namespace toolwire::session {

// Blocking entry point for synchronous callers. Calls on the same session run
// one at a time, in arrival order of the lane lock; calls on different
// sessions never wait on each other. A lane exists only while a call holds
// it, so sessions that come and go leave nothing behind.
class SyncBridge {
public:
    core::errors::Result<protocol::ToolInvocationResult> invoke(Session& session,
                                                                const std::string& tool,
                                                                const nlohmann::json& arguments);

    // Lanes with a call in flight or waiting.
    std::size_t lane_count();

private:
    std::shared_ptr<std::mutex> lane_for(const std::string& session_id);

    void prune_locked();

    std::mutex lanes_mutex_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> lanes_;
};

}  // namespace toolwire::session
