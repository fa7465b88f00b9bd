#include "session/sync_bridge.hpp"

#include "core/logging/logger.hpp"

namespace toolwire::session {

std::shared_ptr<std::mutex> SyncBridge::lane_for(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(lanes_mutex_);
    prune_locked();
    auto& slot = lanes_[session_id];
    auto lane = slot.lock();
    if (!lane) {
        lane = std::make_shared<std::mutex>();
        slot = lane;
    }
    return lane;
}

void SyncBridge::prune_locked() {
    for (auto it = lanes_.begin(); it != lanes_.end();) {
        if (it->second.expired()) {
            it = lanes_.erase(it);
        } else {
            ++it;
        }
    }
}

core::errors::Result<protocol::ToolInvocationResult> SyncBridge::invoke(
    Session& session, const std::string& tool, const nlohmann::json& arguments) {
    const auto lane = lane_for(session.id());
    std::lock_guard<std::mutex> serialized(*lane);

    TOOLWIRE_LOG_DEBUG("SyncBridge: invoking " + tool + " on " + session.server_name());
    auto result = session.call_tool(tool, arguments);
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        TOOLWIRE_LOG_WARN("SyncBridge: " + tool + " rejected [" + err.code + "]: " + err.message);
        return result;
    }
    if (!protocol::is_success(core::errors::get_value(result))) {
        TOOLWIRE_LOG_WARN("SyncBridge: " + tool + " on " + session.server_name() + ": " +
                          protocol::render_for_user(core::errors::get_value(result)));
    }
    return result;
}

std::size_t SyncBridge::lane_count() {
    std::lock_guard<std::mutex> lock(lanes_mutex_);
    prune_locked();
    return lanes_.size();
}

}  // namespace toolwire::session
