#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "core/config/app_config.hpp"
#include "core/errors/toolwire_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "routing/tool_router.hpp"
#include "session/server_registry.hpp"
#include "session/sync_bridge.hpp"

namespace toolwire::runtime {

struct DispatchOptions {
    bool reopen_closed_sessions = true;
    // A call that loses its server is retried once on a restarted one.
    bool retry_after_restart = true;
    std::chrono::milliseconds restart_backoff{250};
};

// Executes a routing decision: binding lookup, argument renaming, then a
// blocking call through the bridge.
//
// For bindings with a locate_tool, a "path" that does not exist is resolved
// the way a person would: first under the directory the message named, then
// by searching the tree. One match is read; several, or only near misses,
// come back as Input errors listing the candidates.
class ToolDispatcher {
public:
    ToolDispatcher(const core::config::AppConfig& config, session::ServerRegistry& registry,
                   session::SyncBridge& bridge, DispatchOptions options = {});

    core::errors::Result<protocol::ToolInvocationResult> dispatch(
        const routing::RoutingDecision& decision);

private:
    core::errors::Result<protocol::ToolInvocationResult> call(
        const std::string& server, std::shared_ptr<session::Session>& session,
        const std::string& remote_tool, const nlohmann::json& arguments);

    core::errors::Result<protocol::ToolInvocationResult> read_with_resolution(
        const core::config::ToolBinding& binding, std::shared_ptr<session::Session>& session,
        const routing::ToolSelection& selection);

    const core::config::AppConfig& config_;
    session::ServerRegistry& registry_;
    session::SyncBridge& bridge_;
    DispatchOptions options_;
};

}  // namespace toolwire::runtime
