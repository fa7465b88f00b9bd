#include "session/server_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace toolwire::session {

using core::errors::ErrorCategory;
using core::errors::ToolwireError;

ServerRegistry::ServerRegistry(std::map<std::string, process::ServerSpec> servers,
                               SessionOptions options)
    : servers_(std::move(servers)), options_(std::move(options)) {}

ServerRegistry::~ServerRegistry() {
    close_all();
}

std::map<std::string, ToolwireError> ServerRegistry::open_all() {
    std::map<std::string, ToolwireError> failures;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, spec] : servers_) {
        auto opened = open_locked(name);
        if (core::errors::is_error(opened)) {
            const auto& err = core::errors::get_error(opened);
            TOOLWIRE_LOG_ERROR("ServerRegistry: " + name + " unavailable [" + err.code +
                               "]: " + err.message);
            failures.emplace(name, err);
        }
    }
    TOOLWIRE_LOG_INFO("ServerRegistry: " + std::to_string(servers_.size() - failures.size()) +
                      "/" + std::to_string(servers_.size()) + " server(s) ready");
    return failures;
}

core::errors::Result<std::shared_ptr<Session>> ServerRegistry::open(const std::string& server) {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_locked(server);
}

core::errors::Result<std::shared_ptr<Session>> ServerRegistry::open_locked(
    const std::string& server) {
    const auto spec = servers_.find(server);
    if (spec == servers_.end()) {
        return ToolwireError{ErrorCategory::Config, "No server named '" + server + "' is configured.",
                             "unknown_server"};
    }

    const auto existing = sessions_.find(server);
    if (existing != sessions_.end() && existing->second->state() == SessionState::Ready) {
        return existing->second;
    }

    auto session = std::make_shared<Session>(supervisor_, options_);
    auto opened = session->open(spec->second);
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    if (existing != sessions_.end()) {
        existing->second->close();
    }
    sessions_[server] = session;
    return session;
}

core::errors::Result<std::shared_ptr<Session>> ServerRegistry::session(
    const std::string& server) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(server);
    if (it == sessions_.end()) {
        return ToolwireError{ErrorCategory::State,
                             "Server '" + server + "' has not been opened.",
                             "session_not_ready",
                             "Call open_all() or open() first."};
    }
    return it->second;
}

core::errors::Result<std::shared_ptr<Session>> ServerRegistry::reopen(
    const std::string& server, const std::shared_ptr<Session>& stale) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(server);
    if (it != sessions_.end() && it->second != stale &&
        it->second->state() == SessionState::Ready) {
        TOOLWIRE_LOG_DEBUG("ServerRegistry: " + server + " already replaced; reusing it");
        return it->second;
    }
    if (it != sessions_.end()) {
        TOOLWIRE_LOG_INFO("ServerRegistry: reopening " + server + " (was " +
                          to_string(it->second->state()) + ")");
        it->second->close();
        sessions_.erase(it);
    }
    return open_locked(server);
}

void ServerRegistry::close_all() {
    std::map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [name, session] : sessions) {
        session->close();
    }
}

std::vector<std::string> ServerRegistry::server_names() const {
    std::vector<std::string> names;
    for (const auto& [name, spec] : servers_) {
        names.push_back(name);
    }
    return names;
}

}  // namespace toolwire::session
