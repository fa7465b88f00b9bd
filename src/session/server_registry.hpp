#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/errors/toolwire_errors.hpp"
#include "process/process_supervisor.hpp"
#include "session/session.hpp"

namespace toolwire::session {

// Owns one session per configured tool server.
class ServerRegistry {
public:
    ServerRegistry(std::map<std::string, process::ServerSpec> servers,
                   SessionOptions options = {});
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    // Opens every configured server, continuing past failures. Returns the
    // errors keyed by server name; empty when all came up.
    std::map<std::string, core::errors::ToolwireError> open_all();

    core::errors::Result<std::shared_ptr<Session>> open(const std::string& server);
    core::errors::Result<std::shared_ptr<Session>> session(const std::string& server) const;

    // Replaces the server's session with a freshly opened one. A Ready session
    // is kept unless it is `stale`, so callers racing to recover the same
    // failure share one restart.
    core::errors::Result<std::shared_ptr<Session>> reopen(
        const std::string& server, const std::shared_ptr<Session>& stale = nullptr);

    void close_all();

    std::vector<std::string> server_names() const;

private:
    core::errors::Result<std::shared_ptr<Session>> open_locked(const std::string& server);

    process::ProcessSupervisor supervisor_;
    std::map<std::string, process::ServerSpec> servers_;
    SessionOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

}  // namespace toolwire::session
