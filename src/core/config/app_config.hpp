#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/toolwire_errors.hpp"
#include "process/process_supervisor.hpp"
#include "routing/tool_router.hpp"

namespace toolwire::core::config {

    // Where a routed tool actually lives
    struct ToolBinding {
        std::string tool;                                   // name the router uses
        std::string server;                                 // key into AppConfig::servers
        std::string remote_tool;                            // name in the server's catalog
        std::map<std::string, std::string> argument_map;    // routed argument -> remote argument
        std::string locate_tool;                            // searches for a missing "path"; empty: off
    };

    // Validated, immutable once loaded
    struct AppConfig {
        std::map<std::string, process::ServerSpec> servers;
        std::map<std::string, ToolBinding> tools;
        std::map<std::string, routing::AgentProfile> agents;
    };

    // Relative working directories are resolved against base_dir.
    errors::Result<AppConfig> parse_config(const nlohmann::json& document,
                                           const std::filesystem::path& base_dir = ".");

    errors::Result<AppConfig> load_config(const std::filesystem::path& path);

    // Cross-reference checks: tools -> servers, agent rules (with their
    // variants and fallbacks) -> tools.
    errors::Result<bool> validate_config(const AppConfig& config);

    errors::Result<routing::AgentProfile> find_agent(const AppConfig& config,
                                                     const std::string& agent);

    // The stock agents and their triggers, with the filesystem server rooted at fs_root.
    AppConfig default_config(const std::string& fs_server_command = "toolwire_fs_server",
                             const std::filesystem::path& fs_root = ".");

} // namespace toolwire::core::config
