#include "core/config/app_config.hpp"

#include <cstdint>
#include <fstream>
#include <system_error>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolwire::core::config {

using errors::ErrorCategory;
using errors::ToolwireError;
using nlohmann::json;

namespace {

ToolwireError invalid(const std::string& message, const std::string& hint = "") {
    return ToolwireError{ErrorCategory::Config, message, "invalid_config", hint};
}

errors::Result<std::vector<std::string>> string_list(const json& value, const std::string& where) {
    if (!value.is_array()) {
        return invalid(where + " must be an array of strings.");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            return invalid(where + " must be an array of strings.");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

errors::Result<std::map<std::string, std::string>> string_map(const json& value,
                                                              const std::string& where) {
    if (!value.is_object()) {
        return invalid(where + " must be an object of strings.");
    }
    std::map<std::string, std::string> items;
    for (const auto& [key, item] : value.items()) {
        if (!item.is_string()) {
            return invalid(where + "." + key + " must be a string.");
        }
        items[key] = item.get<std::string>();
    }
    return items;
}

errors::Result<process::ServerSpec> parse_server(const std::string& name, const json& entry,
                                                 const std::filesystem::path& base_dir) {
    const std::string where = "servers." + name;
    if (!entry.is_object()) {
        return invalid(where + " must be an object.");
    }

    process::ServerSpec spec;
    spec.name = name;
    if (!entry.contains("command") || !entry["command"].is_string() ||
        entry["command"].get<std::string>().empty()) {
        return invalid(where + ".command must be a non-empty string.");
    }
    spec.command = entry["command"].get<std::string>();

    if (entry.contains("args")) {
        auto args = string_list(entry["args"], where + ".args");
        if (errors::is_error(args)) {
            return errors::get_error(args);
        }
        spec.args = errors::get_value(args);
    }
    if (entry.contains("env")) {
        auto env = string_map(entry["env"], where + ".env");
        if (errors::is_error(env)) {
            return errors::get_error(env);
        }
        spec.env = errors::get_value(env);
    }

    std::filesystem::path working_directory = ".";
    if (entry.contains("working_directory")) {
        if (!entry["working_directory"].is_string()) {
            return invalid(where + ".working_directory must be a string.");
        }
        working_directory = entry["working_directory"].get<std::string>();
    }
    spec.working_directory =
        working_directory.is_absolute() ? working_directory : base_dir / working_directory;

    if (entry.contains("call_timeout_ms")) {
        const auto& timeout = entry["call_timeout_ms"];
        if (!timeout.is_number_integer() || timeout.get<std::int64_t>() <= 0 ||
            timeout.get<std::int64_t>() > 3600000) {
            return invalid(where + ".call_timeout_ms must be a positive integer (ms).");
        }
        spec.call_timeout_ms = timeout.get<std::uint32_t>();
    }
    return spec;
}

errors::Result<ToolBinding> parse_tool(const std::string& name, const json& entry) {
    const std::string where = "tools." + name;
    if (!entry.is_object()) {
        return invalid(where + " must be an object.");
    }

    ToolBinding binding;
    binding.tool = name;
    if (!entry.contains("server") || !entry["server"].is_string()) {
        return invalid(where + ".server must be a string.");
    }
    binding.server = entry["server"].get<std::string>();

    binding.remote_tool = name;
    if (entry.contains("remote_tool")) {
        if (!entry["remote_tool"].is_string()) {
            return invalid(where + ".remote_tool must be a string.");
        }
        binding.remote_tool = entry["remote_tool"].get<std::string>();
    }
    if (entry.contains("argument_map")) {
        auto mapping = string_map(entry["argument_map"], where + ".argument_map");
        if (errors::is_error(mapping)) {
            return errors::get_error(mapping);
        }
        binding.argument_map = errors::get_value(mapping);
    }
    if (entry.contains("locate_tool")) {
        if (!entry["locate_tool"].is_string()) {
            return invalid(where + ".locate_tool must be a string.");
        }
        binding.locate_tool = entry["locate_tool"].get<std::string>();
    }
    return binding;
}

errors::Result<std::vector<std::string>> required_keywords(const json& entry,
                                                         const std::string& where) {
    if (!entry.contains("keywords")) {
        return invalid(where + ".keywords is required.");
    }
    return string_list(entry["keywords"], where + ".keywords");
}

errors::Result<std::string> tool_name(const json& entry, const std::string& where) {
    if (!entry.is_object() || !entry.contains("tool") || !entry["tool"].is_string()) {
        return invalid(where + ".tool must be a string.");
    }
    return entry["tool"].get<std::string>();
}

errors::Result<bool> parse_rule_extras(const json& rule_entry, const std::string& where,
                                       routing::TriggerRule& rule) {
    if (rule_entry.contains("variants")) {
        if (!rule_entry["variants"].is_array()) {
            return invalid(where + ".variants must be an array.");
        }
        for (std::size_t i = 0; i < rule_entry["variants"].size(); ++i) {
            const auto& variant_entry = rule_entry["variants"][i];
            const std::string variant_where = where + ".variants[" + std::to_string(i) + "]";
            auto tool = tool_name(variant_entry, variant_where);
            if (errors::is_error(tool)) {
                return errors::get_error(tool);
            }
            auto keywords = required_keywords(variant_entry, variant_where);
            if (errors::is_error(keywords)) {
                return errors::get_error(keywords);
            }
            rule.variants.push_back(
                routing::ToolVariant{errors::get_value(tool), errors::get_value(keywords)});
        }
    }

    if (rule_entry.contains("fallback")) {
        const auto& fallback_entry = rule_entry["fallback"];
        const std::string fallback_where = where + ".fallback";
        auto tool = tool_name(fallback_entry, fallback_where);
        if (errors::is_error(tool)) {
            return errors::get_error(tool);
        }
        auto keywords = required_keywords(fallback_entry, fallback_where);
        if (errors::is_error(keywords)) {
            return errors::get_error(keywords);
        }
        routing::ArgumentFallback fallback;
        fallback.tool = errors::get_value(tool);
        fallback.keywords = errors::get_value(keywords);
        const auto arguments = fallback_entry.find("arguments");
        if (arguments != fallback_entry.end()) {
            if (!arguments->is_object()) {
                return invalid(fallback_where + ".arguments must be an object.");
            }
            fallback.arguments = *arguments;
        }
        rule.fallback = std::move(fallback);
    }
    return true;
}

errors::Result<routing::AgentProfile> parse_agent(const std::string& name, const json& entry) {
    const std::string where = "agents." + name;
    if (!entry.is_object()) {
        return invalid(where + " must be an object.");
    }

    routing::AgentProfile profile;
    profile.name = name;
    if (entry.contains("rules")) {
        if (!entry["rules"].is_array()) {
            return invalid(where + ".rules must be an array.");
        }
        for (std::size_t i = 0; i < entry["rules"].size(); ++i) {
            const auto& rule_entry = entry["rules"][i];
            const std::string rule_where = where + ".rules[" + std::to_string(i) + "]";
            if (!rule_entry.is_object() || !rule_entry.contains("tool") ||
                !rule_entry["tool"].is_string()) {
                return invalid(rule_where + ".tool must be a string.");
            }

            routing::TriggerRule rule;
            rule.tool = rule_entry["tool"].get<std::string>();
            const std::string style =
                rule_entry.contains("style") && rule_entry["style"].is_string()
                    ? rule_entry["style"].get<std::string>()
                    : "none";
            const auto parsed_style = routing::parse_argument_style(style);
            if (!parsed_style.has_value()) {
                return invalid(rule_where + ".style '" + style + "' is not supported.",
                               "Use one of: none, path, query.");
            }
            rule.style = *parsed_style;

            auto keywords = required_keywords(rule_entry, rule_where);
            if (errors::is_error(keywords)) {
                return errors::get_error(keywords);
            }
            rule.keywords = errors::get_value(keywords);
            auto extras = parse_rule_extras(rule_entry, rule_where, rule);
            if (errors::is_error(extras)) {
                return errors::get_error(extras);
            }
            profile.rules.push_back(std::move(rule));
        }
    }

    if (entry.contains("permitted_tools")) {
        auto permitted = string_list(entry["permitted_tools"], where + ".permitted_tools");
        if (errors::is_error(permitted)) {
            return errors::get_error(permitted);
        }
        profile.permitted_tools = errors::get_value(permitted);
    } else {
        // Every tool a rule can select is permitted.
        const auto permit = [&profile](const std::string& tool) {
            if (!profile.permits(tool)) {
                profile.permitted_tools.push_back(tool);
            }
        };
        for (const auto& rule : profile.rules) {
            permit(rule.tool);
            for (const auto& variant : rule.variants) {
                permit(variant.tool);
            }
            if (rule.fallback.has_value()) {
                permit(rule.fallback->tool);
            }
        }
    }
    return profile;
}

routing::TriggerRule make_rule(const std::string& tool, const routing::ArgumentStyle style,
                               std::vector<std::string> keywords) {
    routing::TriggerRule rule;
    rule.tool = tool;
    rule.style = style;
    rule.keywords = std::move(keywords);
    return rule;
}

ToolBinding make_binding(const std::string& tool, const std::string& server,
                         const std::string& remote_tool,
                         std::map<std::string, std::string> argument_map = {}) {
    ToolBinding binding;
    binding.tool = tool;
    binding.server = server;
    binding.remote_tool = remote_tool;
    binding.argument_map = std::move(argument_map);
    return binding;
}

}  // namespace

errors::Result<AppConfig> parse_config(const json& document, const std::filesystem::path& base_dir) {
    if (!document.is_object()) {
        return invalid("Configuration must be a JSON object.");
    }

    AppConfig config;
    if (document.contains("servers")) {
        if (!document["servers"].is_object()) {
            return invalid("servers must be an object.");
        }
        for (const auto& [name, entry] : document["servers"].items()) {
            auto spec = parse_server(name, entry, base_dir);
            if (errors::is_error(spec)) {
                return errors::get_error(spec);
            }
            config.servers.emplace(name, errors::get_value(spec));
        }
    }
    if (document.contains("tools")) {
        if (!document["tools"].is_object()) {
            return invalid("tools must be an object.");
        }
        for (const auto& [name, entry] : document["tools"].items()) {
            auto binding = parse_tool(name, entry);
            if (errors::is_error(binding)) {
                return errors::get_error(binding);
            }
            config.tools.emplace(name, errors::get_value(binding));
        }
    }
    if (document.contains("agents")) {
        if (!document["agents"].is_object()) {
            return invalid("agents must be an object.");
        }
        for (const auto& [name, entry] : document["agents"].items()) {
            auto profile = parse_agent(name, entry);
            if (errors::is_error(profile)) {
                return errors::get_error(profile);
            }
            config.agents.emplace(name, errors::get_value(profile));
        }
    }

    auto valid = validate_config(config);
    if (errors::is_error(valid)) {
        return errors::get_error(valid);
    }
    return config;
}

errors::Result<AppConfig> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ToolwireError{ErrorCategory::Config,
                             "Cannot open configuration file: " + path.string(),
                             "config_unreadable"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return ToolwireError{ErrorCategory::Config,
                             "Configuration file is not valid JSON: " + path.string(),
                             "config_unreadable"};
    }

    std::error_code ec;
    std::filesystem::path base_dir = std::filesystem::absolute(path, ec).parent_path();
    if (ec) {
        base_dir = ".";
    }
    auto config = parse_config(document, base_dir);
    if (!errors::is_error(config)) {
        const auto& loaded = errors::get_value(config);
        TOOLWIRE_LOG_INFO("Config: loaded " + path.string() + " (" +
                          std::to_string(loaded.servers.size()) + " servers, " +
                          std::to_string(loaded.tools.size()) + " tools, " +
                          std::to_string(loaded.agents.size()) + " agents)");
    }
    return config;
}

errors::Result<bool> validate_config(const AppConfig& config) {
    for (const auto& [name, binding] : config.tools) {
        if (config.servers.find(binding.server) == config.servers.end()) {
            return invalid("Tool '" + name + "' references unknown server '" + binding.server + "'.");
        }
        if (binding.remote_tool.empty()) {
            return invalid("Tool '" + name + "' has an empty remote_tool.");
        }
    }
    const auto known_tool = [&config](const std::string& tool) {
        return config.tools.find(tool) != config.tools.end();
    };
    for (const auto& [name, spec] : config.servers) {
        if (spec.command.empty()) {
            return invalid("Server '" + name + "' has no command.");
        }
        if (spec.call_timeout_ms == 0) {
            return invalid("Server '" + name + "' has a zero call timeout.");
        }
    }
    for (const auto& [name, profile] : config.agents) {
        for (const auto& tool : profile.permitted_tools) {
            if (!known_tool(tool)) {
                return invalid("Agent '" + name + "' permits unknown tool '" + tool + "'.",
                               "Declare the tool under \"tools\" or remove it from the agent.");
            }
        }
        for (const auto& trigger : profile.rules) {
            if (!known_tool(trigger.tool)) {
                return invalid("Agent '" + name + "' routes to unknown tool '" + trigger.tool + "'.",
                               "Declare the tool under \"tools\" or remove the rule.");
            }
            if (trigger.keywords.empty()) {
                return invalid("Agent '" + name + "' has a rule for '" + trigger.tool +
                               "' without keywords.");
            }
            for (const auto& variant : trigger.variants) {
                if (!known_tool(variant.tool) || variant.keywords.empty()) {
                    return invalid("Agent '" + name + "' has a variant of '" + trigger.tool +
                                   "' for unknown tool '" + variant.tool +
                                   "' or without keywords.");
                }
            }
            if (trigger.fallback.has_value() &&
                (!known_tool(trigger.fallback->tool) || trigger.fallback->keywords.empty())) {
                return invalid("Agent '" + name + "' has a fallback for '" + trigger.tool +
                               "' to unknown tool '" + trigger.fallback->tool +
                               "' or without keywords.");
            }
        }
    }
    return true;
}

errors::Result<routing::AgentProfile> find_agent(const AppConfig& config, const std::string& agent) {
    const auto it = config.agents.find(agent);
    if (it == config.agents.end()) {
        return ToolwireError{ErrorCategory::Input, "Unknown agent: " + agent, "unknown_agent"};
    }
    return it->second;
}

AppConfig default_config(const std::string& fs_server_command, const std::filesystem::path& fs_root) {
    AppConfig config;

    process::ServerSpec filesystem;
    filesystem.name = "filesystem";
    filesystem.command = fs_server_command;
    filesystem.args = {"--root", fs_root.string()};
    config.servers.emplace(filesystem.name, filesystem);

    // Provided separately; opening it fails cleanly when it is not installed.
    process::ServerSpec web_search;
    web_search.name = "web_search";
    web_search.command = "toolwire_web_search_server";
    web_search.call_timeout_ms = 15000;
    config.servers.emplace(web_search.name, web_search);

    ToolBinding read = make_binding("file_system", "filesystem", "read_file", {{"path", "file_path"}});
    read.locate_tool = "find_files";
    config.tools.emplace(read.tool, read);
    config.tools.emplace("file_system_list", make_binding("file_system_list", "filesystem",
                                                          "list_directory", {{"path", "dir_path"}}));
    config.tools.emplace("web_search", make_binding("web_search", "web_search", "web_search"));
    config.tools.emplace("search_definitions",
                         make_binding("search_definitions", "web_search", "search_definitions",
                                      {{"query", "term"}}));
    config.tools.emplace("search_how_to", make_binding("search_how_to", "web_search",
                                                       "search_how_to", {{"query", "topic"}}));

    const std::vector<std::string> search_keywords = {
        "search", "find", "what is", "tell me about", "research",
        "explain", "define", "how does", "latest", "news"};
    const std::vector<std::string> file_keywords = {
        "file", "read", "write", "code", "save", "load", "create",
        "edit", "directory", "folder", "show", "display", "open"};

    auto search = make_rule("web_search", routing::ArgumentStyle::Query, search_keywords);
    search.variants = {routing::ToolVariant{"search_definitions", {"define", "definition"}},
                       routing::ToolVariant{"search_how_to", {"how to"}}};
    for (const std::string name : {"logical", "brainstormer", "debater", "teacher"}) {
        config.agents.emplace(
            name, routing::AgentProfile{name,
                                        {"web_search", "search_definitions", "search_how_to"},
                                        {search}});
    }

    auto files = make_rule("file_system", routing::ArgumentStyle::Path, file_keywords);
    files.fallback = routing::ArgumentFallback{"file_system_list", {"list", "directory"},
                                               nlohmann::json{{"path", "."}}};
    config.agents.emplace(
        "coder", routing::AgentProfile{"coder", {"file_system", "file_system_list"}, {files}});
    for (const std::string name : {"therapist", "planner"}) {
        config.agents.emplace(name, routing::AgentProfile{name, {}, {}});
    }
    return config;
}

} // namespace toolwire::core::config
