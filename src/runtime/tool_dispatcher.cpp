#include "runtime/tool_dispatcher.hpp"

#include <cstdint>
#include <thread>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolwire::runtime {

using core::errors::ErrorCategory;
using core::errors::ToolwireError;
using DispatchResult = core::errors::Result<protocol::ToolInvocationResult>;

namespace {

nlohmann::json remap_arguments(const nlohmann::json& arguments,
                               const std::map<std::string, std::string>& argument_map) {
    nlohmann::json remote = nlohmann::json::object();
    for (const auto& [name, value] : arguments.items()) {
        const auto renamed = argument_map.find(name);
        remote[renamed == argument_map.end() ? name : renamed->second] = value;
    }
    return remote;
}

// The call went out but the server died or the channel broke under it.
bool lost_server(const DispatchResult& result) {
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result).code == "session_closed";
    }
    const auto* transport = std::get_if<protocol::TransportError>(&core::errors::get_value(result));
    return transport != nullptr &&
           (transport->cause == protocol::TransportErrorCause::ProcessExited ||
            transport->cause == protocol::TransportErrorCause::SendFailed);
}

bool reports_missing_file(const DispatchResult& result) {
    if (core::errors::is_error(result)) {
        return false;
    }
    const auto* failure = std::get_if<protocol::ToolError>(&core::errors::get_value(result));
    return failure != nullptr && failure->message.find("does not exist") != std::string::npos;
}

std::string numbered(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::to_string(i + 1) + ". " + items[i];
    }
    return out;
}

}  // namespace

ToolDispatcher::ToolDispatcher(const core::config::AppConfig& config,
                               session::ServerRegistry& registry, session::SyncBridge& bridge,
                               DispatchOptions options)
    : config_(config), registry_(registry), bridge_(bridge), options_(options) {}

DispatchResult ToolDispatcher::dispatch(const routing::RoutingDecision& decision) {
    if (!decision.has_tool()) {
        return ToolwireError{ErrorCategory::Input,
                             "Agent '" + decision.agent + "' did not select a tool.",
                             "no_tool_selected"};
    }

    const auto& selection = *decision.selection;
    if (selection.missing_argument.has_value()) {
        const std::string& argument = *selection.missing_argument;
        return ToolwireError{ErrorCategory::Input,
                             "Tool '" + selection.tool + "' needs a " + argument +
                                 " but none was found in the message.",
                             "missing_argument",
                             argument == "path" ? "Name the file, e.g. \"read main.py\"."
                                                : "Say what to look up, e.g. \"search for rust ownership\"."};
    }

    const auto binding = config_.tools.find(selection.tool);
    if (binding == config_.tools.end()) {
        return ToolwireError{ErrorCategory::Config,
                             "Tool '" + selection.tool + "' has no server binding.",
                             "unknown_tool"};
    }

    auto session = registry_.session(binding->second.server);
    if (core::errors::is_error(session)) {
        session = registry_.open(binding->second.server);
    } else if (options_.reopen_closed_sessions &&
               core::errors::get_value(session)->state() == session::SessionState::Closed) {
        TOOLWIRE_LOG_INFO("ToolDispatcher: " + binding->second.server +
                          " session is closed, reopening");
        session = registry_.reopen(binding->second.server, core::errors::get_value(session));
    }
    if (core::errors::is_error(session)) {
        return core::errors::get_error(session);
    }
    auto live = core::errors::get_value(session);

    TOOLWIRE_LOG_INFO("ToolDispatcher: " + decision.agent + " -> " + selection.tool + " (" +
                      binding->second.server + "/" + binding->second.remote_tool + ")");
    const auto path = selection.arguments.find("path");
    if (!binding->second.locate_tool.empty() && path != selection.arguments.end() &&
        path->is_string()) {
        return read_with_resolution(binding->second, live, selection);
    }
    return call(binding->second.server, live, binding->second.remote_tool,
                remap_arguments(selection.arguments, binding->second.argument_map));
}

DispatchResult ToolDispatcher::call(const std::string& server,
                                    std::shared_ptr<session::Session>& session,
                                    const std::string& remote_tool,
                                    const nlohmann::json& arguments) {
    auto result = bridge_.invoke(*session, remote_tool, arguments);
    if (!options_.retry_after_restart || !lost_server(result)) {
        return result;
    }

    TOOLWIRE_LOG_WARN("ToolDispatcher: lost " + server + " during " + remote_tool +
                      ", restarting it");
    if (options_.restart_backoff.count() > 0) {
        std::this_thread::sleep_for(options_.restart_backoff);
    }
    auto reopened = registry_.reopen(server, session);
    if (core::errors::is_error(reopened)) {
        const auto& err = core::errors::get_error(reopened);
        TOOLWIRE_LOG_ERROR("ToolDispatcher: restart of " + server + " failed: " + err.message);
        return ToolwireError{ErrorCategory::Transport,
                             "Tool call failed and restarting '" + server +
                                 "' failed: " + err.message,
                             "restart_failed", err.hint};
    }
    session = core::errors::get_value(reopened);
    return bridge_.invoke(*session, remote_tool, arguments);
}

DispatchResult ToolDispatcher::read_with_resolution(const core::config::ToolBinding& binding,
                                                    std::shared_ptr<session::Session>& session,
                                                    const routing::ToolSelection& selection) {
    const std::string path = selection.arguments.at("path").get<std::string>();
    const std::string context = selection.path_context.value_or("");
    const auto read = [&](const std::string& candidate) {
        nlohmann::json arguments = selection.arguments;
        arguments["path"] = candidate;
        return call(binding.server, session, binding.remote_tool,
                    remap_arguments(arguments, binding.argument_map));
    };

    if (!context.empty() && path.rfind(context, 0) != 0) {
        auto under_context = read(context + "/" + path);
        if (!reports_missing_file(under_context)) {
            return under_context;
        }
    }
    auto direct = read(path);
    if (!reports_missing_file(direct)) {
        return direct;
    }

    nlohmann::json query{{"file_name", path}};
    if (!context.empty()) {
        query["path_context"] = context;
    }
    auto located = call(binding.server, session, binding.locate_tool, query);
    if (core::errors::is_error(located) || !protocol::is_success(core::errors::get_value(located))) {
        TOOLWIRE_LOG_WARN("ToolDispatcher: could not search " + binding.server + " for " + path);
        return direct;
    }
    const auto found = nlohmann::json::parse(
        std::get<protocol::ToolSuccess>(core::errors::get_value(located)).text, nullptr, false);
    if (found.is_discarded() || !found.is_object()) {
        TOOLWIRE_LOG_WARN("ToolDispatcher: " + binding.locate_tool + " answered with no listing");
        return direct;
    }

    std::vector<std::string> exact;
    std::vector<std::string> exact_labels;
    const auto exact_it = found.find("exact");
    if (exact_it != found.end() && exact_it->is_array()) {
        for (const auto& match : *exact_it) {
            const auto match_path = match.find("path");
            if (match_path == match.end() || !match_path->is_string()) {
                continue;
            }
            exact.push_back(match_path->get<std::string>());
            const auto size = match.find("size");
            exact_labels.push_back(
                size != match.end() && size->is_number_unsigned()
                    ? exact.back() + " (" + std::to_string(size->get<std::uint64_t>()) +
                          " characters)"
                    : exact.back());
        }
    }
    std::vector<std::string> similar;
    const auto similar_it = found.find("similar");
    if (similar_it != found.end() && similar_it->is_array()) {
        for (const auto& candidate : *similar_it) {
            if (candidate.is_string()) {
                similar.push_back(candidate.get<std::string>());
            }
        }
    }

    if (exact.size() == 1) {
        TOOLWIRE_LOG_INFO("ToolDispatcher: resolved '" + path + "' to '" + exact.front() + "'");
        return read(exact.front());
    }
    if (exact.size() > 1) {
        return ToolwireError{ErrorCategory::Input,
                             "Multiple files named '" + path + "' found: " + numbered(exact_labels),
                             "ambiguous_file",
                             "Give the full path, e.g. \"read " + exact.front() + "\"."};
    }
    if (!similar.empty()) {
        return ToolwireError{ErrorCategory::Input,
                             "File '" + path + "' not found. Did you mean: " + numbered(similar) +
                                 "?",
                             "file_not_found", "Give the correct filename or full path."};
    }
    return ToolwireError{ErrorCategory::Input, "File '" + path + "' not found in the workspace.",
                         "file_not_found", "Use \"list directory\" to see available files."};
}

}  // namespace toolwire::runtime
