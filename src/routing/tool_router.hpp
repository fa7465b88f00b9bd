#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolwire::routing {

// How a routed tool gets its argument out of the utterance.
enum class ArgumentStyle {
    None,   // no argument
    Path,   // first filename-shaped token -> "path"
    Query   // utterance minus trigger words -> "query"
};

std::string to_string(ArgumentStyle style);
std::optional<ArgumentStyle> parse_argument_style(const std::string& text);

// Swaps in another tool when one of its keywords also appears, e.g.
// "define" turning a web search into a definition lookup.
struct ToolVariant {
    std::string tool;
    std::vector<std::string> keywords;
};

// Used instead of a missing path when one of the keywords appears, e.g.
// "list the directory" with no filename.
struct ArgumentFallback {
    std::string tool;
    std::vector<std::string> keywords;
    nlohmann::json arguments = nlohmann::json::object();
};

struct TriggerRule {
    std::string tool;
    ArgumentStyle style = ArgumentStyle::None;
    std::vector<std::string> keywords;
    std::vector<ToolVariant> variants;  // first match wins
    std::optional<ArgumentFallback> fallback;
};

struct AgentProfile {
    std::string name;
    std::vector<std::string> permitted_tools;
    std::vector<TriggerRule> rules;  // earlier rules win

    bool permits(const std::string& tool) const;
};

struct ToolSelection {
    std::string tool;
    nlohmann::json arguments = nlohmann::json::object();
    std::optional<std::string> missing_argument;  // set when extraction found nothing
    std::optional<std::string> path_context;      // directory named around the filename
};

struct RoutingDecision {
    std::string agent;
    std::optional<ToolSelection> selection;

    bool has_tool() const { return selection.has_value(); }
};

bool operator==(const ToolSelection& lhs, const ToolSelection& rhs);
bool operator==(const RoutingDecision& lhs, const RoutingDecision& rhs);

// Lowercases and collapses whitespace runs to single spaces.
std::string normalize_utterance(const std::string& utterance);

// First rule of a permitted tool with a keyword inside `normalized`.
const TriggerRule* match_trigger(const std::string& normalized, const AgentProfile& profile);

std::optional<std::string> extract_filename(const std::string& utterance);

// The directory a message places its file in: "in the src folder",
// "from tests/", "src/main.py", "inside docs", "under lib".
std::optional<std::string> extract_path_context(const std::string& utterance);

std::string extract_query(const std::string& utterance, const std::vector<std::string>& keywords);

// Pure: the same utterance and profile always yield the same decision.
RoutingDecision route(const std::string& utterance, const AgentProfile& profile);

}  // namespace toolwire::routing
