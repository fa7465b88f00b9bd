#include "routing/tool_router.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace toolwire::routing {

namespace {

const std::vector<std::string> kLeadingFillers = {"for", "about", "on", "up", "me"};
const std::vector<std::string> kContainerWords = {"folder", "directory", "dir"};
const std::vector<std::string> kNotADirectory = {"the", "a", "an", "this", "that"};

// What has to follow the directory name for a preposition to count.
enum class ContextShape {
    NamedContainer,  // "in the src folder"
    TrailingSlash,   // "in src/"
    Bare             // "inside src"
};

constexpr const char* kLeadingPunctuation = "\"'(<[`";
constexpr const char* kTrailingPunctuation = "\"'),.;:!?>]`";

char lower(const char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool is_alnum(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_alpha(const char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), lower);
    return text;
}

std::string collapse_whitespace(const std::string& text) {
    std::istringstream in(text);
    std::string word;
    std::string out;
    while (in >> word) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += word;
    }
    return out;
}

std::string strip_token(const std::string& token) {
    const auto first = token.find_first_not_of(kLeadingPunctuation);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = token.find_last_not_of(kTrailingPunctuation);
    if (last == std::string::npos || last < first) {
        return "";
    }
    return token.substr(first, last - first + 1);
}

bool is_path_char(const char c) {
    return is_alnum(c) || c == '_' || c == '.' || c == '/' || c == '-';
}

bool looks_like_filename(const std::string& token) {
    if (token.find("://") != std::string::npos) {
        return false;
    }
    const auto dot = token.rfind('.');
    if (dot == std::string::npos || dot + 1 >= token.size()) {
        return false;
    }

    const std::string stem = token.substr(0, dot);
    const std::string extension = token.substr(dot + 1);
    if (!std::all_of(extension.begin(), extension.end(), is_alnum) ||
        std::none_of(extension.begin(), extension.end(), is_alpha)) {
        return false;
    }
    if (!std::all_of(stem.begin(), stem.end(), is_path_char)) {
        return false;
    }

    // ".gitignore" or "config/.env"
    const bool dotfile = stem.empty() || stem.back() == '/';
    return dotfile || std::any_of(stem.begin(), stem.end(), is_alnum);
}

bool contains(const std::vector<std::string>& list, const std::string& word) {
    return std::find(list.begin(), list.end(), word) != list.end();
}

bool mentions_any(const std::string& normalized, const std::vector<std::string>& keywords) {
    for (const auto& keyword : keywords) {
        const std::string needle = normalize_utterance(keyword);
        if (!needle.empty() && normalized.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> context_after(const std::vector<std::string>& words,
                                         const std::string& preposition,
                                         const ContextShape shape) {
    for (std::size_t i = 0; i + 1 < words.size(); ++i) {
        if (to_lower(words[i]) != preposition) {
            continue;
        }
        std::size_t j = i + 1;
        if (shape != ContextShape::TrailingSlash && to_lower(words[j]) == "the" &&
            j + 1 < words.size()) {
            ++j;
        }
        std::string candidate = words[j];
        if (candidate.empty() || !std::all_of(candidate.begin(), candidate.end(), is_path_char)) {
            continue;
        }
        if (shape == ContextShape::NamedContainer &&
            (j + 1 >= words.size() || !contains(kContainerWords, to_lower(words[j + 1])))) {
            continue;
        }
        if (shape == ContextShape::TrailingSlash && candidate.back() != '/') {
            continue;
        }
        while (!candidate.empty() && candidate.back() == '/') {
            candidate.pop_back();
        }
        if (candidate.empty() || contains(kNotADirectory, to_lower(candidate))) {
            continue;
        }
        return candidate;
    }
    return std::nullopt;
}

bool is_word_boundary(const std::string& text, const std::size_t begin, const std::size_t end) {
    const bool left = begin == 0 || !is_alnum(text[begin - 1]);
    const bool right = end >= text.size() || !is_alnum(text[end]);
    return left && right;
}

}  // namespace

std::string to_string(const ArgumentStyle style) {
    switch (style) {
        case ArgumentStyle::None:
            return "none";
        case ArgumentStyle::Path:
            return "path";
        case ArgumentStyle::Query:
            return "query";
        default:
            return "unknown";
    }
}

std::optional<ArgumentStyle> parse_argument_style(const std::string& text) {
    if (text == "none") return ArgumentStyle::None;
    if (text == "path") return ArgumentStyle::Path;
    if (text == "query") return ArgumentStyle::Query;
    return std::nullopt;
}

bool AgentProfile::permits(const std::string& tool) const {
    return std::find(permitted_tools.begin(), permitted_tools.end(), tool) !=
           permitted_tools.end();
}

bool operator==(const ToolSelection& lhs, const ToolSelection& rhs) {
    return lhs.tool == rhs.tool && lhs.arguments == rhs.arguments &&
           lhs.missing_argument == rhs.missing_argument && lhs.path_context == rhs.path_context;
}

bool operator==(const RoutingDecision& lhs, const RoutingDecision& rhs) {
    return lhs.agent == rhs.agent && lhs.selection == rhs.selection;
}

std::string normalize_utterance(const std::string& utterance) {
    return collapse_whitespace(to_lower(utterance));
}

const TriggerRule* match_trigger(const std::string& normalized, const AgentProfile& profile) {
    for (const auto& rule : profile.rules) {
        if (profile.permits(rule.tool) && mentions_any(normalized, rule.keywords)) {
            return &rule;
        }
    }
    return nullptr;
}

std::optional<std::string> extract_filename(const std::string& utterance) {
    std::istringstream in(utterance);
    std::string raw;
    while (in >> raw) {
        const std::string token = strip_token(raw);
        if (!token.empty() && looks_like_filename(token)) {
            return token;
        }
    }
    return std::nullopt;
}

std::optional<std::string> extract_path_context(const std::string& utterance) {
    std::istringstream in(utterance);
    std::vector<std::string> words;
    std::string raw;
    while (in >> raw) {
        words.push_back(strip_token(raw));
    }

    for (const char* preposition : {"in", "from"}) {
        if (auto found = context_after(words, preposition, ContextShape::NamedContainer)) {
            return found;
        }
    }
    for (const char* preposition : {"in", "from"}) {
        if (auto found = context_after(words, preposition, ContextShape::TrailingSlash)) {
            return found;
        }
    }
    for (const auto& word : words) {
        const auto slash = word.rfind('/');
        if (slash != std::string::npos && slash > 0 && looks_like_filename(word)) {
            return word.substr(0, slash);
        }
    }
    for (const char* preposition : {"inside", "under"}) {
        if (auto found = context_after(words, preposition, ContextShape::Bare)) {
            return found;
        }
    }
    return std::nullopt;
}

std::string extract_query(const std::string& utterance, const std::vector<std::string>& keywords) {
    std::vector<std::string> ordered;
    for (const auto& keyword : keywords) {
        std::string normalized = normalize_utterance(keyword);
        if (!normalized.empty()) {
            ordered.push_back(std::move(normalized));
        }
    }
    // Longest first, so "what is" goes before "is".
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    std::string text = collapse_whitespace(utterance);
    std::string lowered = to_lower(text);
    for (const auto& keyword : ordered) {
        std::size_t pos = 0;
        while ((pos = lowered.find(keyword, pos)) != std::string::npos) {
            const std::size_t end = pos + keyword.size();
            if (!is_word_boundary(lowered, pos, end)) {
                pos = end;
                continue;
            }
            text.replace(pos, keyword.size(), " ");
            lowered.replace(pos, keyword.size(), " ");
            pos += 1;
        }
    }

    std::istringstream in(collapse_whitespace(text));
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }

    std::size_t start = 0;
    while (start < words.size() &&
           std::find(kLeadingFillers.begin(), kLeadingFillers.end(), to_lower(words[start])) !=
               kLeadingFillers.end()) {
        ++start;
    }

    std::string query;
    for (std::size_t i = start; i < words.size(); ++i) {
        if (!query.empty()) {
            query.push_back(' ');
        }
        query += words[i];
    }
    while (!query.empty() && (query.back() == '?' || query.back() == '!' || query.back() == '.')) {
        query.pop_back();
    }
    return query;
}

RoutingDecision route(const std::string& utterance, const AgentProfile& profile) {
    RoutingDecision decision;
    decision.agent = profile.name;

    const std::string normalized = normalize_utterance(utterance);
    const TriggerRule* rule = match_trigger(normalized, profile);
    if (rule == nullptr) {
        return decision;
    }

    ToolSelection selection;
    selection.tool = rule->tool;
    for (const auto& variant : rule->variants) {
        if (profile.permits(variant.tool) && mentions_any(normalized, variant.keywords)) {
            selection.tool = variant.tool;
            break;
        }
    }

    switch (rule->style) {
        case ArgumentStyle::Path: {
            const auto filename = extract_filename(utterance);
            const auto& fallback = rule->fallback;
            if (filename.has_value()) {
                selection.arguments["path"] = *filename;
                selection.path_context = extract_path_context(utterance);
            } else if (fallback.has_value() && profile.permits(fallback->tool) &&
                       mentions_any(normalized, fallback->keywords)) {
                selection.tool = fallback->tool;
                selection.arguments = fallback->arguments;
            } else {
                selection.missing_argument = "path";
            }
            break;
        }
        case ArgumentStyle::Query: {
            const std::string query = extract_query(utterance, rule->keywords);
            if (!query.empty()) {
                selection.arguments["query"] = query;
            } else {
                selection.missing_argument = "query";
            }
            break;
        }
        case ArgumentStyle::None:
            break;
    }
    decision.selection = std::move(selection);
    return decision;
}

}  // namespace toolwire::routing
