#include "tools/file_tools.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolwire::tools {

using protocol::ToolReply;
using nlohmann::json;

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(const Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

ToolReply succeeded(std::string output, const Clock::time_point started) {
    return ToolReply{true, std::move(output), "", elapsed_ms(started)};
}

ToolReply failed(const std::string& message, const Clock::time_point started) {
    return ToolReply{false, "", "Error: " + message, elapsed_ms(started)};
}

json string_schema(const std::string& description) {
    return json{{"type", "string"}, {"description", description}};
}

// nullopt when present but not a string.
std::optional<std::string> string_argument(const json& arguments, const std::string& name,
                                           const std::string& fallback = "") {
    const auto value = arguments.find(name);
    if (value == arguments.end() || value->is_null()) {
        return fallback;
    }
    if (!value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

constexpr std::size_t kMaxSimilar = 5;
constexpr std::size_t kMaxScannedEntries = 50000;

const std::vector<std::string> kSkippedDirectories = {
    ".venv", "venv", "env", ".env", "node_modules", "__pycache__", ".git",
    "site-packages", "dist-packages", ".cache", "build", "dist", ".tox",
    ".vscode", ".idea", ".vs"};
const std::vector<std::string> kSkippedFiles = {".DS_Store", "Thumbs.db"};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool listed(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Lowercased name up to its first dot.
std::string base_name(const std::string& file_name) {
    return lowercase(file_name.substr(0, file_name.find('.')));
}

bool is_similar_name(const std::string& wanted, const std::string& candidate) {
    const std::string a = base_name(wanted);
    const std::string b = base_name(candidate);
    if (a.empty() || b.empty()) {
        return a == b && lowercase(wanted) != lowercase(candidate);
    }
    if (a.find(b) != std::string::npos || b.find(a) != std::string::npos) {
        return true;
    }
    const std::size_t shorter = std::min(a.size(), b.size());
    const std::size_t longer = std::max(a.size(), b.size());
    if (longer - shorter > 2) {
        return false;
    }
    std::size_t mismatches = 0;
    for (std::size_t i = 0; i < shorter; ++i) {
        mismatches += a[i] != b[i] ? 1 : 0;
    }
    return mismatches <= 2;
}

// Keeps the paths under `context` when there are any.
std::vector<std::string> prefer_context(std::vector<std::string> paths, const std::string& context) {
    std::string wanted = lowercase(context);
    while (!wanted.empty() && wanted.back() == '/') {
        wanted.pop_back();
    }
    if (wanted.empty()) {
        return paths;
    }
    std::vector<std::string> inside;
    for (const auto& path : paths) {
        const std::string lowered = lowercase(path);
        if (lowered.rfind(wanted + "/", 0) == 0 ||
            lowered.find("/" + wanted + "/") != std::string::npos) {
            inside.push_back(path);
        }
    }
    return inside.empty() ? paths : inside;
}

ToolReply bad_argument(const std::string& name) {
    return ToolReply{false, "", "Error: argument '" + name + "' must be a string", 0.0};
}

}  // namespace

FileTools::FileTools(std::filesystem::path root, policy::FilePolicy file_policy)
    : root_(std::move(root)), policy_guard_(std::move(file_policy)) {}

ToolReply FileTools::read_file(const std::string& file_path) const {
    const auto started = Clock::now();
    auto resolved = policy_guard_.validate_readable_file(root_, file_path);
    if (core::errors::is_error(resolved)) {
        return failed(core::errors::get_error(resolved).message, started);
    }
    const std::filesystem::path& path = core::errors::get_value(resolved);

    std::ifstream in(path);
    if (!in.is_open()) {
        return failed("could not open '" + file_path + "'", started);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return failed("I/O error while reading '" + file_path + "'", started);
    }

    const std::string content = buffer.str();
    return succeeded("File: " + file_path + "\nSize: " + std::to_string(content.size()) +
                         " characters\n\nContent:\n" + content,
                     started);
}

ToolReply FileTools::write_file(const std::string& file_path, const std::string& content) const {
    const auto started = Clock::now();
    auto resolved = policy_guard_.validate_writable_file(root_, file_path);
    if (core::errors::is_error(resolved)) {
        return failed(core::errors::get_error(resolved).message, started);
    }
    const std::filesystem::path& path = core::errors::get_value(resolved);

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return failed("could not create parent directories for '" + file_path +
                          "': " + ec.message(),
                      started);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return failed("could not open '" + file_path + "' for writing", started);
    }
    out << content;
    out.flush();
    if (!out.good()) {
        return failed("I/O error while writing '" + file_path + "'", started);
    }
    return succeeded("Successfully wrote " + std::to_string(content.size()) +
                         " characters to '" + file_path + "'",
                     started);
}

ToolReply FileTools::list_directory(const std::string& dir_path) const {
    const auto started = Clock::now();
    auto resolved = policy_guard_.validate_path_in_workspace(root_, dir_path);
    if (core::errors::is_error(resolved)) {
        return failed(core::errors::get_error(resolved).message, started);
    }
    const std::filesystem::path& path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return failed("Directory '" + dir_path + "' does not exist", started);
    }
    if (!std::filesystem::is_directory(path, ec) || ec) {
        return failed("'" + dir_path + "' is not a directory", started);
    }

    std::vector<std::filesystem::directory_entry> entries;
    for (std::filesystem::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return failed("could not list '" + dir_path + "': " + ec.message(), started);
    }
    if (entries.empty()) {
        return succeeded("Directory '" + dir_path + "' is empty", started);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });

    std::ostringstream out;
    out << "Directory listing for '" << dir_path << "':";
    for (const auto& entry : entries) {
        const std::string name = entry.path().filename().string();
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec)) {
            const auto size = entry.file_size(entry_ec);
            out << "\n[file] " << name << " (" << (entry_ec ? 0 : size) << " bytes)";
        } else if (entry.is_directory(entry_ec)) {
            out << "\n[dir]  " << name << "/";
        } else {
            out << "\n[other] " << name;
        }
    }
    return succeeded(out.str(), started);
}

ToolReply FileTools::file_exists(const std::string& file_path) const {
    const auto started = Clock::now();
    auto resolved = policy_guard_.validate_path_in_workspace(root_, file_path);
    if (core::errors::is_error(resolved)) {
        return failed(core::errors::get_error(resolved).message, started);
    }
    const std::filesystem::path& path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return succeeded("Path '" + file_path + "' does not exist", started);
    }
    if (std::filesystem::is_regular_file(path, ec)) {
        const auto size = std::filesystem::file_size(path, ec);
        return succeeded("File '" + file_path + "' exists (" +
                             std::to_string(ec ? 0 : size) + " bytes)",
                         started);
    }
    if (std::filesystem::is_directory(path, ec)) {
        return succeeded("Directory '" + file_path + "' exists", started);
    }
    return succeeded("Path '" + file_path + "' exists (special file type)", started);
}

ToolReply FileTools::find_files(const std::string& file_name,
                                const std::string& path_context) const {
    const auto started = Clock::now();
    const std::string wanted = std::filesystem::path(file_name).filename().string();
    if (wanted.empty()) {
        return failed("file_name must name a file", started);
    }

    std::vector<std::string> exact;
    std::vector<std::string> candidates;
    std::map<std::string, std::uintmax_t> sizes;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root_, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return failed("could not search '" + root_.string() + "': " + ec.message(), started);
    }
    std::size_t scanned = 0;
    for (std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec || ++scanned > kMaxScannedEntries) {
            break;
        }
        const std::string name = it->path().filename().string();
        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) {
            if (listed(kSkippedDirectories, lowercase(name))) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(entry_ec) || listed(kSkippedFiles, name)) {
            continue;
        }
        const std::string relative = it->path().lexically_relative(root_).generic_string();
        if (name == wanted) {
            exact.push_back(relative);
            const auto size = it->file_size(entry_ec);
            sizes[relative] = entry_ec ? 0 : size;
        } else if (is_similar_name(wanted, name)) {
            candidates.push_back(relative);
        }
    }

    std::sort(exact.begin(), exact.end());
    std::sort(candidates.begin(), candidates.end());
    exact = prefer_context(std::move(exact), path_context);

    json reply{{"file_name", wanted}, {"exact", json::array()}, {"similar", json::array()}};
    for (const auto& path : exact) {
        reply["exact"].push_back({{"path", path}, {"size", sizes[path]}});
    }
    if (exact.empty()) {
        candidates = prefer_context(std::move(candidates), path_context);
        for (std::size_t i = 0; i < candidates.size() && i < kMaxSimilar; ++i) {
            reply["similar"].push_back(candidates[i]);
        }
    }
    return succeeded(reply.dump(), started);
}

std::vector<server::ServedTool> FileTools::served_tools() const {
    std::vector<server::ServedTool> tools;

    tools.push_back(server::ServedTool{
        "read_file",
        "Read the contents of a text file inside the served directory.",
        json{{"type", "object"},
             {"properties", {{"file_path", string_schema("Path relative to the root")}}},
             {"required", json::array({"file_path"})}},
        [this](const json& arguments) {
            const auto file_path = string_argument(arguments, "file_path");
            return file_path ? read_file(*file_path) : bad_argument("file_path");
        }});

    tools.push_back(server::ServedTool{
        "write_file",
        "Write text to a file inside the served directory, creating parent directories.",
        json{{"type", "object"},
             {"properties",
              {{"file_path", string_schema("Path relative to the root")},
               {"content", string_schema("Text to write")}}},
             {"required", json::array({"file_path", "content"})}},
        [this](const json& arguments) {
            const auto file_path = string_argument(arguments, "file_path");
            const auto content = string_argument(arguments, "content");
            if (!file_path) {
                return bad_argument("file_path");
            }
            if (!content) {
                return bad_argument("content");
            }
            return write_file(*file_path, *content);
        }});

    tools.push_back(server::ServedTool{
        "list_directory",
        "List the entries of a directory inside the served directory.",
        json{{"type", "object"},
             {"properties", {{"dir_path", string_schema("Directory relative to the root")}}}},
        [this](const json& arguments) {
            const auto dir_path = string_argument(arguments, "dir_path", ".");
            return dir_path ? list_directory(*dir_path) : bad_argument("dir_path");
        }});

    tools.push_back(server::ServedTool{
        "file_exists",
        "Report whether a path exists inside the served directory.",
        json{{"type", "object"},
             {"properties", {{"file_path", string_schema("Path relative to the root")}}},
             {"required", json::array({"file_path"})}},
        [this](const json& arguments) {
            const auto file_path = string_argument(arguments, "file_path");
            return file_path ? file_exists(*file_path) : bad_argument("file_path");
        }});

    tools.push_back(server::ServedTool{
        "find_files",
        "Search the served directory for files with a given name.",
        json{{"type", "object"},
             {"properties",
              {{"file_name", string_schema("Name of the file to look for")},
               {"path_context", string_schema("Directory the file is expected under")}}},
             {"required", json::array({"file_name"})}},
        [this](const json& arguments) {
            const auto file_name = string_argument(arguments, "file_name");
            const auto path_context = string_argument(arguments, "path_context");
            if (!file_name) {
                return bad_argument("file_name");
            }
            if (!path_context) {
                return bad_argument("path_context");
            }
            return find_files(*file_name, *path_context);
        }});

    return tools;
}

}  // namespace toolwire::tools
