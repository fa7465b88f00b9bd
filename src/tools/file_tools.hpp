#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "policy/policy_guard.hpp"
#include "protocol/tool_contract.hpp"
#include "server/stdio_server.hpp"

namespace toolwire::tools {

// The filesystem server's tools. Every path is resolved against root and
// rejected if it escapes it. Failures come back as unsuccessful replies.
class FileTools {
public:
    explicit FileTools(std::filesystem::path root, policy::FilePolicy file_policy = {});

    protocol::ToolReply read_file(const std::string& file_path) const;
    protocol::ToolReply write_file(const std::string& file_path, const std::string& content) const;
    protocol::ToolReply list_directory(const std::string& dir_path) const;
    protocol::ToolReply file_exists(const std::string& file_path) const;

    // Searches the tree for files named file_name, skipping dependency, VCS
    // and build directories. The reply is a JSON object: "exact" lists
    // {path, size} for every exact match, "similar" up to five near-miss
    // paths when nothing matched exactly. With path_context, matches under
    // that directory are preferred.
    protocol::ToolReply find_files(const std::string& file_name,
                                   const std::string& path_context = "") const;

    // Descriptors and handlers for StdioServer; they refer to this object.
    std::vector<server::ServedTool> served_tools() const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    policy::PolicyGuard policy_guard_;
};

}  // namespace toolwire::tools
