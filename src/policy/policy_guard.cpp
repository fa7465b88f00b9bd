#include "policy/policy_guard.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace toolwire::policy {

using core::errors::ErrorCategory;
using core::errors::ToolwireError;

PolicyGuard::PolicyGuard(FilePolicy file_policy)
    : file_policy_(std::move(file_policy)) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (root_it->empty()) {
            // weakly_canonical keeps a trailing separator as an empty element
            return true;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end() || root_it->empty();
}

bool PolicyGuard::is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return ToolwireError{ErrorCategory::Config,
                             "Workspace root does not exist: " + workspace_root.string(),
                             "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return ToolwireError{ErrorCategory::Config,
                             "Workspace root is not a directory: " + workspace_root.string(),
                             "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return ToolwireError{ErrorCategory::Config,
                             "Unable to resolve workspace root: " + workspace_root.string(),
                             "invalid_workspace_root"};
    }

    if (target_path.empty()) {
        return ToolwireError{ErrorCategory::Input, "Path cannot be empty.", "invalid_path"};
    }
    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ToolwireError{ErrorCategory::Input,
                             "Unable to resolve target path: " + target_path.string(),
                             "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return ToolwireError{ErrorCategory::Input,
                             "Access denied: '" + target_path.string() +
                                 "' is outside the allowed directory",
                             "path_outside_workspace"};
    }

    return canonical_candidate;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_readable_file(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    auto resolved = validate_path_in_workspace(workspace_root, target_path);
    if (core::errors::is_error(resolved)) {
        return resolved;
    }
    const std::filesystem::path& file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return ToolwireError{ErrorCategory::Input,
                             "File '" + target_path.string() + "' does not exist",
                             "file_not_found"};
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return ToolwireError{ErrorCategory::Input, "'" + target_path.string() + "' is not a file",
                             "not_a_file"};
    }
    const auto size = std::filesystem::file_size(file_path, ec);
    if (!ec && size > file_policy_.max_read_bytes) {
        return ToolwireError{ErrorCategory::Input,
                             "File '" + target_path.string() + "' is too large (" +
                                 std::to_string(size) + " bytes)",
                             "file_too_large"};
    }
    if (!file_policy_.allow_binary_reads && is_probably_binary(file_path)) {
        return ToolwireError{ErrorCategory::Input,
                             "Refusing to read binary file '" + target_path.string() + "'",
                             "binary_file"};
    }
    return file_path;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_writable_file(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    auto resolved = validate_path_in_workspace(workspace_root, target_path);
    if (core::errors::is_error(resolved)) {
        return resolved;
    }
    std::error_code ec;
    if (std::filesystem::is_directory(core::errors::get_value(resolved), ec)) {
        return ToolwireError{ErrorCategory::Input,
                             "'" + target_path.string() + "' is a directory",
                             "not_a_file"};
    }
    return resolved;
}

}  // namespace toolwire::policy
