#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/toolwire_errors.hpp"

namespace toolwire::policy {

struct FilePolicy {
    std::uintmax_t max_read_bytes = 10 * 1024 * 1024;
    bool allow_binary_reads = false;
};

// Confines file tools to one root directory.
class PolicyGuard {
public:
    explicit PolicyGuard(FilePolicy file_policy = {});

    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    // Inside the root, an existing regular text file, not over the size cap.
    core::errors::Result<std::filesystem::path> validate_readable_file(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    // Inside the root and not an existing directory.
    core::errors::Result<std::filesystem::path> validate_writable_file(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    static bool is_probably_binary(const std::filesystem::path& path);

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    FilePolicy file_policy_;
};

}  // namespace toolwire::policy
