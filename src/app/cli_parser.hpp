#pragma once
#include <filesystem>
#include "core/errors/toolwire_errors.hpp"
#include "core/logging/logger.hpp"

namespace toolwire::app::cli {

    // Options of toolwire_fs_server
    struct FsServerOptions {
        std::filesystem::path root;          // canonical
        core::logging::LogLevel log_level = core::logging::LogLevel::INFO;
        bool concurrent_calls = false;
    };

    toolwire::core::errors::Result<FsServerOptions> parse_and_validate(int argc, char* argv[]);
}
