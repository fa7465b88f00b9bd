#include "cli_parser.hpp"
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace toolwire::app::cli {

    using namespace toolwire::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> root;
        std::optional<std::string> log_level;
        bool concurrent = false;
    };

    Result<FsServerOptions> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--root") {
                if (i + 1 < args.size()) raw.root = args[++i];
                else return ToolwireError{ErrorCategory::Input, "Missing value for --root", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return ToolwireError{ErrorCategory::Input, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--concurrent") {
                raw.concurrent = true;
            } else {
                return ToolwireError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                     "Usage: toolwire_fs_server [--root DIR] [--log-level debug|info|warn|error] [--concurrent]"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        FsServerOptions options;
        options.concurrent_calls = raw.concurrent;

        if (raw.log_level) {
            const auto level = core::logging::Logger::parse_level(raw.log_level.value());
            if (!level) {
                return ToolwireError{ErrorCategory::Input, "Invalid --log-level: " + raw.log_level.value(), "invalid_log_level",
                                     "Use one of: debug, info, warn, error."};
            }
            options.log_level = *level;
        }

        // Path validation; the root defaults to the working directory
        std::filesystem::path p(raw.root.value_or("."));
        std::error_code path_ec;
        const bool is_dir = std::filesystem::is_directory(p, path_ec);
        if (path_ec || !is_dir) {
            return ToolwireError{ErrorCategory::Input, "Root does not exist or is not a directory: " + p.string(), "invalid_path"};
        }

        std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
        if (path_ec) {
            return ToolwireError{ErrorCategory::Input, "Failed to canonicalize root directory", "invalid_path"};
        }
        options.root = std::move(canonical_path);

        return options;
    }

} // namespace toolwire::app::cli
