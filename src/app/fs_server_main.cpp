#include <csignal>
#include <unistd.h>
#include "app/cli_parser.hpp"
#include "core/errors/toolwire_errors.hpp"
#include "core/logging/logger.hpp"
#include "server/stdio_server.hpp"
#include "tools/file_tools.hpp"

int main(int argc, char* argv[]) {
    // 1. Tag every log line; stdout carries the protocol, logs go to stderr
    toolwire::core::logging::Logger::get().set_context("fs_server");

    // 2. Parse CLI input and return normalized input errors
    auto parsed = toolwire::app::cli::parse_and_validate(argc, argv);
    if (toolwire::core::errors::is_error(parsed)) {
        const auto& err = toolwire::core::errors::get_error(parsed);
        TOOLWIRE_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            TOOLWIRE_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = toolwire::core::errors::get_value(parsed);
    toolwire::core::logging::Logger::get().set_min_level(options.log_level);

    // 3. A vanished client must end the loop through EOF or EPIPE, not a signal
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));

    toolwire::tools::FileTools file_tools(options.root);
    toolwire::server::StdioServer server(
        toolwire::server::StdioServerOptions{"toolwire-filesystem", "1.0.0", options.concurrent_calls},
        file_tools.served_tools());

    TOOLWIRE_LOG_INFO("Serving files under " + options.root.string());
    return server.run(STDIN_FILENO, STDOUT_FILENO);
}
