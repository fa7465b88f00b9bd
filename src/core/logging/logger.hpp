#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace toolwire::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Writes to stderr by default: stdout belongs to the JSON-RPC channel
    // whenever this code runs inside a tool server.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (context_.empty() ? "" : "[" + context_ + "] ")
                  << message << std::endl;
        }

        static std::optional<LogLevel> parse_level(const std::string& text) {
            if (text == "debug") return LogLevel::DEBUG;
            if (text == "info") return LogLevel::INFO;
            if (text == "warn") return LogLevel::WARN;
            if (text == "error") return LogLevel::ERROR;
            return std::nullopt;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cerr;

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros; the message expression is only built when the level is enabled
    #define TOOLWIRE_LOG_AT(level, msg)                                              \
        do {                                                                         \
            auto& toolwire_logger_ = ::toolwire::core::logging::Logger::get();       \
            if (toolwire_logger_.enabled(level)) {                                   \
                toolwire_logger_.log(level, msg);                                    \
            }                                                                        \
        } while (0)

    #define TOOLWIRE_LOG_DEBUG(msg) TOOLWIRE_LOG_AT(::toolwire::core::logging::LogLevel::DEBUG, msg)
    #define TOOLWIRE_LOG_INFO(msg)  TOOLWIRE_LOG_AT(::toolwire::core::logging::LogLevel::INFO, msg)
    #define TOOLWIRE_LOG_WARN(msg)  TOOLWIRE_LOG_AT(::toolwire::core::logging::LogLevel::WARN, msg)
    #define TOOLWIRE_LOG_ERROR(msg) TOOLWIRE_LOG_AT(::toolwire::core::logging::LogLevel::ERROR, msg)

} // namespace toolwire::core::logging
