#pragma once

#include <string>
#include <memory>

namespace coop_assist {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse a level name ("debug", "info", "warn", "error"); unknown names map to INFO
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output. Safe for concurrent
 * use from request threads and the cache maintenance thread.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

// Component-specific logging macros
#define LOG_ROUTER(msg) coop_assist::Logger::info(std::string("[Router] ") + (msg))
#define LOG_INTENT(msg) coop_assist::Logger::debug(std::string("[Intent] ") + (msg))
#define LOG_RESOLVER(msg) coop_assist::Logger::debug(std::string("[Resolver] ") + (msg))
#define LOG_POLICY(msg) coop_assist::Logger::debug(std::string("[Policy] ") + (msg))
#define LOG_CACHE(msg) coop_assist::Logger::debug(std::string("[Cache] ") + (msg))
#define LOG_SESSION(msg) coop_assist::Logger::debug(std::string("[Session] ") + (msg))
#define LOG_LLM(msg) coop_assist::Logger::info(std::string("[LLM] ") + (msg))

} // namespace coop_assist
