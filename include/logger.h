#pragma once

#include <memory>
#include <string>

namespace live_relay {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Process-wide, thread-safe logger
 *
 * Console output always goes to stderr: in controller mode stdout is the
 * event channel and must carry nothing but event lines. An optional file
 * mirrors every line.
 *
 * Line format: [LEVEL] YYYY-mm-dd HH:MM:SS.mmm <task>: message
 * where <task> is the calling thread's tag (pipeline task name), if set.
 */
class Logger {
public:
    /**
     * @param min_level lines below this level are dropped
     * @param output_file appended to when non-empty
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /// Close the file sink; later calls fall back to bare stderr.
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Tag every line logged from the calling thread
     *
     * TaskGroup sets it to the task name; empty clears it.
     */
    static void set_thread_tag(const std::string& tag);

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return fallback when the name is not recognised
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

    /// One formatted line, without the trailing newline.
    static std::string format_line(LogLevel level, const std::string& tag, const std::string& message);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_PIPELINE(msg) live_relay::Logger::info(std::string("[Pipeline] ") + (msg))
#define LOG_CAPTURE(msg) live_relay::Logger::info(std::string("[Capture] ") + (msg))
#define LOG_AUDIO(msg) live_relay::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_SESSION(msg) live_relay::Logger::info(std::string("[Session] ") + (msg))
#define LOG_MCP(msg) live_relay::Logger::info(std::string("[MCP] ") + (msg))
#define LOG_RELAY(msg) live_relay::Logger::info(std::string("[Relay] ") + (msg))

} // namespace live_relay
