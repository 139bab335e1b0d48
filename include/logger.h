#pragma once

#include <string>
#include <memory>

namespace voice_os {

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
 * @brief Lightweight, thread-safe logging system
 *
 * Trigger threads, the scheduler thread and tool workers all log through
 * this facade; lines are serialized by a single mutex. Output goes to
 * stderr (and the optional file) so stdout stays free for the console.
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
     * @brief Label every line logged from the calling thread (e.g. "scheduler")
     */
    static void set_thread_name(const std::string& name);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive); INFO otherwise
     */
    static LogLevel parse_level(const std::string& name);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

// Convenience macros
#define LOG_DEBUG(msg) voice_os::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) voice_os::Logger::info(msg)
#define LOG_WARN(msg) voice_os::Logger::warn(msg)
#define LOG_ERROR(msg) voice_os::Logger::error(msg)

// Component-specific logging macros
#define LOG_GESTURE(msg) voice_os::Logger::info(std::string("[Gesture] ") + (msg))
#define LOG_VOICE(msg) voice_os::Logger::info(std::string("[Voice] ") + (msg))
#define LOG_FASTPATH(msg) voice_os::Logger::info(std::string("[FastPath] ") + (msg))
#define LOG_HISTORY(msg) voice_os::Logger::debug(std::string("[History] ") + (msg))
#define LOG_SCHED(msg) voice_os::Logger::info(std::string("[Scheduler] ") + (msg))
#define LOG_AGENT(msg) voice_os::Logger::info(std::string("[Agent] ") + (msg))
#define LOG_TOOL(msg) voice_os::Logger::info(std::string("[Tool] ") + (msg))
#define LOG_TTS(msg) voice_os::Logger::debug(std::string("[TTS] ") + (msg))
#define LOG_STT(msg) voice_os::Logger::info(std::string("[STT] ") + (msg))
#define LOG_AUDIO(msg) voice_os::Logger::debug(std::string("[Audio] ") + (msg))

} // namespace voice_os
