#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace parley {

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
 * Provides structured logging with levels and optional file output.
 * Backend threads (audio callback, capture, socket) log through the same
 * instance as the event loop, so every sink write is serialized.
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

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return Parsed level, or fallback when the name is not recognized
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) parley::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) parley::Logger::info(msg)
#define LOG_WARN(msg) parley::Logger::warn(msg)
#define LOG_ERROR(msg) parley::Logger::error(msg)

// Component-specific logging macros
#define LOG_AUDIO(msg) parley::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_QUEUE(msg) parley::Logger::debug(std::string("[Queue] ") + (msg))
#define LOG_VAD(msg) parley::Logger::debug(std::string("[VAD] ") + (msg))
#define LOG_STT(msg) parley::Logger::info(std::string("[STT] ") + (msg))
#define LOG_RECOGNITION(msg) parley::Logger::info(std::string("[Recognition] ") + (msg))
#define LOG_SYNTH(msg) parley::Logger::info(std::string("[Synthesis] ") + (msg))
#define LOG_TURN(msg) parley::Logger::info(std::string("[Turn] ") + (msg))

} // namespace parley
