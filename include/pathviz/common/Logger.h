#pragma once

#include "pathviz/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace pathviz {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Supports three usage patterns:
 * 1. Default mode: spdlog console backend, created on first use
 * 2. Custom mode: users inject their own ILoggerBackend implementation
 * 3. Capture mode: log lines are also kept in memory for later retrieval
 *
 * Thread-safe: backend creation, replacement, logging and capture are
 * mutex-guarded, so searches on several threads may log concurrently.
 *
 * Example:
 * @code
 * pathviz::Logger::initialize();
 * pathviz::Logger::enableCapture(true);
 * LOG_INFO("Search finished after {} expansions", count);
 * auto logs = pathviz::Logger::getCapturedLogs("expansions");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout only)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     * @throws std::exception if the directory or log file cannot be created
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    /**
     * @brief Set minimum log level
     */
    static void setLevel(LogLevel level);

    // Logging methods
    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    /**
     * @brief Flush log buffers
     */
    static void flush();

    // ===== Log Capture API =====

    /**
     * @brief Enable or disable log capture
     *
     * When enabled, every message is stored in memory in addition to
     * being sent to the backend.
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured logs with optional filtering
     * @param pattern Optional substring filter (empty = all logs)
     * @param maxLines Maximum number of lines to return (0 = unlimited)
     * @return Matching lines, most recent last
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const char* tag, const std::string& message,
                         const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace pathviz

// Logging macros with std::format support
#define LOG_TRACE(...) pathviz::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) pathviz::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  pathviz::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  pathviz::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) pathviz::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
