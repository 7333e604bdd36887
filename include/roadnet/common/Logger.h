#pragma once

#include "roadnet/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace roadnet {

/**
 * @brief Process-wide logging facade used by the road network
 *
 * The backend is created lazily on first use (SpdlogBackend when built with
 * ROADNET_USE_SPDLOG, DefaultBackend otherwise) unless one was injected with
 * setBackend(). Messages can additionally be captured in memory, which the
 * tests use to observe warnings raised during termination cascades.
 *
 * Example:
 * @code
 * roadnet::Logger::enableCapture(true);
 * network.terminateRoad(road);
 * auto warnings = roadnet::Logger::getCapturedLogs("[warn]");
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     * @param backend Backend to use from now on (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (console only)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     * @param logDir Directory receiving roadnet.log
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

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

    static void flush();

    // ===== Log Capture API =====

    /**
     * @brief Enable or disable log capture
     *
     * While enabled every message is also kept in memory, prefixed with
     * its level tag ("[warn] ...").
     */
    static void enableCapture(bool enable);

    static bool isCaptureEnabled();

    /**
     * @brief Get captured logs with optional filtering
     * @param pattern Substring filter (empty = all logs)
     * @param maxLines Keep only the last N matches (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string& message,
                      const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(const std::string& message);
};

}  // namespace roadnet

// Logging macros with std::format support
#define LOG_TRACE(...) roadnet::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) roadnet::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  roadnet::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  roadnet::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) roadnet::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
