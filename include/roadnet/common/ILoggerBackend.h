#pragma once

#include <optional>
#include <source_location>
#include <string>

namespace roadnet {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Parse a level name ("trace", "debug", "info", "warn"/"warning",
/// "err"/"error", "critical", "off"), case-insensitive
std::optional<LogLevel> parseLogLevel(const std::string& name);

/// Short lowercase tag for a level ("trace", "debug", ...)
const char* logLevelTag(LogLevel level);

/**
 * @brief Logger backend interface for dependency injection
 *
 * Implement this interface to route roadnet diagnostics into another
 * logging system.
 *
 * Example:
 * @code
 * class MyLogger : public roadnet::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         mySystem->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { mySystem->setMinLevel(level); }
 *     void flush() override { mySystem->flush(); }
 * };
 *
 * roadnet::Logger::setBackend(std::make_unique<MyLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     * @param level Log level
     * @param message Pre-formatted message
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace roadnet
