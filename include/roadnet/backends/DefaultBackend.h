#pragma once

#include "roadnet/common/ILoggerBackend.h"
#include <mutex>

namespace roadnet {

/**
 * @brief Plain stderr logger with no external dependencies
 *
 * Thread-safe, prints "[HH:MM:SS.mmm] [level] message". Used when the
 * library is built without spdlog.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    static std::string timestamp();
};

}  // namespace roadnet
