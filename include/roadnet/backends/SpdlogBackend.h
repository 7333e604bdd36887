#pragma once

#include "roadnet/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace roadnet {

/**
 * @brief spdlog-based logger backend
 *
 * Logs to a colored console sink and, optionally, to roadnet.log inside a
 * log directory. The initial level comes from ROADNET_LOG_LEVEL, then
 * SPDLOG_LEVEL, and defaults to info.
 *
 * Default backend when ROADNET_USE_SPDLOG=ON.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace roadnet
