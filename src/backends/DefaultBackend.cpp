#include "roadnet/backends/DefaultBackend.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <format>

namespace roadnet {

DefaultBackend::DefaultBackend() : currentLevel_(LogLevel::Info) {
    if (const char* value = std::getenv("ROADNET_LOG_LEVEL")) {
        currentLevel_ = parseLogLevel(value).value_or(LogLevel::Info);
    }
}

void DefaultBackend::log(LogLevel level, const std::string& message,
                         [[maybe_unused]] const std::source_location& loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < currentLevel_ || level == LogLevel::Off) {
        return;
    }
    std::fprintf(stderr, "[%s] [%s] %s\n", timestamp().c_str(), logLevelTag(level),
                 message.c_str());
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stderr);
}

std::string DefaultBackend::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);
    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec,
                       millis.count());
}

}  // namespace roadnet
