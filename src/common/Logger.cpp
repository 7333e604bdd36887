#include "roadnet/common/Logger.h"

#ifdef ROADNET_USE_SPDLOG
#include "roadnet/backends/SpdlogBackend.h"
#else
#include "roadnet/backends/DefaultBackend.h"
#endif

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <mutex>

namespace roadnet {

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "err" || lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {

std::mutex backendMutex;

// Log capture state
bool captureEnabled = false;
std::vector<std::string> capturedLogs;
std::mutex captureMutex;

std::unique_ptr<ILoggerBackend> makeDefaultBackend([[maybe_unused]] const std::string& logDir,
                                                   [[maybe_unused]] bool logToFile) {
#ifdef ROADNET_USE_SPDLOG
    return std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
    return std::make_unique<DefaultBackend>();
#endif
}

}  // namespace

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    initialize("", false);
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = makeDefaultBackend(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::write(LogLevel level, const std::string& message, const std::source_location& loc) {
    ensureBackend();
    std::string enhanced = extractFunctionName(loc) + "() - " + message;
    backend_->log(level, enhanced, loc);
    captureLog(std::string("[") + logLevelTag(level) + "] " + enhanced);
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

// ===== Log Capture =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(captureMutex);
    captureEnabled = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(captureMutex);
    return captureEnabled;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(captureMutex);

    std::vector<std::string> result;
    std::copy_if(capturedLogs.begin(), capturedLogs.end(), std::back_inserter(result),
                 [&pattern](const std::string& line) {
                     return pattern.empty() || line.find(pattern) != std::string::npos;
                 });

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(captureMutex);
    capturedLogs.clear();
}

void Logger::captureLog(const std::string& message) {
    std::lock_guard<std::mutex> lock(captureMutex);
    if (captureEnabled) {
        capturedLogs.push_back(message);
    }
}

std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string fullName = loc.function_name();

    size_t paren = fullName.find('(');
    if (paren == std::string::npos) {
        return "Unknown";
    }

    // Return type ends at the last top-level space before the parameter list
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < paren; ++i) {
        char c = fullName[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (c == ' ' && depth == 0) start = i + 1;
    }

    std::string name;
    depth = 0;
    for (size_t i = start; i < paren; ++i) {
        char c = fullName[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0 && c != '*' && c != '&' &&
                 !std::isspace(static_cast<unsigned char>(c))) {
            name += c;
        }
    }

    // Keep "Class::method" only
    size_t last = name.rfind("::");
    if (last != std::string::npos && last > 0) {
        size_t prev = name.rfind("::", last - 1);
        if (prev != std::string::npos) {
            name = name.substr(prev + 2);
        }
    }
    return name.empty() ? "Unknown" : name;
}

}  // namespace roadnet
