#include "logging.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace {

std::atomic<LogLevel> current_level(LogLevel::Info);
std::mutex output_mutex;

void write(LogLevel level, const char* tag, const std::string& component, const std::string& message) {
    if (level < current_level.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex);
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << tag << "] [" << component << "] " << message << std::endl;
}

} // namespace

void setLogLevel(LogLevel level) {
    current_level = level;
}

LogLevel getLogLevel() {
    return current_level.load();
}

LogLevel parseLogLevel(const std::string& level) {
    std::string lowered = level;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void logDebug(const std::string& component, const std::string& message) {
    write(LogLevel::Debug, "DEBUG", component, message);
}

void logInfo(const std::string& component, const std::string& message) {
    write(LogLevel::Info, "INFO", component, message);
}

void logWarn(const std::string& component, const std::string& message) {
    write(LogLevel::Warn, "WARN", component, message);
}

void logError(const std::string& component, const std::string& message) {
    write(LogLevel::Error, "ERROR", component, message);
}
