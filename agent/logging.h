#pragma once

#include <string>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

// Global threshold, set once from configuration at startup
void setLogLevel(LogLevel level);
LogLevel getLogLevel();
LogLevel parseLogLevel(const std::string& level);

// Lines are written as "[LEVEL] [component] message"
void logDebug(const std::string& component, const std::string& message);
void logInfo(const std::string& component, const std::string& message);
void logWarn(const std::string& component, const std::string& message);
void logError(const std::string& component, const std::string& message);
