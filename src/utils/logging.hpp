#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace warden::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

// Accepts "debug", "info", "warn"/"warning", "error" in any case.
std::optional<LogLevel> ParseLogLevel(const std::string& value);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();
bool ShouldLog(LogLevel level);

// Writes "<LEVEL> [tag] message key=value ..." to stderr. Thread-safe.
void Log(const LogMessage& msg);

void LogDebug(const std::string& tag, const std::string& message,
              std::unordered_map<std::string, std::string> fields = {});
void LogInfo(const std::string& tag, const std::string& message,
             std::unordered_map<std::string, std::string> fields = {});
void LogWarn(const std::string& tag, const std::string& message,
             std::unordered_map<std::string, std::string> fields = {});
void LogError(const std::string& tag, const std::string& message,
              std::unordered_map<std::string, std::string> fields = {});

}  // namespace warden::utils
