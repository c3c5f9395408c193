#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace warden::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_output_mutex;

void LogAt(LogLevel level,
           const std::string& tag,
           const std::string& message,
           std::unordered_map<std::string, std::string> fields) {
    if (!ShouldLog(level)) {
        return;
    }
    LogMessage msg{};
    msg.level = level;
    msg.tag = tag;
    msg.message = message;
    msg.fields = std::move(fields);
    Log(msg);
}

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level = config.min_level;
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = g_min_level.load();
    return config;
}

bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(g_min_level.load());
}

void Log(const LogMessage& msg) {
    if (!ShouldLog(msg.level)) {
        return;
    }
    std::ostringstream line;
    line << ToString(msg.level) << " [" << msg.tag << "] " << msg.message;
    if (!msg.fields.empty()) {
        // Stable field order keeps lines greppable.
        std::map<std::string, std::string> sorted(msg.fields.begin(), msg.fields.end());
        for (const auto& [key, value] : sorted) {
            line << " " << key << "=" << value;
        }
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line.str() << std::endl;
}

void LogDebug(const std::string& tag, const std::string& message,
              std::unordered_map<std::string, std::string> fields) {
    LogAt(LogLevel::kDebug, tag, message, std::move(fields));
}

void LogInfo(const std::string& tag, const std::string& message,
             std::unordered_map<std::string, std::string> fields) {
    LogAt(LogLevel::kInfo, tag, message, std::move(fields));
}

void LogWarn(const std::string& tag, const std::string& message,
             std::unordered_map<std::string, std::string> fields) {
    LogAt(LogLevel::kWarn, tag, message, std::move(fields));
}

void LogError(const std::string& tag, const std::string& message,
              std::unordered_map<std::string, std::string> fields) {
    LogAt(LogLevel::kError, tag, message, std::move(fields));
}

}  // namespace warden::utils
