#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace chix::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_write_mutex;

void LogWithLevel(LogLevel level,
                  const std::string& tag,
                  const std::string& message,
                  std::unordered_map<std::string, std::string> fields) {
    LogMessage entry{};
    entry.level = level;
    entry.tag = tag;
    entry.message = message;
    entry.fields = std::move(fields);
    Log(entry);
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
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
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(config.min_level);
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = g_min_level.load();
    return config;
}

void Log(const LogMessage& message) {
    if (static_cast<int>(message.level) < static_cast<int>(g_min_level.load())) {
        return;
    }
    std::ostringstream line;
    line << "[" << message.tag << "] " << ToString(message.level) << " " << message.message;
    // Sorted so identical events always render identically.
    const std::map<std::string, std::string> sorted(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : sorted) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line.str() << std::endl;
}

void LogDebug(const std::string& tag, const std::string& message,
              std::unordered_map<std::string, std::string> fields) {
    LogWithLevel(LogLevel::kDebug, tag, message, std::move(fields));
}

void LogInfo(const std::string& tag, const std::string& message,
             std::unordered_map<std::string, std::string> fields) {
    LogWithLevel(LogLevel::kInfo, tag, message, std::move(fields));
}

void LogWarn(const std::string& tag, const std::string& message,
             std::unordered_map<std::string, std::string> fields) {
    LogWithLevel(LogLevel::kWarn, tag, message, std::move(fields));
}

void LogError(const std::string& tag, const std::string& message,
              std::unordered_map<std::string, std::string> fields) {
    LogWithLevel(LogLevel::kError, tag, message, std::move(fields));
}

}  // namespace chix::utils
