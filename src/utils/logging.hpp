#pragma once

#include <string>
#include <utility>
#include <vector>

namespace boxrun::utils {

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

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Returns false for names other than DEBUG/INFO/WARN/WARNING/ERROR.
bool ParseLogLevel(const std::string& name, LogLevel& level);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] message key=value ..." to std::cerr. Lines at WARN and
// above carry the level right after the tag.
void Log(const LogMessage& message);

inline void LogDebug(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log({LogLevel::kDebug, tag, message, std::move(fields)});
}

inline void LogInfo(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log({LogLevel::kInfo, tag, message, std::move(fields)});
}

inline void LogWarn(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log({LogLevel::kWarn, tag, message, std::move(fields)});
}

inline void LogError(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log({LogLevel::kError, tag, message, std::move(fields)});
}

}  // namespace boxrun::utils
