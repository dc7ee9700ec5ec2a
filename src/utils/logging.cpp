#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace boxrun::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_write_mutex;

}  // namespace

bool ParseLogLevel(const std::string& name, LogLevel& level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "DEBUG") {
        level = LogLevel::kDebug;
    } else if (upper == "INFO") {
        level = LogLevel::kInfo;
    } else if (upper == "WARN" || upper == "WARNING") {
        level = LogLevel::kWarn;
    } else if (upper == "ERROR") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = static_cast<LogLevel>(g_min_level.load());
    return config;
}

void Log(const LogMessage& message) {
    if (static_cast<int>(message.level) < g_min_level.load()) {
        return;
    }
    std::ostringstream line;
    line << "[" << message.tag << "] ";
    if (message.level >= LogLevel::kWarn) {
        line << ToString(message.level) << " ";
    }
    line << message.message;
    for (const auto& [key, value] : message.fields) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line.str() << std::endl;
}

}  // namespace boxrun::utils
