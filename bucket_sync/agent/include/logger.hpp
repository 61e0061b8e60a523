#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace bucket_sync::agent {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

LogLevel parse_log_level(std::string_view text);

class Logger {
public:
    explicit Logger(const std::string& file_path = "", LogLevel min_level = LogLevel::kInfo);

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::kDebug, message); }
    void info(std::string_view message) { log(LogLevel::kInfo, message); }
    void warn(std::string_view message) { log(LogLevel::kWarn, message); }
    void error(std::string_view message) { log(LogLevel::kError, message); }

private:
    std::string level_to_string(LogLevel level) const;
    void ensure_stream();

    std::mutex mutex_;
    std::ofstream stream_;
    std::string file_path_;
    LogLevel min_level_;
};

}  // namespace bucket_sync::agent
