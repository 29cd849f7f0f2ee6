#pragma once

#include <iostream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace readyset {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Unknown names fall back to Info.
LogLevel parseLogLevel(const std::string& name);
std::string toString(LogLevel level);

// One JSON object per line: timestamp, level, message, traceId, details.
// Errors go to the error stream, everything else to the output stream.
class Logger {
public:
    explicit Logger(LogLevel min_level = LogLevel::Info, std::ostream& out = std::clog,
                    std::ostream& err = std::cerr);

    void log(LogLevel level, const std::string& message, const std::string& trace_id,
             const nlohmann::json& details = nullptr);

    void debug(const std::string& message, const std::string& trace_id,
               const nlohmann::json& details = nullptr);
    void info(const std::string& message, const std::string& trace_id,
              const nlohmann::json& details = nullptr);
    void warn(const std::string& message, const std::string& trace_id,
              const nlohmann::json& details = nullptr);
    void error(const std::string& message, const std::string& trace_id,
               const nlohmann::json& details = nullptr);

    bool enabled(LogLevel level) const { return level >= min_level_; }
    LogLevel level() const { return min_level_; }

private:
    LogLevel min_level_;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
};

// ISO-8601 UTC, second precision.
std::string getCurrentTimestamp();

// Random UUID v4.
std::string generateTraceId();

} // namespace readyset
