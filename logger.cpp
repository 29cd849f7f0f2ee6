#include "logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace readyset {

LogLevel parseLogLevel(const std::string& name) {
    if (name == "DEBUG" || name == "debug") return LogLevel::Debug;
    if (name == "WARN" || name == "warn" || name == "WARNING") return LogLevel::Warn;
    if (name == "ERROR" || name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

Logger::Logger(LogLevel min_level, std::ostream& out, std::ostream& err)
    : min_level_(min_level), out_(out), err_(err) {}

void Logger::log(LogLevel level, const std::string& message, const std::string& trace_id,
                 const nlohmann::json& details) {
    if (!enabled(level)) {
        return;
    }

    nlohmann::json entry = {
        {"timestamp", getCurrentTimestamp()},
        {"level", toString(level)},
        {"message", message},
        {"traceId", trace_id}
    };
    if (!details.is_null()) {
        entry["details"] = details;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& stream = level == LogLevel::Error ? err_ : out_;
    stream << entry.dump() << std::endl;
}

void Logger::debug(const std::string& message, const std::string& trace_id, const nlohmann::json& details) {
    log(LogLevel::Debug, message, trace_id, details);
}

void Logger::info(const std::string& message, const std::string& trace_id, const nlohmann::json& details) {
    log(LogLevel::Info, message, trace_id, details);
}

void Logger::warn(const std::string& message, const std::string& trace_id, const nlohmann::json& details) {
    log(LogLevel::Warn, message, trace_id, details);
}

void Logger::error(const std::string& message, const std::string& trace_id, const nlohmann::json& details) {
    log(LogLevel::Error, message, trace_id, details);
}

std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string generateTraceId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    const char* chars = "0123456789abcdef";
    std::string uuid = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";

    for (char& c : uuid) {
        if (c == 'x') {
            c = chars[dis(gen)];
        } else if (c == 'y') {
            c = chars[(dis(gen) & 0x3) | 0x8];
        }
    }
    return uuid;
}

} // namespace readyset
