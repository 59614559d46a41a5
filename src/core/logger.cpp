/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"
#include "core/json.hpp"

#include <chrono>
#include <sstream>

namespace exec_engine {

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info")  return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message, std::initializer_list<LogField> fields) {
    log(LogLevel::Debug, message, fields);
}

void Logger::info(std::string_view message, std::initializer_list<LogField> fields) {
    log(LogLevel::Info, message, fields);
}

void Logger::warn(std::string_view message, std::initializer_list<LogField> fields) {
    log(LogLevel::Warn, message, fields);
}

void Logger::error(std::string_view message, std::initializer_list<LogField> fields) {
    log(LogLevel::Error, message, fields);
}

void Logger::log(LogLevel level, std::string_view message,
                 std::initializer_list<LogField> fields) {
    if (level < min_level_) return;

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(",)"
        << R"("ts":")" << format_timestamp(std::chrono::system_clock::now()) << R"(",)"
        << R"("msg":)" << json_quote(message);
    for (const auto& [key, value] : fields) {
        oss << ',' << json_quote(key) << ':' << json_quote(value);
    }
    oss << '}';

    std::lock_guard lock(mutex_);
    sink_->write(oss.str());
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_; }

}  // namespace exec_engine
