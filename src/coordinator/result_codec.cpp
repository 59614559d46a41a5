/**
 * @file result_codec.cpp
 * @brief ResultCodec implementation.
 * @author Dimitris Kafetzis
 */

#include "coordinator/result_codec.hpp"

#include "core/json.hpp"

#include <sstream>

namespace exec_engine {

namespace {

template <typename T>
void put_optional(std::ostringstream& oss, const std::optional<T>& value) {
    if (value) {
        oss << *value;
    } else {
        oss << "null";
    }
}

void put_limits(std::ostringstream& oss, const ResourceLimits& limits) {
    oss << R"({"wall_time_ms":)" << limits.wall_time_ms
        << R"(,"cpu_time_ms":)" << limits.cpu_time_ms
        << R"(,"memory_bytes":)" << limits.memory_bytes
        << R"(,"max_processes":)" << limits.max_processes
        << R"(,"max_file_size_bytes":)" << limits.max_file_size_bytes
        << R"(,"max_open_files":)" << limits.max_open_files
        << '}';
}

const char* boolean(bool value) { return value ? "true" : "false"; }

}  // anonymous namespace

std::string ResultCodec::encode_test_report(const TestReport& report) {
    std::ostringstream oss;
    oss << R"({"verdict":")" << to_string(report.verdict) << '"'
        << R"(,"points_earned":)" << report.points_earned
        << R"(,"points_possible":)" << report.points_possible
        << R"(,"failing":[)";
    for (size_t i = 0; i < report.failing.size(); ++i) {
        if (i > 0) oss << ',';
        oss << report.failing[i];
    }
    oss << R"(],"cases":[)";
    for (size_t i = 0; i < report.cases.size(); ++i) {
        const auto& c = report.cases[i];
        if (i > 0) oss << ',';
        oss << R"({"index":)" << c.index
            << R"(,"status":")" << to_string(c.status) << '"'
            << R"(,"points_earned":)" << c.points_earned
            << R"(,"points_possible":)" << c.points_possible
            << R"(,"cpu_time_ms":)" << c.cpu_time_ms
            << R"(,"wall_time_ms":)" << c.wall_time_ms
            << R"(,"exit_code":)";
        put_optional(oss, c.exit_code);
        oss << R"(,"hidden":)" << boolean(c.hidden)
            << R"(,"actual_output":)";
        if (c.actual_output) {
            oss << json_quote(*c.actual_output);
        } else {
            oss << "null";
        }
        oss << R"(,"detail":)" << json_quote(c.detail) << '}';
    }
    oss << "]}";
    return oss.str();
}

std::string ResultCodec::encode_result(const ExecutionResult& result) {
    std::ostringstream oss;
    oss << R"({"run_id":)" << json_quote(result.run_id)
        << R"(,"environment":)" << json_quote(result.environment_id)
        << R"(,"correlation":)" << json_quote(result.correlation_token)
        << R"(,"state":")" << to_string(result.state) << '"'
        << R"(,"exit_code":)";
    put_optional(oss, result.exit_code);
    oss << R"(,"failure_kind":)";
    if (result.failure_kind) {
        oss << '"' << to_string(*result.failure_kind) << '"';
    } else {
        oss << "null";
    }
    oss << R"(,"failure_detail":)" << json_quote(result.failure_detail)
        << R"(,"stdout":)" << json_quote(result.stdout_data)
        << R"(,"stderr":)" << json_quote(result.stderr_data)
        << R"(,"stdout_truncated":)" << boolean(result.stdout_truncated)
        << R"(,"stderr_truncated":)" << boolean(result.stderr_truncated)
        << R"(,"cpu_time_ms":)" << result.cpu_time_ms
        << R"(,"wall_time_ms":)" << result.wall_time_ms
        << R"(,"peak_memory_bytes":)" << result.peak_memory_bytes
        << R"(,"submitted_at":")" << format_timestamp(result.submitted_at) << '"'
        << R"(,"started_at":")" << format_timestamp(result.started_at) << '"'
        << R"(,"finished_at":")" << format_timestamp(result.finished_at) << '"'
        << R"(,"tests":)";
    if (result.tests) {
        oss << encode_test_report(*result.tests);
    } else {
        oss << "null";
    }
    oss << '}';
    return oss.str();
}

std::string ResultCodec::encode_event(const ExecutionResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"run_terminal")"
        << R"(,"run_id":)" << json_quote(result.run_id)
        << R"(,"state":")" << to_string(result.state) << '"'
        << R"(,"result":)" << encode_result(result)
        << '}';
    return oss.str();
}

std::string ResultCodec::encode_rejection(const Rejection& rejection) {
    std::ostringstream oss;
    oss << R"({"rejected":")" << rejection.code() << '"'
        << R"(,"detail":)" << json_quote(rejection.detail)
        << '}';
    return oss.str();
}

std::string ResultCodec::encode_environment(const ExecutionEnvironment& env) {
    std::ostringstream oss;
    oss << R"({"id":)" << json_quote(env.id)
        << R"(,"display_name":)" << json_quote(env.display_name)
        << R"(,"image":)" << json_quote(env.image)
        << R"(,"status":")" << to_string(env.status) << '"'
        << R"(,"compiled":)" << boolean(env.compiled())
        << R"(,"default_limits":)";
    put_limits(oss, env.default_limits);
    oss << R"(,"max_limits":)";
    put_limits(oss, env.max_limits);
    oss << '}';
    return oss.str();
}

}  // namespace exec_engine
