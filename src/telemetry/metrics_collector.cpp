/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include "core/json.hpp"

#include <sstream>

namespace exec_engine {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_submission(const RunId& id, const EnvironmentId& env,
                                         Priority priority, size_t queue_depth) {
    std::ostringstream oss;
    oss << R"({"event":"submission_admitted")"
        << R"(,"run":)" << json_quote(id)
        << R"(,"env":)" << json_quote(env)
        << R"(,"priority":")" << to_string(priority) << "\""
        << R"(,"queue_depth":)" << queue_depth
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_rejection(const EnvironmentId& env, const Rejection& rejection) {
    std::ostringstream oss;
    oss << R"({"event":"submission_rejected")"
        << R"(,"env":)" << json_quote(env)
        << R"(,"reason":")" << rejection.code() << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_run_started(const RunId& id, Duration queued_for) {
    std::ostringstream oss;
    oss << R"({"event":"run_started")"
        << R"(,"run":)" << json_quote(id)
        << R"(,"queued_us":)" << queued_for.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_run_finished(const ExecutionResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"run_finished")"
        << R"(,"run":)" << json_quote(result.run_id)
        << R"(,"env":)" << json_quote(result.environment_id)
        << R"(,"state":")" << to_string(result.state) << "\"";
    if (result.failure_kind) {
        oss << R"(,"failure":")" << to_string(*result.failure_kind) << "\"";
    }
    oss << R"(,"cpu_ms":)" << result.cpu_time_ms
        << R"(,"wall_ms":)" << result.wall_time_ms
        << R"(,"peak_mem_kb":)" << (result.peak_memory_bytes / 1024)
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_sandbox_teardown(std::string_view label, Duration teardown,
                                               bool clean) {
    std::ostringstream oss;
    oss << R"({"event":"sandbox_teardown")"
        << R"(,"sandbox":)" << json_quote(label)
        << R"(,"duration_us":)" << teardown.count()
        << R"(,"clean":)" << (clean ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace exec_engine
