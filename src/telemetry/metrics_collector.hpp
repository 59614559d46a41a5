/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "collector/execution_result.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>

namespace exec_engine {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_submission(const RunId& id, const EnvironmentId& env, Priority priority,
                           size_t queue_depth);
    void record_rejection(const EnvironmentId& env, const Rejection& rejection);
    void record_run_started(const RunId& id, Duration queued_for);
    void record_run_finished(const ExecutionResult& result);
    void record_sandbox_teardown(std::string_view label, Duration teardown, bool clean);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace exec_engine
