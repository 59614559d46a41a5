/**
 * @file result_codec.hpp
 * @brief Single-line JSON encoding of results, events and rejections.
 * @author Dimitris Kafetzis
 *
 * Output formats (one object, no trailing newline):
 *   result:    {"run_id","environment","correlation","state","exit_code",
 *               "failure_kind","failure_detail","stdout","stderr",
 *               "stdout_truncated","stderr_truncated","cpu_time_ms",
 *               "wall_time_ms","peak_memory_bytes","submitted_at",
 *               "started_at","finished_at","tests"}
 *   event:     {"event":"run_terminal","run_id","state","result":{...}}
 *   rejection: {"rejected":"<reason code>","detail"}
 * Absent optionals encode as null.
 */

#pragma once

#include "collector/execution_result.hpp"
#include "core/result.hpp"
#include "environment/environment.hpp"

#include <string>

namespace exec_engine {

struct ResultCodec {
    static std::string encode_result(const ExecutionResult& result);
    static std::string encode_test_report(const TestReport& report);
    static std::string encode_event(const ExecutionResult& result);
    static std::string encode_rejection(const Rejection& rejection);
    static std::string encode_environment(const ExecutionEnvironment& env);
};

}  // namespace exec_engine
