/**
 * @file execution_result.hpp
 * @brief Normalized outcome of a run, including per-test verdicts.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace exec_engine {

// ─────────────────────────────────────────────
// Test verdicts
// ─────────────────────────────────────────────

enum class TestStatus : uint8_t {
    Passed,
    Failed,
    NotEvaluated    ///< The case did not run to completion, or never ran
};

[[nodiscard]] constexpr std::string_view to_string(TestStatus status) noexcept {
    switch (status) {
        case TestStatus::Passed:       return "passed";
        case TestStatus::Failed:       return "failed";
        case TestStatus::NotEvaluated: return "not_evaluated";
    }
    return "unknown";
}

enum class Verdict : uint8_t {
    AllPassed,
    SomeFailed,
    Errored
};

[[nodiscard]] constexpr std::string_view to_string(Verdict verdict) noexcept {
    switch (verdict) {
        case Verdict::AllPassed:  return "all_passed";
        case Verdict::SomeFailed: return "some_failed";
        case Verdict::Errored:    return "errored";
    }
    return "unknown";
}

struct TestCaseResult {
    uint32_t index{0};
    TestStatus status{TestStatus::NotEvaluated};
    uint32_t points_earned{0};
    uint32_t points_possible{0};
    uint64_t cpu_time_ms{0};
    uint64_t wall_time_ms{0};
    std::optional<int> exit_code;
    bool hidden{false};
    std::optional<std::string> actual_output;   ///< Withheld for hidden cases
    std::string detail;

    bool operator==(const TestCaseResult&) const = default;
};

struct TestReport {
    Verdict verdict{Verdict::AllPassed};
    std::vector<uint32_t> failing;              ///< Indices with status Failed
    std::vector<TestCaseResult> cases;
    uint32_t points_earned{0};
    uint32_t points_possible{0};

    bool operator==(const TestReport&) const = default;
};

// ─────────────────────────────────────────────
// ExecutionResult
// ─────────────────────────────────────────────

/**
 * @brief Everything a caller learns about a finished run.
 *
 * Raw wait statuses never appear here: a crash is described in words in
 * failure_detail, and exit_code is only set when the program exited on
 * its own.
 */
struct ExecutionResult {
    RunId run_id;
    EnvironmentId environment_id;
    std::string correlation_token;

    RunState state{RunState::Queued};
    std::optional<int> exit_code;
    std::optional<FailureKind> failure_kind;
    std::string failure_detail;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated{false};
    bool stderr_truncated{false};

    uint64_t cpu_time_ms{0};
    uint64_t peak_memory_bytes{0};
    uint64_t wall_time_ms{0};

    std::optional<TestReport> tests;

    Timestamp submitted_at{};
    Timestamp started_at{};
    Timestamp finished_at{};

    bool operator==(const ExecutionResult&) const = default;
};

}  // namespace exec_engine
