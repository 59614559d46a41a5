/**
 * @file test_harness.hpp
 * @brief Runs a submission's test cases one sandbox at a time and grades them.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "collector/execution_result.hpp"
#include "submission/submission.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace exec_engine {

/**
 * @brief What a harness pass produced, before it is folded into the run result.
 */
struct HarnessOutcome {
    TestReport report;

    /// The first test execution that did not reach Completed, if any.
    std::optional<ExecutionResult> error;

    /// The last test execution performed; its streams become the run's streams.
    std::optional<ExecutionResult> last;

    uint64_t cpu_time_ms{0};          ///< Sum over executed tests
    uint64_t wall_time_ms{0};         ///< Sum over executed tests
    uint64_t peak_memory_bytes{0};    ///< Max over executed tests
};

class TestHarness {
public:
    /// Runs one test case in a fresh sandbox and returns its normalized result.
    using ExecuteCase = std::function<ExecutionResult(const TestCase&)>;

    /**
     * @brief Execute cases in index order, stopping at the first that errors.
     *
     * An errored case and every case after it are NotEvaluated, never
     * Failed. A Completed run fails its case on a non-zero exit code or an
     * output mismatch.
     */
    [[nodiscard]] static HarnessOutcome run(const std::vector<TestCase>& cases,
                                            const ExecuteCase& execute);

    /// Grade a Completed execution against one case.
    [[nodiscard]] static TestCaseResult evaluate(const TestCase& tc, const ExecutionResult& run);

    /// Fold per-case results into a verdict with points.
    [[nodiscard]] static TestReport aggregate(std::vector<TestCaseResult> cases);
};

}  // namespace exec_engine
