/**
 * @file submission.hpp
 * @brief Submission and test-case descriptors.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace exec_engine {

struct TestCase {
    uint32_t index{0};
    std::string input;
    std::string expected_output;
    ComparisonMode mode{ComparisonMode::Exact};
    double epsilon{1e-6};        ///< Numeric mode only
    uint32_t points{1};
    bool hidden{false};          ///< Actual output is withheld from the verdict
};

/**
 * @brief An execution request as handed over by the platform.
 *
 * Immutable after admission; the coordinator assigns run_id and
 * submitted_at.
 */
struct Submission {
    RunId run_id;
    EnvironmentId environment_id;
    std::string source_code;
    std::string stdin_data;
    std::vector<std::string> args;
    std::vector<TestCase> test_cases;
    LimitOverrides limits;
    std::string correlation_token;
    std::string user_id;          ///< Opaque to the engine
    Priority priority{Priority::Normal};
    Timestamp submitted_at{};

    [[nodiscard]] bool has_tests() const noexcept { return !test_cases.empty(); }
};

}  // namespace exec_engine
