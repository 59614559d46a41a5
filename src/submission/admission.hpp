/**
 * @file admission.hpp
 * @brief Admission checks performed before a submission may be queued.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "environment/environment.hpp"
#include "submission/submission.hpp"

#include <cstddef>

namespace exec_engine {

struct AdmissionPolicy {
    size_t max_source_bytes = 256 * 1024;
    size_t max_stdin_bytes = 1024 * 1024;
    size_t max_test_cases = 64;
    size_t max_args = 32;
    ResourceLimits global_ceiling;   ///< Applies on top of every environment maximum
};

/**
 * @brief Reject submissions whose shape the engine will not run.
 *
 * Checks the source, stdin, argument and test-case bounds and the
 * uniqueness of test-case indices. Environment-specific checks live in
 * effective_limits().
 */
Result<void, Rejection> validate_submission(const Submission& submission,
                                            const AdmissionPolicy& policy);

/**
 * @brief Apply caller overrides to an environment's defaults.
 *
 * Overrides above the environment maximum (or the global ceiling) reject
 * with LimitAboveCeiling; zero overrides reject as malformed.
 */
Result<ResourceLimits, Rejection> effective_limits(const ExecutionEnvironment& env,
                                                   const LimitOverrides& overrides,
                                                   const ResourceLimits& global_ceiling);

}  // namespace exec_engine
