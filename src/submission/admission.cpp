/**
 * @file admission.cpp
 * @brief Submission validation and limit resolution.
 * @author Dimitris Kafetzis
 */

#include "submission/admission.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <string>

namespace exec_engine {

namespace {

ResourceLimits min_limits(const ResourceLimits& a, const ResourceLimits& b) {
    return ResourceLimits{
        .wall_time_ms = std::min(a.wall_time_ms, b.wall_time_ms),
        .cpu_time_ms = std::min(a.cpu_time_ms, b.cpu_time_ms),
        .memory_bytes = std::min(a.memory_bytes, b.memory_bytes),
        .max_processes = std::min(a.max_processes, b.max_processes),
        .max_file_size_bytes = std::min(a.max_file_size_bytes, b.max_file_size_bytes),
        .max_open_files = std::min(a.max_open_files, b.max_open_files)
    };
}

/// Apply one override field.
std::optional<Rejection> apply(const char* name,
                               const std::optional<uint64_t>& requested,
                               uint64_t ceiling,
                               uint64_t& target) {
    if (!requested) return std::nullopt;
    if (*requested == 0) {
        return Rejection{RejectReason::MalformedSubmission,
                         std::string{name} + " override must be positive"};
    }
    if (*requested > ceiling) {
        return Rejection{RejectReason::LimitAboveCeiling,
                         std::string{name} + " override " + std::to_string(*requested)
                             + " exceeds ceiling " + std::to_string(ceiling)};
    }
    target = *requested;
    return std::nullopt;
}

}  // anonymous namespace

Result<void, Rejection> validate_submission(const Submission& submission,
                                            const AdmissionPolicy& policy) {
    if (submission.environment_id.empty()) {
        return Rejection{RejectReason::MalformedSubmission, "environment id is empty"};
    }
    if (static_cast<size_t>(submission.priority) >= kPriorityClasses) {
        return Rejection{RejectReason::MalformedSubmission,
                         "priority " + std::to_string(static_cast<int>(submission.priority))
                             + " is out of range"};
    }
    if (submission.source_code.empty()) {
        return Rejection{RejectReason::MalformedSubmission, "source code is empty"};
    }
    if (submission.source_code.size() > policy.max_source_bytes) {
        return Rejection{RejectReason::MalformedSubmission,
                         "source code exceeds " + std::to_string(policy.max_source_bytes) + " bytes"};
    }
    if (submission.stdin_data.size() > policy.max_stdin_bytes) {
        return Rejection{RejectReason::MalformedSubmission, "stdin payload too large"};
    }
    if (submission.args.size() > policy.max_args) {
        return Rejection{RejectReason::MalformedSubmission, "too many program arguments"};
    }
    if (submission.test_cases.size() > policy.max_test_cases) {
        return Rejection{RejectReason::MalformedSubmission,
                         "more than " + std::to_string(policy.max_test_cases) + " test cases"};
    }

    std::set<uint32_t> seen;
    for (const auto& test : submission.test_cases) {
        if (!seen.insert(test.index).second) {
            return Rejection{RejectReason::MalformedSubmission,
                             "duplicate test case index " + std::to_string(test.index)};
        }
        if (test.input.size() > policy.max_stdin_bytes) {
            return Rejection{RejectReason::MalformedSubmission,
                             "test case " + std::to_string(test.index) + " input too large"};
        }
        if (test.mode == ComparisonMode::Numeric && !(test.epsilon >= 0.0)) {
            return Rejection{RejectReason::MalformedSubmission,
                             "test case " + std::to_string(test.index) + " has a negative epsilon"};
        }
    }
    return {};
}

Result<ResourceLimits, Rejection> effective_limits(const ExecutionEnvironment& env,
                                                   const LimitOverrides& overrides,
                                                   const ResourceLimits& global_ceiling) {
    auto ceiling = min_limits(env.max_limits, global_ceiling);
    auto limits = min_limits(env.default_limits, ceiling);

    for (auto failure : {
             apply("wall_time_ms", overrides.wall_time_ms, ceiling.wall_time_ms, limits.wall_time_ms),
             apply("cpu_time_ms", overrides.cpu_time_ms, ceiling.cpu_time_ms, limits.cpu_time_ms),
             apply("memory_bytes", overrides.memory_bytes, ceiling.memory_bytes, limits.memory_bytes),
             apply("max_processes", overrides.max_processes, ceiling.max_processes,
                   limits.max_processes)}) {
        if (failure) return std::move(*failure);
    }
    return limits;
}

}  // namespace exec_engine
