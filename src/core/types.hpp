/**
 * @file types.hpp
 * @brief Fundamental types used throughout ExecEngine.
 * @author Dimitris Kafetzis
 *
 * Defines RunId, ResourceLimits, the run/failure taxonomy and other shared
 * vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace exec_engine {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using RunId = std::string;
using EnvironmentId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Resource Limits
// ─────────────────────────────────────────────

/**
 * @brief Resource budget for a single sandboxed process.
 *
 * Environments carry a default set and a ceiling set; the effective limits
 * of a run are the defaults with caller overrides applied, never above the
 * ceiling.
 */
struct ResourceLimits {
    uint64_t wall_time_ms{30'000};               ///< Wall-clock deadline
    uint64_t cpu_time_ms{10'000};                ///< CPU time (user + system)
    uint64_t memory_bytes{128ULL * 1024 * 1024}; ///< Peak memory (cgroup / RSS)
    uint64_t max_processes{32};                  ///< Tasks alive at once
    uint64_t max_file_size_bytes{10ULL * 1024 * 1024};
    uint64_t max_open_files{64};

    auto operator<=>(const ResourceLimits&) const = default;

    /// True when every field of this is at or below the matching ceiling.
    [[nodiscard]] constexpr bool within(const ResourceLimits& ceiling) const noexcept {
        return wall_time_ms <= ceiling.wall_time_ms
            && cpu_time_ms <= ceiling.cpu_time_ms
            && memory_bytes <= ceiling.memory_bytes
            && max_processes <= ceiling.max_processes
            && max_file_size_bytes <= ceiling.max_file_size_bytes
            && max_open_files <= ceiling.max_open_files;
    }
};

/**
 * @brief Caller-supplied overrides; unset fields keep the environment default.
 */
struct LimitOverrides {
    std::optional<uint64_t> wall_time_ms;
    std::optional<uint64_t> cpu_time_ms;
    std::optional<uint64_t> memory_bytes;
    std::optional<uint64_t> max_processes;

    [[nodiscard]] bool empty() const noexcept {
        return !wall_time_ms && !cpu_time_ms && !memory_bytes && !max_processes;
    }
};

// ─────────────────────────────────────────────
// Run State
// ─────────────────────────────────────────────

enum class RunState : uint8_t {
    Queued,            ///< Admitted, waiting for a worker slot
    Running,           ///< A worker slot is driving the run
    Completed,         ///< Program exited on its own within its caps
    TimedOut,          ///< Wall-clock deadline elapsed
    ResourceExceeded,  ///< Memory, CPU or file-size cap exceeded
    CrashFailed,       ///< Crash, compile failure or engine failure
    Cancelled          ///< Cancelled by the caller or by shutdown
};

[[nodiscard]] constexpr bool is_terminal(RunState state) noexcept {
    return state != RunState::Queued && state != RunState::Running;
}

[[nodiscard]] constexpr std::string_view to_string(RunState state) noexcept {
    switch (state) {
        case RunState::Queued:           return "queued";
        case RunState::Running:          return "running";
        case RunState::Completed:        return "completed";
        case RunState::TimedOut:         return "timed_out";
        case RunState::ResourceExceeded: return "resource_exceeded";
        case RunState::CrashFailed:      return "crash_failed";
        case RunState::Cancelled:        return "cancelled";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Failure Kind
// ─────────────────────────────────────────────

enum class FailureKind : uint8_t {
    Timeout,
    MemoryLimit,
    CpuLimit,
    FileSizeLimit,
    Crash,
    CompileError,
    Cancelled,
    SystemError
};

[[nodiscard]] constexpr std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::Timeout:       return "timeout";
        case FailureKind::MemoryLimit:   return "memory_limit";
        case FailureKind::CpuLimit:      return "cpu_limit";
        case FailureKind::FileSizeLimit: return "file_size_limit";
        case FailureKind::Crash:         return "crash";
        case FailureKind::CompileError:  return "compile_error";
        case FailureKind::Cancelled:     return "cancelled";
        case FailureKind::SystemError:   return "system_error";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Priority
// ─────────────────────────────────────────────

enum class Priority : uint8_t {
    Low = 0,
    Normal = 1,
    High = 2
};

inline constexpr size_t kPriorityClasses = 3;

[[nodiscard]] constexpr std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::Low:    return "low";
        case Priority::Normal: return "normal";
        case Priority::High:   return "high";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Priority> parse_priority(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Comparison Mode
// ─────────────────────────────────────────────

enum class ComparisonMode : uint8_t {
    Exact,        ///< Byte-for-byte
    Whitespace,   ///< Collapse whitespace runs, trim ends
    Numeric       ///< Token-wise, numbers within epsilon
};

[[nodiscard]] constexpr std::string_view to_string(ComparisonMode mode) noexcept {
    switch (mode) {
        case ComparisonMode::Exact:      return "exact";
        case ComparisonMode::Whitespace: return "whitespace";
        case ComparisonMode::Numeric:    return "numeric";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ComparisonMode> parse_comparison_mode(std::string_view text) noexcept;

}  // namespace exec_engine
