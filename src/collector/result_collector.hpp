/**
 * @file result_collector.hpp
 * @brief Translates raw sandbox reports into the run outcome taxonomy.
 * @author Dimitris Kafetzis
 *
 * This is the only place wait statuses, signal numbers and kill causes are
 * interpreted. Everything downstream works with RunState, FailureKind and
 * a human-readable detail string.
 */

#pragma once

#include "collector/execution_result.hpp"
#include "core/types.hpp"
#include "sandbox/sandbox_types.hpp"

#include <optional>
#include <string>

namespace exec_engine {

struct Classification {
    SandboxState state{SandboxState::Completed};
    std::optional<FailureKind> failure;
    std::string detail;
};

/**
 * @brief Decide the terminal sandbox state of a finished process.
 *
 * Supervisor kills take precedence over the wait status. Without one, a
 * signal is read against the limits: SIGXCPU and a CPU-time overrun mean
 * CpuLimit, SIGXFSZ means FileSizeLimit, an OOM kill or a peak at the cap
 * means MemoryLimit, anything else is a crash.
 */
[[nodiscard]] Classification classify(const SandboxReport& report, const ResourceLimits& limits);

/// "segmentation fault", "abort", ...; never the bare number.
[[nodiscard]] std::string describe_signal(int signal_number);

[[nodiscard]] RunState to_run_state(SandboxState state) noexcept;

/**
 * @brief Builds ExecutionResult values from sandbox reports.
 */
class ResultCollector {
public:
    /// Result of a run (or single test execution) from its sandbox report.
    [[nodiscard]] static ExecutionResult collect(const SandboxReport& report,
                                                 const ResourceLimits& limits);

    /**
     * @brief Result of a compile step that did not produce an artifact.
     *
     * A compiler that exits non-zero or crashes yields CrashFailed with
     * CompileError; a compiler that hits its own limits keeps that state.
     */
    [[nodiscard]] static ExecutionResult compile_failure(const SandboxReport& report,
                                                         const ResourceLimits& limits);

    [[nodiscard]] static ExecutionResult system_error(std::string detail);
    [[nodiscard]] static ExecutionResult cancelled(std::string detail);
};

}  // namespace exec_engine
