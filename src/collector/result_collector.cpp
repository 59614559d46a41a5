/**
 * @file result_collector.cpp
 * @brief ResultCollector and signal/limit classification.
 * @author Dimitris Kafetzis
 */

#include "collector/result_collector.hpp"

#include <csignal>

namespace exec_engine {

namespace {

constexpr uint64_t kMiB = 1024ULL * 1024;

std::string wall_detail(const ResourceLimits& limits) {
    return "wall-clock limit of " + std::to_string(limits.wall_time_ms) + " ms exceeded";
}

std::string memory_detail(const ResourceLimits& limits) {
    return "memory limit of " + std::to_string(limits.memory_bytes / kMiB) + " MiB exceeded";
}

std::string cpu_detail(const ResourceLimits& limits) {
    return "cpu time limit of " + std::to_string(limits.cpu_time_ms) + " ms exceeded";
}

std::string file_size_detail(const ResourceLimits& limits) {
    return "file size limit of " + std::to_string(limits.max_file_size_bytes) + " bytes exceeded";
}

bool cpu_exhausted(const SandboxReport& report, const ResourceLimits& limits) {
    return report.cpu_time_us >= limits.cpu_time_ms * 1000;
}

/// A cgroup never refuses an allocation, it OOM-kills; its peak also counts page cache.
bool memory_exhausted(const SandboxReport& report, const ResourceLimits& limits) {
    if (report.oom_killed) return true;
    if (report.cgroup_accounting) return false;
    return report.peak_memory_bytes >= limits.memory_bytes;
}

void fill_usage(ExecutionResult& result, const SandboxReport& report) {
    result.stdout_data = report.stdout_data;
    result.stderr_data = report.stderr_data;
    result.stdout_truncated = report.stdout_truncated;
    result.stderr_truncated = report.stderr_truncated;
    result.cpu_time_ms = report.cpu_time_us / 1000;
    result.peak_memory_bytes = report.peak_memory_bytes;
    result.wall_time_ms = report.wall_time_us / 1000;
}

}  // anonymous namespace

std::string describe_signal(int signal_number) {
    switch (signal_number) {
        case SIGSEGV: return "segmentation fault";
        case SIGABRT: return "abort";
        case SIGFPE:  return "floating point exception";
        case SIGBUS:  return "bus error";
        case SIGILL:  return "illegal instruction";
        case SIGKILL: return "killed";
        case SIGTERM: return "terminated";
        case SIGPIPE: return "broken pipe";
        case SIGTRAP: return "trace trap";
        case SIGSYS:  return "bad system call";
        case SIGINT:  return "interrupted";
        case SIGXCPU: return "cpu time limit signal";
        case SIGXFSZ: return "file size limit signal";
        default:      return "fatal signal";
    }
}

Classification classify(const SandboxReport& report, const ResourceLimits& limits) {
    switch (report.kill_cause) {
        case KillCause::Cancelled:
            return {SandboxState::Cancelled, FailureKind::Cancelled, "cancelled while running"};
        case KillCause::Deadline:
            return {SandboxState::TimedOut, FailureKind::Timeout, wall_detail(limits)};
        case KillCause::MemoryCap:
            return {SandboxState::ResourceExceeded, FailureKind::MemoryLimit, memory_detail(limits)};
        case KillCause::CpuCap:
            return {SandboxState::ResourceExceeded, FailureKind::CpuLimit, cpu_detail(limits)};
        case KillCause::None:
            break;
    }

    if (report.signaled) {
        int sig = report.term_signal;
        if (sig == SIGXCPU || (sig == SIGKILL && cpu_exhausted(report, limits))) {
            return {SandboxState::ResourceExceeded, FailureKind::CpuLimit, cpu_detail(limits)};
        }
        if (sig == SIGXFSZ) {
            return {SandboxState::ResourceExceeded, FailureKind::FileSizeLimit,
                    file_size_detail(limits)};
        }
        if (memory_exhausted(report, limits)) {
            return {SandboxState::ResourceExceeded, FailureKind::MemoryLimit, memory_detail(limits)};
        }
        return {SandboxState::CrashFailed, FailureKind::Crash,
                "terminated by " + describe_signal(sig)};
    }

    // A program that failed an allocation at the cap usually exits non-zero.
    if (report.exit_code != 0 && memory_exhausted(report, limits)) {
        return {SandboxState::ResourceExceeded, FailureKind::MemoryLimit, memory_detail(limits)};
    }
    return {SandboxState::Completed, std::nullopt, {}};
}

RunState to_run_state(SandboxState state) noexcept {
    switch (state) {
        case SandboxState::Created:          return RunState::Queued;
        case SandboxState::Running:          return RunState::Running;
        case SandboxState::Completed:        return RunState::Completed;
        case SandboxState::TimedOut:         return RunState::TimedOut;
        case SandboxState::ResourceExceeded: return RunState::ResourceExceeded;
        case SandboxState::CrashFailed:      return RunState::CrashFailed;
        case SandboxState::Cancelled:        return RunState::Cancelled;
        case SandboxState::Destroyed:        return RunState::CrashFailed;
    }
    return RunState::CrashFailed;
}

// ─────────────────────────────────────────────
// ResultCollector
// ─────────────────────────────────────────────

ExecutionResult ResultCollector::collect(const SandboxReport& report,
                                         const ResourceLimits& limits) {
    auto verdict = classify(report, limits);

    ExecutionResult result;
    fill_usage(result, report);
    result.state = to_run_state(verdict.state);
    result.failure_kind = verdict.failure;
    result.failure_detail = std::move(verdict.detail);
    if (verdict.state == SandboxState::Completed && report.exited) {
        result.exit_code = report.exit_code;
    }
    return result;
}

ExecutionResult ResultCollector::compile_failure(const SandboxReport& report,
                                                 const ResourceLimits& limits) {
    auto verdict = classify(report, limits);

    ExecutionResult result;
    fill_usage(result, report);
    switch (verdict.state) {
        case SandboxState::TimedOut:
        case SandboxState::ResourceExceeded:
        case SandboxState::Cancelled:
            result.state = to_run_state(verdict.state);
            result.failure_kind = verdict.failure;
            result.failure_detail = "compilation: " + verdict.detail;
            break;
        default:
            result.state = RunState::CrashFailed;
            result.failure_kind = FailureKind::CompileError;
            if (report.signaled) {
                result.failure_detail =
                    "compiler terminated by " + describe_signal(report.term_signal);
            } else if (report.exit_code != 0) {
                result.failure_detail =
                    "compiler exited with status " + std::to_string(report.exit_code);
            } else {
                result.failure_detail = "compiler produced no artifact";
            }
            break;
    }
    return result;
}

ExecutionResult ResultCollector::system_error(std::string detail) {
    ExecutionResult result;
    result.state = RunState::CrashFailed;
    result.failure_kind = FailureKind::SystemError;
    result.failure_detail = std::move(detail);
    return result;
}

ExecutionResult ResultCollector::cancelled(std::string detail) {
    ExecutionResult result;
    result.state = RunState::Cancelled;
    result.failure_kind = FailureKind::Cancelled;
    result.failure_detail = std::move(detail);
    return result;
}

}  // namespace exec_engine
