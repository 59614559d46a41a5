/**
 * @file sandbox_types.hpp
 * @brief Value types shared by the sandbox, its launchers and the collector.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace exec_engine {

// ─────────────────────────────────────────────
// Sandbox State Machine
// ─────────────────────────────────────────────

/**
 * Created → Running → {Completed, TimedOut, ResourceExceeded, CrashFailed,
 * Cancelled} → Destroyed. Destroyed is reachable from every state.
 */
enum class SandboxState : uint8_t {
    Created,
    Running,
    Completed,
    TimedOut,
    ResourceExceeded,
    CrashFailed,
    Cancelled,
    Destroyed
};

[[nodiscard]] constexpr std::string_view to_string(SandboxState state) noexcept {
    switch (state) {
        case SandboxState::Created:          return "created";
        case SandboxState::Running:          return "running";
        case SandboxState::Completed:        return "completed";
        case SandboxState::TimedOut:         return "timed_out";
        case SandboxState::ResourceExceeded: return "resource_exceeded";
        case SandboxState::CrashFailed:      return "crash_failed";
        case SandboxState::Cancelled:        return "cancelled";
        case SandboxState::Destroyed:        return "destroyed";
    }
    return "unknown";
}

/// Why the supervisor killed the process tree, if it did.
enum class KillCause : uint8_t {
    None,
    Deadline,
    MemoryCap,
    CpuCap,
    Cancelled
};

// ─────────────────────────────────────────────
// Request / Report
// ─────────────────────────────────────────────

struct SandboxFile {
    std::string name;       ///< Plain file name inside the workspace
    std::string content;
    bool executable{false};
};

/**
 * @brief Everything needed to run one process in a fresh sandbox.
 */
struct SandboxSpec {
    std::string label;                  ///< Used in workspace/cgroup names and logs
    std::string rootfs;                 ///< Empty = host filesystem
    std::vector<std::string> argv;
    std::vector<std::string> env;       ///< KEY=VALUE, nothing else is inherited
    std::vector<SandboxFile> files;
    std::string stdin_data;
    ResourceLimits limits;
    std::string collect_file;           ///< Read back after a clean exit (compile artifact)
};

/**
 * @brief Raw outcome of one sandboxed process, before normalization.
 */
struct SandboxReport {
    SandboxState state{SandboxState::Created};

    bool exited{false};                 ///< WIFEXITED
    int exit_code{0};
    bool signaled{false};               ///< WIFSIGNALED
    int term_signal{0};

    KillCause kill_cause{KillCause::None};
    bool oom_killed{false};             ///< cgroup memory.events reported an OOM kill
    bool cgroup_accounting{false};      ///< Usage came from a cgroup (peak includes page cache)

    uint64_t cpu_time_us{0};
    uint64_t peak_memory_bytes{0};
    uint64_t wall_time_us{0};

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated{false};
    bool stderr_truncated{false};

    std::optional<std::string> collected_file;
};

/**
 * @brief Host-side sandbox settings, taken from the [sandbox] config table.
 */
struct SandboxOptions {
    std::filesystem::path root_dir = "/tmp/exec_engine";
    std::filesystem::path cgroup_root;          ///< Empty = no cgroup
    bool use_namespaces = true;
    bool require_isolation = true;              ///< Refuse to run without namespaces
    uint64_t output_limit_bytes = 64 * 1024;
    uint32_t teardown_grace_ms = 500;
    uint32_t watchdog_interval_ms = 10;
    /// RLIMIT_AS = memory × this when there is no cgroup; 0 = off. A refused
    /// allocation then surfaces as the program's own failure.
    uint32_t address_space_multiplier = 0;
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
};

}  // namespace exec_engine
