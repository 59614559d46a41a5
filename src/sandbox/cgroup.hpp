/**
 * @file cgroup.hpp
 * @brief Per-sandbox cgroup v2 leaf: limits, accounting and group kill.
 * @author Dimitris Kafetzis
 *
 * The configured cgroup root must be a delegated cgroup v2 directory the
 * engine can write to, holding no processes of its own. Each sandbox gets
 * one leaf below it, which is removed during teardown.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace exec_engine {

struct CgroupStats {
    uint64_t cpu_usage_us{0};        ///< cpu.stat usage_usec
    uint64_t memory_current{0};      ///< memory.current
    uint64_t memory_peak{0};         ///< memory.peak, 0 on kernels without it
    uint64_t oom_kills{0};           ///< memory.events oom_kill
};

class CgroupLeaf {
public:
    /// True when `root` is a writable cgroup v2 directory offering memory and pids.
    [[nodiscard]] static bool available(const std::filesystem::path& root);

    /**
     * @brief Create `root/name` and write memory.max, memory.swap.max and pids.max.
     */
    static Result<std::unique_ptr<CgroupLeaf>> create(const std::filesystem::path& root,
                                                      const std::string& name,
                                                      const ResourceLimits& limits);

    ~CgroupLeaf();

    CgroupLeaf(const CgroupLeaf&) = delete;
    CgroupLeaf& operator=(const CgroupLeaf&) = delete;

    Result<void> add_process(pid_t pid);

    [[nodiscard]] CgroupStats stats() const;

    /// SIGKILL every task in the leaf (cgroup.kill, or cgroup.procs on older kernels).
    void kill_all() noexcept;

    [[nodiscard]] bool populated() const;

    /**
     * @brief Kill survivors, wait up to `grace` for the leaf to empty, then rmdir it.
     */
    Result<void> destroy(std::chrono::milliseconds grace);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit CgroupLeaf(std::filesystem::path path);

    std::filesystem::path path_;
    bool removed_{false};
};

}  // namespace exec_engine
