/**
 * @file sandbox.hpp
 * @brief Single-use Linux sandbox: workspace, namespaces, cgroup, supervisor.
 * @author Dimitris Kafetzis
 *
 * A Sandbox is created for exactly one process and destroyed right after
 * it terminates. Isolation layers, outermost first:
 *
 *   - a fresh workspace directory holding only the injected files
 *   - user (when unprivileged), PID, mount, network, IPC and UTS namespaces
 *   - the host tree remounted read-only with only the workspace bound back
 *     writable, plus private tmpfs over /tmp, /var/tmp and /dev/shm, or a
 *     chroot when the environment ships a root filesystem
 *   - a cgroup v2 leaf for memory, pids and CPU accounting (when available)
 *   - rlimits, an empty capability bounding set, PR_SET_NO_NEW_PRIVS,
 *     PR_SET_PDEATHSIG and a scrubbed env
 *
 * Process layout when isolated:
 *
 *   supervisor ─ child (host pid ns) ─ init (pid 1) ─ program (pid 2)
 *
 * The init reaps orphans and relays the program's wait status. Killing it
 * makes the kernel kill every process in the namespace, including ones that
 * left the process group with setsid(). The child reaps the init and exits,
 * so wait4() on the child accounts for the whole tree.
 */

#pragma once

#include "core/result.hpp"
#include "sandbox/cgroup.hpp"
#include "sandbox/sandbox_types.hpp"

#include <sys/types.h>

#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace exec_engine {

class Sandbox {
public:
    /**
     * @brief Allocate the workspace, write the spec's files and set up the cgroup.
     *
     * The returned sandbox is in state Created.
     */
    static Result<std::unique_ptr<Sandbox>> create(const SandboxOptions& options,
                                                   SandboxSpec spec);

    /// Destroys the sandbox if the owner did not.
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    /**
     * @brief Start the process and supervise it until it terminates.
     *
     * The wall-clock deadline is fixed before fork(). A stop request kills
     * the whole process tree. An Error means the sandbox machinery failed;
     * anything the program itself did is described by the report.
     */
    Result<SandboxReport> run(std::stop_token stop);

    /**
     * @brief Kill survivors, reap, remove the cgroup and the workspace.
     *
     * Idempotent. The sandbox is Destroyed afterwards even when cleanup
     * reports an error.
     */
    Result<void> destroy();

    [[nodiscard]] SandboxState state() const noexcept { return state_; }
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] bool cgroup_enabled() const noexcept { return cgroup_ != nullptr; }

private:
    Sandbox(SandboxOptions options, SandboxSpec spec, std::filesystem::path workspace);

    void kill_tree() noexcept;

    SandboxOptions options_;
    SandboxSpec spec_;
    std::filesystem::path workspace_;
    std::unique_ptr<CgroupLeaf> cgroup_;
    SandboxState state_{SandboxState::Created};
    pid_t child_pid_{-1};
    pid_t init_pid_{-1};     ///< Host pid of the namespace init, once reported
    bool reaped_{true};
};

/**
 * @brief Whether this host lets the engine create the sandbox namespaces.
 *
 * Forks a short-lived process that performs the same unshare and mount steps
 * as a real sandbox, including becoming pid 1 and a read-only remount of /.
 */
[[nodiscard]] bool probe_isolation();

/// The workspace directory as the sandboxed program sees it.
[[nodiscard]] std::string sandbox_workdir(std::string_view rootfs);

}  // namespace exec_engine
