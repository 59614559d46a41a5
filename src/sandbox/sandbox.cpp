/**
 * @file sandbox.cpp
 * @brief Sandbox: fork/unshare/exec and the supervising poll loop.
 * @author Dimitris Kafetzis
 *
 * Everything the child needs is prepared before fork(): the engine is
 * multi-threaded, so the child only issues raw system calls until execve().
 */

#include "sandbox/sandbox.hpp"

#include "collector/result_collector.hpp"
#include "sandbox/output_capture.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <linux/securebits.h>
#include <net/if.h>
#include <poll.h>
#include <sched.h>
#include <sstream>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace exec_engine {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char* kRootfsWorkdir = "/sandbox";
constexpr const char* kTmpfsOptions = "mode=1777,size=64m";
constexpr int kExecFailedStatus = 127;
/// The namespace init and its parent share the program's process budget.
constexpr uint64_t kHelperProcesses = 2;
constexpr size_t kMaxSampledProcesses = 1024;

// ─────────────────────────────────────────────
// File descriptors
// ─────────────────────────────────────────────

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

Result<Pipe> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{std::string{"pipe2: "} + std::strerror(errno)};
    }
    return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// ─────────────────────────────────────────────
// Child side
// ─────────────────────────────────────────────

/// Which child setup step failed; sent to the parent over the failure pipe.
enum class ChildStage : int {
    Sync = 1,
    ProcessGroup,
    UserNamespace,
    IdMap,
    Namespaces,
    MountPrivate,
    Filesystem,
    Chroot,
    Chdir,
    ReadOnlyRoot,
    Fork,
    Rlimit,
    Capabilities,
    NoNewPrivs,
    Stdio,
    Exec
};

const char* describe_stage(ChildStage stage) {
    switch (stage) {
        case ChildStage::Sync:          return "synchronization";
        case ChildStage::ProcessGroup:  return "process group";
        case ChildStage::UserNamespace: return "user namespace";
        case ChildStage::IdMap:         return "uid/gid mapping";
        case ChildStage::Namespaces:    return "namespaces";
        case ChildStage::MountPrivate:  return "private mounts";
        case ChildStage::Filesystem:    return "filesystem setup";
        case ChildStage::Chroot:        return "chroot";
        case ChildStage::Chdir:         return "chdir";
        case ChildStage::ReadOnlyRoot:  return "read-only root";
        case ChildStage::Fork:          return "namespace init";
        case ChildStage::Rlimit:        return "rlimits";
        case ChildStage::Capabilities:  return "capabilities";
        case ChildStage::NoNewPrivs:    return "no_new_privs";
        case ChildStage::Stdio:         return "stdio";
        case ChildStage::Exec:          return "exec";
    }
    return "setup";
}

struct ChildFailure {
    int stage;
    int error;
};

/// What the namespace init relays once the program has exited.
struct ProgramExit {
    int status;
    long max_rss_kb;   ///< Largest ru_maxrss among everything the init reaped
};

struct LimitSetting {
    int resource;
    rlim_t soft;
    rlim_t hard;
    bool user_namespace_only{false};   ///< Counted per namespace only inside a user namespace
};

/// Immutable input of the child, fully built before fork().
struct ChildContext {
    pid_t parent_pid{0};
    const char* program{nullptr};
    char* const* argv{nullptr};
    char* const* envp{nullptr};
    const char* workspace{nullptr};
    const char* rootfs{nullptr};        ///< nullptr on the host filesystem
    const char* bind_target{nullptr};   ///< <rootfs>/sandbox
    bool use_namespaces{true};
    bool require_isolation{false};
    bool map_user{false};
    const char* uid_map{nullptr};
    const char* gid_map{nullptr};
    const LimitSetting* limits{nullptr};
    size_t limit_count{0};
    int stdin_fd{-1};
    int stdout_fd{-1};
    int stderr_fd{-1};
    int failure_fd{-1};
    int sync_fd{-1};
    int init_fd{-1};      ///< Receives the host pid of the namespace init
    int status_fd{-1};    ///< Receives the program's raw wait status
};

[[noreturn]] void child_fail(const ChildContext& ctx, ChildStage stage) {
    ChildFailure failure{static_cast<int>(stage), errno};
    ssize_t ignored = ::write(ctx.failure_fd, &failure, sizeof(failure));
    (void)ignored;
    ::_exit(kExecFailedStatus);
}

bool write_proc_file(const char* path, const char* text) {
    int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    size_t len = std::strlen(text);
    bool ok = ::write(fd, text, len) == static_cast<ssize_t>(len);
    ::close(fd);
    return ok;
}

/// A new network namespace starts with lo down; the program gets loopback only.
void bring_up_loopback() {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return;
    struct ifreq ifr {};
    std::memcpy(ifr.ifr_name, "lo", 3);
    if (::ioctl(fd, SIOCGIFFLAGS, &ifr) == 0) {
        ifr.ifr_flags |= IFF_UP | IFF_RUNNING;
        ::ioctl(fd, SIOCSIFFLAGS, &ifr);
    }
    ::close(fd);
}

/// Returns the failing stage, or 0 when every namespace is in place.
///
/// CLONE_NEWPID only applies to children: the caller's next fork() becomes
/// pid 1 of the new namespace.
int enter_namespaces(const ChildContext& ctx) {
    if (ctx.map_user) {
        if (::unshare(CLONE_NEWUSER) != 0) return static_cast<int>(ChildStage::UserNamespace);
        if (!write_proc_file("/proc/self/setgroups", "deny")
            || !write_proc_file("/proc/self/uid_map", ctx.uid_map)
            || !write_proc_file("/proc/self/gid_map", ctx.gid_map)) {
            return static_cast<int>(ChildStage::IdMap);
        }
    }
    if (::unshare(CLONE_NEWNS | CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS | CLONE_NEWPID) != 0) {
        return static_cast<int>(ChildStage::Namespaces);
    }
    if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        return static_cast<int>(ChildStage::MountPrivate);
    }
    ::sethostname("sandbox", 7);
    bring_up_loopback();
    return 0;
}

bool mount_tmpfs(const char* target) {
    struct stat st {};
    if (::stat(target, &st) != 0) return true;  // nothing to hide
    return ::mount("tmpfs", target, "tmpfs", MS_NOSUID | MS_NODEV, kTmpfsOptions) == 0;
}

bool set_mount_readonly(const char* path, bool readonly, unsigned int flags) {
    struct mount_attr attr {};
    if (readonly) attr.attr_set = MOUNT_ATTR_RDONLY;
    else attr.attr_clr = MOUNT_ATTR_RDONLY;
    return ::mount_setattr(AT_FDCWD, path, flags, &attr, sizeof(attr)) == 0;
}

/// Returns the failing stage, or 0 once the whole host tree is read-only,
/// the workspace is the only writable host directory and the process sits in it.
int isolate_filesystem(const ChildContext& ctx) {
    const char* target = ctx.rootfs != nullptr ? ctx.bind_target : ctx.workspace;
    if (::mount(ctx.workspace, target, nullptr, MS_BIND, nullptr) != 0) {
        return static_cast<int>(ChildStage::Filesystem);
    }
    if (!set_mount_readonly("/", true, AT_RECURSIVE) || !set_mount_readonly(target, false, 0)) {
        return static_cast<int>(ChildStage::ReadOnlyRoot);
    }

    if (ctx.rootfs != nullptr) {
        if (::chroot(ctx.rootfs) != 0) return static_cast<int>(ChildStage::Chroot);
        if (::chdir(kRootfsWorkdir) != 0) return static_cast<int>(ChildStage::Chdir);
        if (!mount_tmpfs("/tmp")) return static_cast<int>(ChildStage::Filesystem);
        return 0;
    }
    // chdir before the tmpfs mounts: the workspace may itself live under /tmp.
    if (::chdir(ctx.workspace) != 0) return static_cast<int>(ChildStage::Chdir);
    for (const char* hidden : {"/tmp", "/var/tmp", "/dev/shm"}) {
        if (!mount_tmpfs(hidden)) return static_cast<int>(ChildStage::Filesystem);
    }
    return 0;
}

/// Empties the bounding set and stops execve() from granting root its capabilities.
bool drop_capabilities() {
    for (int cap = 0; cap < 64; ++cap) {
        if (::prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0 && errno != EINVAL) return false;
    }
    ::prctl(PR_CAP_AMBIENT, PR_CAP_AMBIENT_CLEAR_ALL, 0, 0, 0);
    return ::prctl(PR_SET_SECUREBITS, SECBIT_NOROOT | SECBIT_NOROOT_LOCKED, 0, 0, 0) == 0;
}

void close_stdio(const ChildContext& ctx) {
    ::close(ctx.stdin_fd);
    ::close(ctx.stdout_fd);
    ::close(ctx.stderr_fd);
    ::close(ctx.sync_fd);
}

/// The user program: limits, privileges and stdio, then execve().
[[noreturn]] void program_main(const ChildContext& ctx, bool isolated) {
    const bool own_user_namespace = isolated && ctx.map_user;
    for (size_t i = 0; i < ctx.limit_count; ++i) {
        const auto& limit = ctx.limits[i];
        if (limit.user_namespace_only && !own_user_namespace) continue;
        struct rlimit rl {limit.soft, limit.hard};
        if (::setrlimit(limit.resource, &rl) != 0) child_fail(ctx, ChildStage::Rlimit);
    }

    if ((isolated || ::geteuid() == 0) && !drop_capabilities()) {
        child_fail(ctx, ChildStage::Capabilities);
    }
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) child_fail(ctx, ChildStage::NoNewPrivs);

    if (::dup2(ctx.stdin_fd, STDIN_FILENO) < 0 || ::dup2(ctx.stdout_fd, STDOUT_FILENO) < 0
        || ::dup2(ctx.stderr_fd, STDERR_FILENO) < 0) {
        child_fail(ctx, ChildStage::Stdio);
    }

    ::execve(ctx.program, ctx.argv, ctx.envp);
    child_fail(ctx, ChildStage::Exec);
}

/**
 * Pid 1 of the sandbox's PID namespace. The program runs as pid 2 so that
 * its own signals keep their default actions; orphans are reaped here.
 * Returning from init makes the kernel kill everything left in the namespace.
 */
[[noreturn]] void namespace_init(const ChildContext& ctx) {
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
    ::close(ctx.init_fd);
    // A fresh /proc shows only this namespace; some hosts refuse it, the host's stays then.
    ::mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr);

    pid_t program = ::fork();
    if (program < 0) child_fail(ctx, ChildStage::Fork);
    if (program == 0) program_main(ctx, true);
    close_stdio(ctx);

    ProgramExit exit_report{0, 0};
    for (;;) {
        int status = 0;
        struct rusage usage {};
        pid_t reaped = ::wait4(-1, &status, 0, &usage);
        if (reaped > 0) exit_report.max_rss_kb = std::max(exit_report.max_rss_kb, usage.ru_maxrss);
        if (reaped == program) {
            exit_report.status = status;
            break;
        }
        if (reaped < 0 && errno != EINTR) break;
    }
    ssize_t ignored = ::write(ctx.status_fd, &exit_report, sizeof(exit_report));
    (void)ignored;
    ::_exit(0);
}

/// Parent of the namespace init: reports its host pid, then mirrors its fate.
[[noreturn]] void run_namespace(const ChildContext& ctx) {
    pid_t init = ::fork();
    if (init < 0) child_fail(ctx, ChildStage::Fork);
    if (init == 0) namespace_init(ctx);

    ssize_t ignored = ::write(ctx.init_fd, &init, sizeof(init));
    (void)ignored;
    ::close(ctx.init_fd);
    ::close(ctx.status_fd);
    close_stdio(ctx);

    int status = 0;
    while (::waitpid(init, &status, 0) < 0 && errno == EINTR) {}
    if (WIFSIGNALED(status)) {
        ::signal(WTERMSIG(status), SIG_DFL);
        ::kill(::getpid(), WTERMSIG(status));
    }
    ::_exit(WIFEXITED(status) ? WEXITSTATUS(status) : kExecFailedStatus);
}

[[noreturn]] void child_main(const ChildContext& ctx) {
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    ::sigaction(SIGPIPE, &dfl, nullptr);

    char go = 0;
    if (::read(ctx.sync_fd, &go, 1) != 1) child_fail(ctx, ChildStage::Sync);

    if (::setpgid(0, 0) != 0) child_fail(ctx, ChildStage::ProcessGroup);
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
    if (::getppid() != ctx.parent_pid) ::_exit(kExecFailedStatus);

    if (ctx.use_namespaces) {
        int failed = enter_namespaces(ctx);
        if (failed == 0) {
            failed = isolate_filesystem(ctx);
            // Half-isolated mounts are never handed to a program.
            if (failed != 0) child_fail(ctx, static_cast<ChildStage>(failed));
            run_namespace(ctx);
        }
        if (ctx.require_isolation) child_fail(ctx, static_cast<ChildStage>(failed));
    }

    // Unisolated fallback: host filesystem, host pids, rlimits only.
    if (ctx.rootfs != nullptr) {
        errno = EPERM;
        child_fail(ctx, ChildStage::Chroot);
    }
    if (::chdir(ctx.workspace) != 0) child_fail(ctx, ChildStage::Chdir);
    program_main(ctx, false);
}

// ─────────────────────────────────────────────
// Parent-side helpers
// ─────────────────────────────────────────────

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

std::string find_env(const std::vector<std::string>& env, std::string_view key) {
    for (const auto& entry : env) {
        if (entry.size() > key.size() && entry.starts_with(key) && entry[key.size()] == '=') {
            return entry.substr(key.size() + 1);
        }
    }
    return {};
}

/// Resolve a bare program name against the sandbox PATH, looking inside the rootfs.
Result<std::string> resolve_program(const std::string& name, const std::string& search_path,
                                    const std::string& rootfs) {
    if (name.empty()) return Error{"empty program name"};
    if (name.find('/') != std::string::npos) return name;

    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        std::string on_host = rootfs.empty() ? candidate : rootfs + candidate;
        if (::access(on_host.c_str(), X_OK) == 0) return candidate;
    }
    return Error{"program '" + name + "' not found on " + search_path};
}

std::string sanitize_label(const std::string& label) {
    std::string out;
    for (char c : label) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                    || c == '-' || c == '_';
        out.push_back(keep ? c : '_');
    }
    return out.empty() ? std::string{"run"} : out;
}

uint64_t to_us(const struct timeval& tv) {
    return static_cast<uint64_t>(tv.tv_sec) * 1'000'000 + static_cast<uint64_t>(tv.tv_usec);
}

/// VmRSS of a live process in bytes, 0 when unreadable.
uint64_t read_rss_bytes(pid_t pid) {
    std::ifstream ifs("/proc/" + std::to_string(pid) + "/status");
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.starts_with("VmRSS:")) {
            std::istringstream iss(line.substr(6));
            uint64_t kb = 0;
            iss >> kb;
            return kb * 1024;
        }
    }
    return 0;
}

/// utime + stime of a live process, plus that of its reaped children, in microseconds.
uint64_t read_cpu_us(pid_t pid) {
    std::ifstream ifs("/proc/" + std::to_string(pid) + "/stat");
    std::string content;
    std::getline(ifs, content);
    // comm may contain spaces; fields resume after the last ')'.
    auto close_paren = content.rfind(')');
    if (close_paren == std::string::npos || close_paren + 2 > content.size()) return 0;
    std::istringstream iss(content.substr(close_paren + 2));
    std::string field;
    uint64_t ticks_used = 0;
    // state is field 3; utime, stime, cutime and cstime are fields 14 to 17.
    for (int i = 3; i <= 17 && iss >> field; ++i) {
        if (i >= 14) ticks_used += std::strtoull(field.c_str(), nullptr, 10);
    }
    static const long ticks = ::sysconf(_SC_CLK_TCK);
    if (ticks <= 0) return 0;
    return ticks_used * 1'000'000 / static_cast<uint64_t>(ticks);
}

struct TreeSample {
    uint64_t rss_bytes{0};
    uint64_t cpu_us{0};
};

/**
 * Sum RSS and CPU over `root` and every live descendant.
 *
 * The namespace init is a fork of the engine and never execs, so its memory
 * is left out with `count_root_memory`; its CPU still carries whatever it reaped.
 */
TreeSample sample_tree(pid_t root, bool count_root_memory) {
    TreeSample sample;
    std::vector<pid_t> pending{root};
    size_t visited = 0;
    while (!pending.empty() && visited < kMaxSampledProcesses) {
        pid_t pid = pending.back();
        pending.pop_back();
        ++visited;
        if (pid != root || count_root_memory) sample.rss_bytes += read_rss_bytes(pid);
        sample.cpu_us += read_cpu_us(pid);

        std::error_code ec;
        std::filesystem::directory_iterator tasks("/proc/" + std::to_string(pid) + "/task", ec);
        for (; !ec && tasks != std::filesystem::directory_iterator(); tasks.increment(ec)) {
            std::ifstream children(tasks->path() / "children");
            pid_t child = 0;
            while (children >> child) pending.push_back(child);
        }
    }
    return sample;
}

/// Whether `pid`, a child of this process, has exited; it is left unreaped.
bool has_exited(pid_t pid) {
    siginfo_t info {};
    if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return true;
    }
    return info.si_pid == pid;
}

/// Remove a tree even when the program stripped permissions from its own files.
std::error_code force_remove(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    if (!ec) return ec;

    std::error_code walk_ec;
    ::chmod(root.c_str(), 0700);
    for (auto it = std::filesystem::recursive_directory_iterator(
             root, std::filesystem::directory_options::skip_permission_denied, walk_ec);
         !walk_ec && it != std::filesystem::recursive_directory_iterator(); it.increment(walk_ec)) {
        if (it->is_directory(walk_ec)) ::chmod(it->path().c_str(), 0700);
    }
    ec.clear();
    std::filesystem::remove_all(root, ec);
    return ec;
}

std::atomic<uint64_t> g_sandbox_counter{0};

}  // anonymous namespace

// ─────────────────────────────────────────────
// Free functions
// ─────────────────────────────────────────────

std::string sandbox_workdir(std::string_view rootfs) {
    return rootfs.empty() ? std::string{"."} : std::string{kRootfsWorkdir};
}

bool probe_isolation() {
    std::string uid_map = "0 " + std::to_string(::geteuid()) + " 1";
    std::string gid_map = "0 " + std::to_string(::getegid()) + " 1";
    ChildContext ctx;
    ctx.map_user = ::geteuid() != 0;
    ctx.uid_map = uid_map.c_str();
    ctx.gid_map = gid_map.c_str();

    pid_t pid = ::fork();
    if (pid < 0) return false;
    if (pid == 0) {
        if (enter_namespaces(ctx) != 0) ::_exit(1);
        pid_t init = ::fork();
        if (init < 0) ::_exit(1);
        if (init == 0) {
            bool isolated = ::getpid() == 1 && mount_tmpfs("/tmp")
                            && set_mount_readonly("/", true, AT_RECURSIVE);
            ::_exit(isolated ? 0 : 1);
        }
        int status = 0;
        while (::waitpid(init, &status, 0) < 0 && errno == EINTR) {}
        ::_exit(WIFEXITED(status) && WEXITSTATUS(status) == 0 ? 0 : 1);
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

// ─────────────────────────────────────────────
// Sandbox
// ─────────────────────────────────────────────

Result<std::unique_ptr<Sandbox>> Sandbox::create(const SandboxOptions& options, SandboxSpec spec) {
    if (spec.argv.empty()) {
        return Error{"sandbox '" + spec.label + "' has an empty command"};
    }

    std::error_code ec;
    std::filesystem::create_directories(options.root_dir, ec);
    if (ec) {
        return Error{"cannot create sandbox root " + options.root_dir.string() + ": " + ec.message()};
    }

    auto base = sanitize_label(spec.label) + "-" + std::to_string(::getpid()) + "-";
    std::filesystem::path workspace;
    for (;;) {
        workspace = options.root_dir / (base + std::to_string(g_sandbox_counter.fetch_add(1)));
        if (::mkdir(workspace.c_str(), 0700) == 0) break;
        if (errno != EEXIST) {
            return Error{"mkdir " + workspace.string() + ": " + std::strerror(errno)};
        }
    }

    std::unique_ptr<Sandbox> sandbox(new Sandbox(options, std::move(spec), workspace));

    for (const auto& file : sandbox->spec_.files) {
        if (file.name.empty() || file.name.find('/') != std::string::npos) {
            return Error{"invalid sandbox file name '" + file.name + "'"};
        }
        auto path = workspace / file.name;
        {
            std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
            ofs.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));
            if (!ofs) return Error{"cannot write " + path.string()};
        }
        ::chmod(path.c_str(), file.executable ? 0755 : 0644);
    }
    // The program runs as the same host uid; 0755 lets a chrooted loader traverse it.
    ::chmod(workspace.c_str(), 0755);

    if (!options.cgroup_root.empty()) {
        if (CgroupLeaf::available(options.cgroup_root)) {
            auto cgroup_limits = sandbox->spec_.limits;
            cgroup_limits.max_processes += kHelperProcesses;
            auto leaf = CgroupLeaf::create(options.cgroup_root, workspace.filename().string(),
                                           cgroup_limits);
            if (!leaf) return leaf.error();
            sandbox->cgroup_ = std::move(*leaf);
        } else if (options.require_isolation) {
            return Error{"cgroup root " + options.cgroup_root.string() + " is not usable"};
        }
    }

    return sandbox;
}

Sandbox::Sandbox(SandboxOptions options, SandboxSpec spec, std::filesystem::path workspace)
    : options_(std::move(options)), spec_(std::move(spec)), workspace_(std::move(workspace)) {}

Sandbox::~Sandbox() {
    if (state_ != SandboxState::Destroyed) {
        auto r = destroy();
        (void)r;  // destructor path; owners call destroy() to see errors
    }
}

void Sandbox::kill_tree() noexcept {
    if (cgroup_) cgroup_->kill_all();
    if (child_pid_ <= 0) return;
    if (init_pid_ > 0) {
        // The init's pid is only ours to signal while the child has not reaped it.
        // The child then exits by itself once the namespace is empty.
        if (!reaped_ && !has_exited(child_pid_)) ::kill(init_pid_, SIGKILL);
        return;
    }
    ::kill(-child_pid_, SIGKILL);
    if (!reaped_) ::kill(child_pid_, SIGKILL);
}

Result<SandboxReport> Sandbox::run(std::stop_token stop) {
    if (state_ != SandboxState::Created) {
        return Error{"sandbox '" + spec_.label + "' is " + std::string{to_string(state_)}
                     + ", not created"};
    }

    // ── Everything the child touches is built here ──
    std::string search_path = find_env(spec_.env, "PATH");
    if (search_path.empty()) search_path = options_.search_path;
    auto program = resolve_program(spec_.argv.front(), search_path, spec_.rootfs);
    if (!program) return program.error();

    std::vector<std::string> argv_strings = spec_.argv;
    std::vector<std::string> env_strings = spec_.env;
    auto argv = to_c_array(argv_strings);
    auto envp = to_c_array(env_strings);

    std::string workspace = workspace_.string();
    std::string rootfs = spec_.rootfs;
    std::string bind_target = rootfs + kRootfsWorkdir;
    std::string uid_map = "0 " + std::to_string(::geteuid()) + " 1";
    std::string gid_map = "0 " + std::to_string(::getegid()) + " 1";

    const auto& limits = spec_.limits;
    std::vector<LimitSetting> rlimits;
    rlim_t cpu_seconds = static_cast<rlim_t>((limits.cpu_time_ms + 999) / 1000);
    rlimits.push_back({RLIMIT_CPU, cpu_seconds, cpu_seconds + 1});
    rlimits.push_back({RLIMIT_FSIZE, limits.max_file_size_bytes, limits.max_file_size_bytes});
    rlimits.push_back({RLIMIT_NOFILE, limits.max_open_files, limits.max_open_files});
    rlimits.push_back({RLIMIT_CORE, 0, 0});
    // Root shares RLIMIT_NPROC with every other root process; it relies on pids.max.
    rlim_t tasks = static_cast<rlim_t>(limits.max_processes + kHelperProcesses);
    rlimits.push_back({RLIMIT_NPROC, tasks, tasks, true});
    if (!cgroup_ && options_.address_space_multiplier > 0) {
        rlim_t as = limits.memory_bytes * options_.address_space_multiplier;
        rlimits.push_back({RLIMIT_AS, as, as});
    }

    auto in_pipe = make_pipe();
    auto out_pipe = make_pipe();
    auto err_pipe = make_pipe();
    auto fail_pipe = make_pipe();
    auto sync_pipe = make_pipe();
    auto init_pipe = make_pipe();
    auto status_pipe = make_pipe();
    for (auto* p : {&in_pipe, &out_pipe, &err_pipe, &fail_pipe, &sync_pipe, &init_pipe,
                    &status_pipe}) {
        if (!*p) return p->error();
    }

    ChildContext ctx;
    ctx.parent_pid = ::getpid();
    ctx.program = program->c_str();
    ctx.argv = argv.data();
    ctx.envp = envp.data();
    ctx.workspace = workspace.c_str();
    ctx.rootfs = rootfs.empty() ? nullptr : rootfs.c_str();
    ctx.bind_target = bind_target.c_str();
    ctx.use_namespaces = options_.use_namespaces;
    ctx.require_isolation = options_.require_isolation;
    ctx.map_user = ::geteuid() != 0;
    ctx.uid_map = uid_map.c_str();
    ctx.gid_map = gid_map.c_str();
    ctx.limits = rlimits.data();
    ctx.limit_count = rlimits.size();
    ctx.stdin_fd = in_pipe->read.get();
    ctx.stdout_fd = out_pipe->write.get();
    ctx.stderr_fd = err_pipe->write.get();
    ctx.failure_fd = fail_pipe->write.get();
    ctx.sync_fd = sync_pipe->read.get();
    ctx.init_fd = init_pipe->write.get();
    ctx.status_fd = status_pipe->write.get();

    // The deadline is armed before the process exists.
    const auto started = Clock::now();
    const auto deadline = started + std::chrono::milliseconds{limits.wall_time_ms};

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{std::string{"fork: "} + std::strerror(errno)};
    }
    if (pid == 0) {
        child_main(ctx);
    }

    child_pid_ = pid;
    init_pid_ = -1;
    reaped_ = false;
    state_ = SandboxState::Running;

    in_pipe->read.reset();
    out_pipe->write.reset();
    err_pipe->write.reset();
    fail_pipe->write.reset();
    sync_pipe->read.reset();
    init_pipe->write.reset();
    status_pipe->write.reset();
    set_nonblocking(init_pipe->read.get());
    set_nonblocking(status_pipe->read.get());

    if (cgroup_) {
        if (auto joined = cgroup_->add_process(pid); !joined) {
            kill_tree();
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            reaped_ = true;
            state_ = SandboxState::CrashFailed;
            return joined.error();
        }
    }

    char go = 1;
    if (::write(sync_pipe->write.get(), &go, 1) != 1) {
        kill_tree();
    }
    sync_pipe->write.reset();

    // ── Supervise ──
    UniqueFd stdin_w = std::move(in_pipe->write);
    UniqueFd stdout_r = std::move(out_pipe->read);
    UniqueFd stderr_r = std::move(err_pipe->read);
    set_nonblocking(stdin_w.get());
    set_nonblocking(stdout_r.get());
    set_nonblocking(stderr_r.get());

    CappedBuffer out_buf(options_.output_limit_bytes);
    CappedBuffer err_buf(options_.output_limit_bytes);
    size_t stdin_offset = 0;
    if (spec_.stdin_data.empty()) stdin_w.reset();

    SandboxReport report;
    int wait_status = 0;
    struct rusage usage {};
    uint64_t sampled_rss = 0;
    auto drain_deadline = Clock::time_point::max();
    const auto grace = std::chrono::milliseconds{options_.teardown_grace_ms};
    const int interval = static_cast<int>(std::max<uint32_t>(options_.watchdog_interval_ms, 1));

    auto drain = [](UniqueFd& fd, CappedBuffer& buf) {
        char chunk[8192];
        for (;;) {
            ssize_t n = ::read(fd.get(), chunk, sizeof(chunk));
            if (n > 0) {
                buf.append(chunk, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) fd.reset();
            else if (errno != EAGAIN && errno != EINTR) fd.reset();
            return;
        }
    };

    auto reap = [&](int options) {
        pid_t r;
        do {
            r = ::wait4(pid, &wait_status, options, &usage);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            reaped_ = true;
            report.wall_time_us = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - started)
                    .count());
        }
    };

    auto read_init_pid = [&] {
        if (init_pid_ > 0 || !init_pipe->read.valid()) return;
        pid_t init = -1;
        ssize_t n = ::read(init_pipe->read.get(), &init, sizeof(init));
        if (n == static_cast<ssize_t>(sizeof(init))) {
            init_pid_ = init;
        } else if (n == 0 || (n < 0 && errno != EAGAIN && errno != EINTR)) {
            init_pipe->read.reset();
        }
    };

    auto kill_for = [&](KillCause cause) {
        report.kill_cause = cause;
        read_init_pid();
        kill_tree();
        reap(0);
    };

    while (stdout_r.valid() || stderr_r.valid() || !reaped_) {
        std::vector<pollfd> fds;
        if (stdout_r.valid()) fds.push_back({stdout_r.get(), POLLIN, 0});
        if (stderr_r.valid()) fds.push_back({stderr_r.get(), POLLIN, 0});
        if (stdin_w.valid() && !reaped_) fds.push_back({stdin_w.get(), POLLOUT, 0});

        if (!fds.empty()) {
            ::poll(fds.data(), fds.size(), interval);
        } else {
            ::usleep(static_cast<useconds_t>(interval) * 1000);
        }

        if (stdout_r.valid()) drain(stdout_r, out_buf);
        if (stderr_r.valid()) drain(stderr_r, err_buf);

        if (stdin_w.valid()) {
            const auto& data = spec_.stdin_data;
            ssize_t n = ::write(stdin_w.get(), data.data() + stdin_offset,
                                data.size() - stdin_offset);
            if (n > 0) stdin_offset += static_cast<size_t>(n);
            bool blocked = n < 0 && (errno == EAGAIN || errno == EINTR);
            if (stdin_offset >= data.size() || (n < 0 && !blocked)) stdin_w.reset();
        }

        read_init_pid();
        if (!reaped_) reap(WNOHANG);

        if (reaped_) {
            // Orphans may still hold the pipes open; they do not outlive the program.
            if (drain_deadline == Clock::time_point::max()) {
                kill_tree();
                drain_deadline = Clock::now() + grace;
            } else if (Clock::now() >= drain_deadline) {
                break;
            }
            continue;
        }

        // ── Watchdog ──
        if (stop.stop_requested()) {
            kill_for(KillCause::Cancelled);
            continue;
        }
        if (Clock::now() >= deadline) {
            kill_for(KillCause::Deadline);
            continue;
        }
        if (cgroup_) {
            auto stats = cgroup_->stats();
            if (stats.oom_kills > 0) {
                kill_for(KillCause::MemoryCap);
            } else if (stats.cpu_usage_us > limits.cpu_time_ms * 1000) {
                kill_for(KillCause::CpuCap);
            }
        } else if (init_pid_ > 0 || !init_pipe->read.valid()) {
            // Until the init reports in, the child is still a copy of the engine.
            auto sample = init_pid_ > 0 ? sample_tree(init_pid_, false) : sample_tree(pid, true);
            sampled_rss = std::max(sampled_rss, sample.rss_bytes);
            if (sample.rss_bytes > limits.memory_bytes) {
                kill_for(KillCause::MemoryCap);
            } else if (sample.cpu_us > limits.cpu_time_ms * 1000) {
                kill_for(KillCause::CpuCap);
            }
        }
    }
    stdin_w.reset();

    // ── Setup failures reported by the child ──
    ChildFailure failure{};
    set_nonblocking(fail_pipe->read.get());
    ssize_t got = ::read(fail_pipe->read.get(), &failure, sizeof(failure));
    if (got == static_cast<ssize_t>(sizeof(failure))) {
        state_ = SandboxState::CrashFailed;
        return Error{std::string{"sandbox setup failed at "}
                     + describe_stage(static_cast<ChildStage>(failure.stage)) + ": "
                     + std::strerror(failure.error)};
    }

    // ── Report ──
    // The init relays the program's own status; the child's stands in when it died first.
    // The child's ru_maxrss is the engine's own footprint once an init was in between.
    ProgramExit relayed{};
    bool have_relay = ::read(status_pipe->read.get(), &relayed, sizeof(relayed))
                      == static_cast<ssize_t>(sizeof(relayed));
    if (have_relay) wait_status = relayed.status;
    uint64_t max_rss_kb = static_cast<uint64_t>(usage.ru_maxrss);
    if (init_pid_ > 0) max_rss_kb = have_relay ? static_cast<uint64_t>(relayed.max_rss_kb) : 0;
    report.exited = WIFEXITED(wait_status);
    report.exit_code = report.exited ? WEXITSTATUS(wait_status) : 0;
    report.signaled = WIFSIGNALED(wait_status);
    report.term_signal = report.signaled ? WTERMSIG(wait_status) : 0;

    report.cpu_time_us = to_us(usage.ru_utime) + to_us(usage.ru_stime);
    report.peak_memory_bytes =
        std::max<uint64_t>(max_rss_kb * 1024, sampled_rss);
    if (cgroup_) {
        auto stats = cgroup_->stats();
        report.cpu_time_us = std::max(report.cpu_time_us, stats.cpu_usage_us);
        if (stats.memory_peak > 0) report.peak_memory_bytes = stats.memory_peak;
        report.oom_killed = stats.oom_kills > 0;
        report.cgroup_accounting = true;
    }

    report.stdout_truncated = out_buf.truncated();
    report.stderr_truncated = err_buf.truncated();
    report.stdout_data = out_buf.take();
    report.stderr_data = err_buf.take();

    auto verdict = classify(report, limits);
    report.state = verdict.state;
    state_ = verdict.state;

    if (state_ == SandboxState::Completed && report.exit_code == 0 && !spec_.collect_file.empty()) {
        auto path = workspace_ / spec_.collect_file;
        std::ifstream ifs(path, std::ios::binary);
        if (ifs) {
            std::ostringstream content;
            content << ifs.rdbuf();
            report.collected_file = content.str();
        }
    }

    return report;
}

Result<void> Sandbox::destroy() {
    if (state_ == SandboxState::Destroyed) return {};

    std::string problems;
    if (!reaped_ && child_pid_ > 0) {
        kill_tree();
        int status = 0;
        while (::waitpid(child_pid_, &status, 0) < 0 && errno == EINTR) {}
        reaped_ = true;
    }

    if (cgroup_) {
        auto removed = cgroup_->destroy(std::chrono::milliseconds{options_.teardown_grace_ms});
        if (!removed) problems += removed.error().message;
        cgroup_.reset();
    }

    if (auto ec = force_remove(workspace_); ec) {
        if (!problems.empty()) problems += "; ";
        problems += "remove " + workspace_.string() + ": " + ec.message();
    }

    state_ = SandboxState::Destroyed;
    if (!problems.empty()) return Error{problems};
    return {};
}

}  // namespace exec_engine
