/**
 * @file test_sandbox_linux.cpp
 * @brief Integration tests running real /bin/sh programs in Linux sandboxes.
 * @author Dimitris Kafetzis
 */

#include "collector/result_collector.hpp"
#include "sandbox/launcher.hpp"
#include "sandbox/sandbox.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

using namespace exec_engine;

namespace {

/// Whether any live process has exactly this argv.
bool process_running(const std::vector<std::string>& argv) {
    std::string wanted;
    for (const auto& arg : argv) {
        wanted += arg;
        wanted.push_back('\0');
    }
    std::error_code ec;
    std::filesystem::directory_iterator proc("/proc", ec);
    for (; !ec && proc != std::filesystem::directory_iterator(); proc.increment(ec)) {
        std::ifstream ifs(proc->path() / "cmdline", std::ios::binary);
        std::string cmdline((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
        if (cmdline == wanted) return true;
    }
    return false;
}

bool have_program(const char* name) {
    for (const char* dir : {"/usr/local/bin/", "/usr/bin/", "/bin/"}) {
        if (::access((std::string{dir} + name).c_str(), X_OK) == 0) return true;
    }
    return false;
}

}  // namespace

class LinuxSandboxTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;
    Logger logger_{std::make_unique<NullSink>()};
    MetricsCollector metrics_{std::make_unique<NullSink>()};
    SandboxOptions options_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path()
                    / ("ee_sandbox_" + std::to_string(::getpid()));
        std::filesystem::create_directories(temp_dir_);
        options_.root_dir = temp_dir_;
        options_.output_limit_bytes = 64 * 1024;
        // Outcome tests also run on hosts without namespaces; isolation tests skip there.
        options_.require_isolation = false;
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    /// A spec that runs `script` with /bin/sh from the workspace.
    static SandboxSpec shell(const std::string& script, ResourceLimits limits = small_limits()) {
        SandboxSpec spec;
        spec.label = "it";
        spec.argv = {"/bin/sh", "main.sh"};
        spec.env = {"PATH=/usr/local/bin:/usr/bin:/bin", "HOME=/tmp"};
        spec.files = {SandboxFile{"main.sh", script, false}};
        spec.limits = limits;
        return spec;
    }

    static ResourceLimits small_limits() {
        return ResourceLimits{.wall_time_ms = 5'000, .cpu_time_ms = 5'000,
                              .memory_bytes = 64ULL * 1024 * 1024};
    }

    ExecutionResult run(const SandboxSpec& spec, std::stop_token stop = {}) {
        LinuxSandboxLauncher launcher(options_, logger_, metrics_);
        auto report = launcher.launch(spec, stop);
        EXPECT_TRUE(report.has_value()) << (report ? "" : report.error().message);
        if (!report) return ResultCollector::system_error(report.error().message);
        return ResultCollector::collect(*report, spec.limits);
    }

    bool workspaces_removed() const {
        return std::filesystem::is_empty(temp_dir_);
    }
};

// ═══════════════════════════════════════════════
// Program outcomes
// ═══════════════════════════════════════════════

TEST_F(LinuxSandboxTest, HelloWorld) {
    auto result = run(shell("echo hello\n"));
    EXPECT_EQ(result.state, RunState::Completed);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "hello\n");
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(LinuxSandboxTest, ExitCodeAndStderr) {
    auto result = run(shell("echo oops >&2\nexit 3\n"));
    EXPECT_EQ(result.state, RunState::Completed);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stderr_data, "oops\n");
}

TEST_F(LinuxSandboxTest, StdinIsDelivered) {
    auto spec = shell("cat\n");
    spec.stdin_data = "line 1\nline 2\n";
    auto result = run(spec);
    EXPECT_EQ(result.stdout_data, "line 1\nline 2\n");
}

TEST_F(LinuxSandboxTest, InfiniteLoopTimesOut) {
    auto limits = small_limits();
    limits.wall_time_ms = 300;
    auto start = std::chrono::steady_clock::now();
    auto result = run(shell("while :; do :; done\n", limits));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.state, RunState::TimedOut);
    EXPECT_EQ(result.failure_kind, FailureKind::Timeout);
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(LinuxSandboxTest, SleepingChildIsKilledWithParent) {
    auto limits = small_limits();
    limits.wall_time_ms = 300;
    auto start = std::chrono::steady_clock::now();
    auto result = run(shell("sleep 30 &\nsleep 30\n", limits));
    EXPECT_EQ(result.state, RunState::TimedOut);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST_F(LinuxSandboxTest, SelfSegfaultIsCrash) {
    auto result = run(shell("kill -SEGV $$\n"));
    EXPECT_EQ(result.state, RunState::CrashFailed);
    EXPECT_EQ(result.failure_kind, FailureKind::Crash);
    EXPECT_EQ(result.failure_detail, "terminated by segmentation fault");
}

TEST_F(LinuxSandboxTest, MemoryHogIsStopped) {
    auto limits = small_limits();
    limits.memory_bytes = 32ULL * 1024 * 1024;
    limits.wall_time_ms = 20'000;
    limits.cpu_time_ms = 20'000;

    auto result = run(shell("x=$(head -c 400000000 /dev/zero | tr '\\000' a)\necho survived\n",
                            limits));
    EXPECT_EQ(result.state, RunState::ResourceExceeded);
    EXPECT_EQ(result.failure_kind, FailureKind::MemoryLimit);
    EXPECT_NE(result.stdout_data, "survived\n");
}

TEST_F(LinuxSandboxTest, RefusedAllocationIsMemoryLimit) {
    if (!have_program("python3")) GTEST_SKIP() << "python3 not installed";

    auto spec = shell("");
    spec.argv = {"python3", "main.py"};
    spec.files = {SandboxFile{"main.py", "x = bytearray(1024 * 1024 * 1024)\nprint('survived')\n",
                              false}};
    spec.limits.memory_bytes = 64ULL * 1024 * 1024;
    spec.limits.wall_time_ms = 20'000;
    spec.limits.cpu_time_ms = 20'000;

    auto result = run(spec);
    EXPECT_EQ(result.state, RunState::ResourceExceeded);
    EXPECT_EQ(result.failure_kind, FailureKind::MemoryLimit);
    EXPECT_NE(result.stdout_data, "survived\n");
}

TEST_F(LinuxSandboxTest, OutputIsCapped) {
    options_.output_limit_bytes = 1024;
    auto result = run(shell("head -c 100000 /dev/zero | tr '\\000' x\n"));
    EXPECT_EQ(result.state, RunState::Completed);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_LT(result.stdout_data.size(), 2048u);
}

TEST_F(LinuxSandboxTest, StopRequestCancels) {
    std::stop_source stop;
    std::jthread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop.request_stop();
    });
    auto result = run(shell("sleep 30\n"), stop.get_token());
    EXPECT_EQ(result.state, RunState::Cancelled);
    EXPECT_EQ(result.failure_kind, FailureKind::Cancelled);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(LinuxSandboxTest, CollectsArtifactAfterCleanExit) {
    auto spec = shell("printf artifact > out.bin\n");
    spec.collect_file = "out.bin";

    LinuxSandboxLauncher launcher(options_, logger_, metrics_);
    auto report = launcher.launch(spec, {});
    ASSERT_TRUE(report.has_value()) << report.error().message;
    ASSERT_TRUE(report->collected_file.has_value());
    EXPECT_EQ(*report->collected_file, "artifact");
}

TEST_F(LinuxSandboxTest, MissingProgramIsMachineryError) {
    SandboxSpec spec = shell("");
    spec.argv = {"definitely-not-a-real-program"};

    LinuxSandboxLauncher launcher(options_, logger_, metrics_);
    auto report = launcher.launch(spec, {});
    EXPECT_FALSE(report.has_value());
    EXPECT_TRUE(workspaces_removed());
}

// ═══════════════════════════════════════════════
// Isolation
// ═══════════════════════════════════════════════

TEST_F(LinuxSandboxTest, EnvironmentIsScrubbed) {
    ::setenv("EE_HOST_SECRET", "leaked", 1);
    auto spec = shell("echo \"${EE_HOST_SECRET:-unset} $HOME\"\n");
    auto result = run(spec);
    ::unsetenv("EE_HOST_SECRET");
    EXPECT_EQ(result.stdout_data, "unset /tmp\n");
}

TEST_F(LinuxSandboxTest, HostTmpIsHidden) {
    if (!probe_isolation()) GTEST_SKIP() << "namespaces unavailable on this host";

    auto sentinel = std::filesystem::path("/tmp") / ("ee_sentinel_" + std::to_string(::getpid()));
    { std::ofstream(sentinel) << "host"; }

    auto result = run(shell("test -e " + sentinel.string() + " && echo visible || echo hidden\n"));
    std::filesystem::remove(sentinel);
    EXPECT_EQ(result.stdout_data, "hidden\n");
}

TEST_F(LinuxSandboxTest, OnlyLoopbackNetwork) {
    if (!probe_isolation()) GTEST_SKIP() << "namespaces unavailable on this host";

    auto result = run(shell("grep -c : /proc/net/dev\n"));
    EXPECT_EQ(result.stdout_data, "1\n");
}

TEST_F(LinuxSandboxTest, OwnHostname) {
    if (!probe_isolation()) GTEST_SKIP() << "namespaces unavailable on this host";

    auto result = run(shell("cat /proc/sys/kernel/hostname\n"));
    EXPECT_EQ(result.stdout_data, "sandbox\n");
}

TEST_F(LinuxSandboxTest, SandboxesDoNotShareFiles) {
    auto first = run(shell("echo secret > left.txt\n"));
    ASSERT_EQ(first.state, RunState::Completed);

    auto second = run(shell("test -e left.txt && echo found || echo clean\n"));
    EXPECT_EQ(second.stdout_data, "clean\n");
}

TEST_F(LinuxSandboxTest, CannotSignalHostProcess) {
    if (!probe_isolation()) GTEST_SKIP() << "namespaces unavailable on this host";

    pid_t host = ::fork();
    ASSERT_GE(host, 0);
    if (host == 0) {
        ::execlp("sleep", "sleep", "30", static_cast<char*>(nullptr));
        ::_exit(127);
    }

    auto result = run(shell("kill -9 " + std::to_string(host)
                            + " 2>/dev/null && echo killed || echo denied\n"));
    bool alive = ::waitpid(host, nullptr, WNOHANG) == 0;
    ::kill(host, SIGKILL);
    ::waitpid(host, nullptr, 0);

    EXPECT_EQ(result.stdout_data, "denied\n");
    EXPECT_TRUE(alive);
}

TEST_F(LinuxSandboxTest, ProgramRunsAsNamespaceChild) {
    if (!probe_isolation()) GTEST_SKIP() << "namespaces unavailable on this host";

    auto result = run(shell("echo $$\n"));
    EXPECT_EQ(result.stdout_data, "2\n");
}

TEST_F(LinuxSandboxTest, HostFilesystemIsReadOnly) {
    if (!probe_isolation()) GTEST_SKIP() << "namespaces unavailable on this host";

    auto target = std::filesystem::current_path() / ("ee_readonly_" + std::to_string(::getpid()));
    std::filesystem::create_directories(target);
    auto written = target / "planted";

    auto result = run(shell("echo x > " + written.string()
                            + " 2>/dev/null && echo wrote || echo refused\necho ok > mine.txt "
                              "&& cat mine.txt\n"));
    bool planted = std::filesystem::exists(written);
    std::filesystem::remove_all(target);

    EXPECT_EQ(result.stdout_data, "refused\nok\n");
    EXPECT_FALSE(planted);
}

TEST_F(LinuxSandboxTest, SetsidDescendantDoesNotOutliveSandbox) {
    if (!probe_isolation()) GTEST_SKIP() << "namespaces unavailable on this host";
    if (!have_program("setsid")) GTEST_SKIP() << "setsid not installed";

    // An argument no other process on the host carries.
    std::string seconds = std::to_string(100'000 + ::getpid());
    auto limits = small_limits();
    limits.wall_time_ms = 500;

    auto result = run(shell("setsid sleep " + seconds + " &\nsleep 60\n", limits));
    EXPECT_EQ(result.state, RunState::TimedOut);
    EXPECT_FALSE(process_running({"sleep", seconds}));
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(LinuxSandboxTest, ProcessLimitIsEnforced) {
    if (!probe_isolation()) GTEST_SKIP() << "namespaces unavailable on this host";
    if (::geteuid() == 0 && options_.cgroup_root.empty()) {
        GTEST_SKIP() << "root without a cgroup has no per-sandbox task limit";
    }

    auto limits = small_limits();
    limits.max_processes = 4;
    limits.wall_time_ms = 3'000;

    auto result = run(shell("for i in 1 2 3 4 5 6 7 8; do sleep 2 & done\nwait\n", limits));
    EXPECT_FALSE(result.stderr_data.empty());
    EXPECT_TRUE(workspaces_removed());
}
