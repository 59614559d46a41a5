/**
 * @file launcher.hpp
 * @brief Sandbox launchers: the Linux one and a scripted one for tests.
 * @author Dimitris Kafetzis
 *
 * Both satisfy SandboxLauncherLike:
 *   LinuxSandboxLauncher: real processes in real sandboxes
 *   ScriptedLauncher    : canned reports, no processes (unit tests)
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "sandbox/sandbox_types.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace exec_engine {

// ─────────────────────────────────────────────
// LinuxSandboxLauncher
// ─────────────────────────────────────────────

/**
 * @brief Creates, runs and destroys one Sandbox per launch.
 *
 * Teardown always happens before launch() returns, whatever the outcome.
 * The constructor ignores SIGPIPE process-wide so a program that closes
 * stdin early cannot take the engine down with it.
 */
class LinuxSandboxLauncher {
public:
    LinuxSandboxLauncher(const SandboxOptions& options, Logger& logger, MetricsCollector& metrics);

    Result<SandboxReport> launch(const SandboxSpec& spec, std::stop_token stop);

    [[nodiscard]] static constexpr std::string_view name() { return "linux"; }

    /// Whether the namespace check at construction succeeded.
    [[nodiscard]] bool isolation_available() const noexcept { return isolation_available_; }

private:
    SandboxOptions options_;
    Logger& logger_;
    MetricsCollector& metrics_;
    bool isolation_available_{false};
};

// ─────────────────────────────────────────────
// ScriptedLauncher
// ─────────────────────────────────────────────

/**
 * @brief In-process launcher returning scripted reports.
 *
 * The script sees every spec and the run's stop token. The returned report
 * gets its state assigned by the same classification the real sandbox uses.
 */
class ScriptedLauncher {
public:
    using Script = std::function<Result<SandboxReport>(const SandboxSpec&, std::stop_token)>;

    ScriptedLauncher(const SandboxOptions& options, Logger& logger, MetricsCollector& metrics);

    Result<SandboxReport> launch(const SandboxSpec& spec, std::stop_token stop);

    [[nodiscard]] static constexpr std::string_view name() { return "scripted"; }

    // ── Test controls ────────────────────────
    void set_script(Script script);

    [[nodiscard]] std::vector<SandboxSpec> launched() const;
    [[nodiscard]] size_t launch_count() const;
    [[nodiscard]] size_t peak_concurrency() const noexcept { return peak_.load(); }

    // ── Report builders ──────────────────────
    static SandboxReport exited(int code, std::string out = {}, std::string err = {});
    static SandboxReport signaled(int signal_number);
    static SandboxReport killed(KillCause cause);

    /// Block until `stop` is requested (or `limit` passes), then report the kill.
    static SandboxReport hold_until_stopped(std::stop_token stop,
                                            std::chrono::milliseconds limit
                                                = std::chrono::seconds{10});

private:
    mutable std::mutex mutex_;
    Script script_;
    std::vector<SandboxSpec> launched_;
    std::atomic<size_t> live_{0};
    std::atomic<size_t> peak_{0};
};

static_assert(SandboxLauncherLike<LinuxSandboxLauncher>);
static_assert(SandboxLauncherLike<ScriptedLauncher>);

}  // namespace exec_engine
