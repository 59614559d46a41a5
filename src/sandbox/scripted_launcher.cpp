/**
 * @file scripted_launcher.cpp
 * @brief ScriptedLauncher implementation: canned sandbox reports for testing.
 * @author Dimitris Kafetzis
 */

#include "collector/result_collector.hpp"
#include "sandbox/launcher.hpp"

#include <csignal>
#include <thread>

namespace exec_engine {

ScriptedLauncher::ScriptedLauncher(const SandboxOptions& /*options*/, Logger& /*logger*/,
                                   MetricsCollector& /*metrics*/) {
    // Default: every program prints nothing and exits 0.
    script_ = [](const SandboxSpec&, std::stop_token) -> Result<SandboxReport> {
        return exited(0);
    };
}

Result<SandboxReport> ScriptedLauncher::launch(const SandboxSpec& spec, std::stop_token stop) {
    Script script;
    {
        std::lock_guard lock(mutex_);
        launched_.push_back(spec);
        script = script_;
    }

    size_t live = live_.fetch_add(1) + 1;
    size_t peak = peak_.load();
    while (live > peak && !peak_.compare_exchange_weak(peak, live)) {}

    auto report = script(spec, stop);
    live_.fetch_sub(1);

    if (report) {
        report->state = classify(*report, spec.limits).state;
    }
    return report;
}

void ScriptedLauncher::set_script(Script script) {
    std::lock_guard lock(mutex_);
    script_ = std::move(script);
}

std::vector<SandboxSpec> ScriptedLauncher::launched() const {
    std::lock_guard lock(mutex_);
    return launched_;
}

size_t ScriptedLauncher::launch_count() const {
    std::lock_guard lock(mutex_);
    return launched_.size();
}

SandboxReport ScriptedLauncher::exited(int code, std::string out, std::string err) {
    SandboxReport report;
    report.exited = true;
    report.exit_code = code;
    report.stdout_data = std::move(out);
    report.stderr_data = std::move(err);
    report.cpu_time_us = 2'000;
    report.wall_time_us = 5'000;
    report.peak_memory_bytes = 4ULL * 1024 * 1024;
    return report;
}

SandboxReport ScriptedLauncher::signaled(int signal_number) {
    SandboxReport report;
    report.signaled = true;
    report.term_signal = signal_number;
    report.cpu_time_us = 1'000;
    report.wall_time_us = 2'000;
    report.peak_memory_bytes = 4ULL * 1024 * 1024;
    return report;
}

SandboxReport ScriptedLauncher::killed(KillCause cause) {
    SandboxReport report = signaled(SIGKILL);
    report.kill_cause = cause;
    return report;
}

SandboxReport ScriptedLauncher::hold_until_stopped(std::stop_token stop,
                                                   std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    return killed(stop.stop_requested() ? KillCause::Cancelled : KillCause::Deadline);
}

}  // namespace exec_engine
