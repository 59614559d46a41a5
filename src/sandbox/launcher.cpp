/**
 * @file launcher.cpp
 * @brief LinuxSandboxLauncher implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/launcher.hpp"

#include "sandbox/sandbox.hpp"

#include <chrono>
#include <csignal>

namespace exec_engine {

LinuxSandboxLauncher::LinuxSandboxLauncher(const SandboxOptions& options, Logger& logger,
                                           MetricsCollector& metrics)
    : options_(options), logger_(logger), metrics_(metrics) {
    std::signal(SIGPIPE, SIG_IGN);

    if (options_.use_namespaces) {
        isolation_available_ = probe_isolation();
        if (!isolation_available_) {
            if (options_.require_isolation) {
                logger_.error("sandbox namespaces unavailable; every run will fail",
                              {{"require_isolation", "true"}});
            } else {
                logger_.warn("sandbox namespaces unavailable; running with rlimits only");
                options_.use_namespaces = false;
            }
        }
    }
}

Result<SandboxReport> LinuxSandboxLauncher::launch(const SandboxSpec& spec, std::stop_token stop) {
    auto created = Sandbox::create(options_, spec);
    if (!created) {
        logger_.error("sandbox creation failed",
                      {{"sandbox", spec.label}, {"error", created.error().message}});
        return created.error();
    }
    auto& sandbox = *created;
    logger_.debug("sandbox created",
                  {{"sandbox", spec.label},
                   {"workspace", sandbox->workspace().string()},
                   {"cgroup", sandbox->cgroup_enabled() ? "true" : "false"}});

    auto report = sandbox->run(stop);

    auto teardown_start = std::chrono::steady_clock::now();
    auto destroyed = sandbox->destroy();
    auto teardown = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - teardown_start);
    metrics_.record_sandbox_teardown(spec.label, teardown, destroyed.has_value());
    if (!destroyed) {
        logger_.error("sandbox teardown incomplete",
                      {{"sandbox", spec.label}, {"error", destroyed.error().message}});
    }

    if (!report) {
        logger_.error("sandbox run failed",
                      {{"sandbox", spec.label}, {"error", report.error().message}});
        return report;
    }
    logger_.debug("sandbox finished",
                  {{"sandbox", spec.label},
                   {"state", std::string{to_string(report->state)}},
                   {"wall_us", std::to_string(report->wall_time_us)}});
    return report;
}

}  // namespace exec_engine
