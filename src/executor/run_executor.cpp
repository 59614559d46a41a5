/**
 * @file run_executor.cpp
 * @brief RunExecutor implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/run_executor.hpp"

#include "collector/result_collector.hpp"
#include "harness/test_harness.hpp"
#include "sandbox/sandbox.hpp"

#include <algorithm>

namespace exec_engine {

namespace {

std::string_view env_key(std::string_view entry) {
    return entry.substr(0, entry.find('='));
}

}  // anonymous namespace

std::vector<std::string> sandbox_environment(const ExecutionEnvironment& env) {
    std::vector<std::string> vars = {kSandboxPath, "HOME=/tmp", "TMPDIR=/tmp", "LANG=C.UTF-8"};
    for (const auto& entry : env.env_vars) {
        auto key = env_key(entry);
        auto it = std::find_if(vars.begin(), vars.end(),
                               [&](const std::string& v) { return env_key(v) == key; });
        if (it != vars.end()) {
            *it = entry;
        } else {
            vars.push_back(entry);
        }
    }
    return vars;
}

RunExecutor::RunExecutor(LaunchFn launch, SandboxSlots& slots, Logger& logger)
    : launch_(std::move(launch)), slots_(slots), logger_(logger) {}

Result<SandboxReport> RunExecutor::launch_leased(const SandboxSpec& spec, std::stop_token stop) {
    auto lease = slots_.acquire(stop);
    if (!lease) {
        return Error{"stopped while waiting for a sandbox slot"};
    }
    try {
        return launch_(spec, stop);
    } catch (const std::exception& e) {
        return Error{std::string{"sandbox launch threw: "} + e.what()};
    }
}

SandboxSpec RunExecutor::make_spec(const PendingRun& run, const Prepared& prepared,
                                   std::string label_suffix) const {
    const auto& env = *run.environment;
    SandboxSpec spec;
    spec.label = run.run_id() + label_suffix;
    spec.rootfs = env.rootfs();
    spec.argv = expand_command(env.run_command, prepared.context);
    spec.env = sandbox_environment(env);
    spec.files = prepared.files;
    spec.limits = run.limits;
    return spec;
}

ExecutionResult RunExecutor::execute(const PendingRun& run, std::stop_token stop) {
    const auto& env = *run.environment;
    const auto& submission = *run.submission;

    if (stop.stop_requested()) {
        return ResultCollector::cancelled("cancelled before start");
    }

    auto failed = [&](const Error& error) {
        if (stop.stop_requested()) {
            return ResultCollector::cancelled("cancelled while running");
        }
        logger_.error("run machinery failure",
                      {{"run", run.run_id()}, {"env", env.id}, {"error", error.message}});
        return ResultCollector::system_error(error.message);
    };

    Prepared prepared;
    prepared.context = CommandContext{env.source_file, env.artifact, sandbox_workdir(env.rootfs())};
    prepared.files.push_back(SandboxFile{env.source_file, submission.source_code, false});

    if (env.compiled()) {
        SandboxSpec spec;
        spec.label = run.run_id() + "-compile";
        spec.rootfs = env.rootfs();
        spec.argv = expand_command(env.compile_command, prepared.context);
        spec.env = sandbox_environment(env);
        spec.files = prepared.files;
        spec.limits = env.compile_limits;
        spec.collect_file = env.artifact;

        auto report = launch_leased(spec, stop);
        if (!report) return failed(report.error());
        if (report->state != SandboxState::Completed || report->exit_code != 0
            || !report->collected_file) {
            logger_.debug("compile step failed", {{"run", run.run_id()}, {"env", env.id}});
            return ResultCollector::compile_failure(*report, env.compile_limits);
        }
        prepared.files.push_back(SandboxFile{env.artifact, std::move(*report->collected_file), true});
    }

    if (submission.has_tests()) {
        return run_tests(run, prepared, stop);
    }
    return run_once(run, prepared, stop);
}

ExecutionResult RunExecutor::run_once(const PendingRun& run, const Prepared& prepared,
                                      std::stop_token stop) {
    const auto& submission = *run.submission;
    auto spec = make_spec(run, prepared, "");
    spec.argv.insert(spec.argv.end(), submission.args.begin(), submission.args.end());
    spec.stdin_data = submission.stdin_data;

    auto report = launch_leased(spec, stop);
    if (!report) {
        if (stop.stop_requested()) return ResultCollector::cancelled("cancelled while running");
        logger_.error("run machinery failure",
                      {{"run", run.run_id()}, {"error", report.error().message}});
        return ResultCollector::system_error(report.error().message);
    }
    return ResultCollector::collect(*report, run.limits);
}

ExecutionResult RunExecutor::run_tests(const PendingRun& run, const Prepared& prepared,
                                       std::stop_token stop) {
    const auto& submission = *run.submission;

    auto outcome = TestHarness::run(submission.test_cases, [&](const TestCase& tc) {
        auto spec = make_spec(run, prepared, "-t" + std::to_string(tc.index));
        spec.argv.insert(spec.argv.end(), submission.args.begin(), submission.args.end());
        spec.stdin_data = tc.input;

        auto report = launch_leased(spec, stop);
        if (!report) {
            if (stop.stop_requested()) return ResultCollector::cancelled("cancelled while running");
            logger_.error("test machinery failure",
                          {{"run", run.run_id()},
                           {"test", std::to_string(tc.index)},
                           {"error", report.error().message}});
            return ResultCollector::system_error(report.error().message);
        }
        return ResultCollector::collect(*report, run.limits);
    });

    ExecutionResult result;
    if (outcome.last) {
        const auto& last = *outcome.last;
        result.stdout_data = last.stdout_data;
        result.stderr_data = last.stderr_data;
        result.stdout_truncated = last.stdout_truncated;
        result.stderr_truncated = last.stderr_truncated;
        result.exit_code = last.exit_code;
    }
    if (outcome.error) {
        result.state = outcome.error->state;
        result.failure_kind = outcome.error->failure_kind;
        result.failure_detail = outcome.error->failure_detail;
        result.exit_code.reset();
    } else {
        result.state = RunState::Completed;
    }
    result.cpu_time_ms = outcome.cpu_time_ms;
    result.wall_time_ms = outcome.wall_time_ms;
    result.peak_memory_bytes = outcome.peak_memory_bytes;
    result.tests = std::move(outcome.report);
    return result;
}

}  // namespace exec_engine
