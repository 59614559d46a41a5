/**
 * @file run_executor.hpp
 * @brief Drives one admitted run through compile, run and test sandboxes.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "collector/execution_result.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "environment/environment.hpp"
#include "executor/worker_pool.hpp"
#include "queue/submission_queue.hpp"
#include "sandbox/sandbox_types.hpp"

#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace exec_engine {

/// Full sandbox lifecycle for one spec; supplied by the coordinator's launcher.
using LaunchFn = std::function<Result<SandboxReport>(const SandboxSpec&, std::stop_token)>;

/// Environment variables every sandboxed process starts from.
inline constexpr const char* kSandboxPath = "PATH=/usr/local/bin:/usr/bin:/bin";

/**
 * @brief Scrubbed environment for a sandbox: fixed base plus the environment's
 * own KEY=VALUE entries, later entries overriding earlier ones.
 */
[[nodiscard]] std::vector<std::string> sandbox_environment(const ExecutionEnvironment& env);

/**
 * @brief Executes a PendingRun with at most one live sandbox at a time.
 *
 * Order: optional compile sandbox, then either one run sandbox or one
 * sandbox per test case. Every sandbox holds a SandboxSlots lease while it
 * exists. Machinery failures become SystemError results; nothing is retried.
 */
class RunExecutor {
public:
    RunExecutor(LaunchFn launch, SandboxSlots& slots, Logger& logger);

    [[nodiscard]] ExecutionResult execute(const PendingRun& run, std::stop_token stop);

private:
    struct Prepared {
        std::vector<SandboxFile> files;
        CommandContext context;
    };

    /// Launch under a slot lease; the result is already normalized.
    Result<SandboxReport> launch_leased(const SandboxSpec& spec, std::stop_token stop);

    SandboxSpec make_spec(const PendingRun& run, const Prepared& prepared,
                          std::string label_suffix) const;

    ExecutionResult run_once(const PendingRun& run, const Prepared& prepared,
                             std::stop_token stop);
    ExecutionResult run_tests(const PendingRun& run, const Prepared& prepared,
                              std::stop_token stop);

    LaunchFn launch_;
    SandboxSlots& slots_;
    Logger& logger_;
};

}  // namespace exec_engine
