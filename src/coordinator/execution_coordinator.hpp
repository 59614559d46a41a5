/**
 * @file execution_coordinator.hpp
 * @brief Top-level ExecutionCoordinator facade: ties all modules together.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Admitting submissions (validation, limits, queue backpressure)
 *   2. Tracking runs from Queued to exactly one terminal ExecutionResult
 *   3. Status, result and cancel queries by RunId
 *   4. Handing terminal results to the run store and the event channel
 *
 * Template-parameterized on LauncherT for testability (LinuxSandboxLauncher
 * or ScriptedLauncher).
 */

#pragma once

#include "collector/result_collector.hpp"
#include "coordinator/event_channel.hpp"
#include "coordinator/result_codec.hpp"
#include "coordinator/run_store.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "environment/registry.hpp"
#include "executor/run_executor.hpp"
#include "executor/worker_pool.hpp"
#include "queue/submission_queue.hpp"
#include "sandbox/launcher.hpp"
#include "submission/admission.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace exec_engine {

/**
 * @brief Snapshot answer to get_status().
 *
 * `result` is present exactly when `state` is terminal.
 */
struct RunStatus {
    RunState state{RunState::Queued};
    std::optional<ExecutionResult> result;
};

enum class CancelOutcome : uint8_t {
    Ack,             ///< The run will settle (or has settled) as Cancelled
    AlreadyTerminal  ///< Nothing to do; the run had already finished
};

[[nodiscard]] constexpr std::string_view to_string(CancelOutcome outcome) noexcept {
    switch (outcome) {
        case CancelOutcome::Ack:             return "ack";
        case CancelOutcome::AlreadyTerminal: return "already_terminal";
    }
    return "unknown";
}

namespace detail {

inline std::unique_ptr<ILogSink> sink_or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

}  // namespace detail

/**
 * @brief The top-level coordinator that wires all modules together.
 */
template <SandboxLauncherLike LauncherT = LinuxSandboxLauncher>
class ExecutionCoordinator {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;       ///< NullSink when empty
        std::unique_ptr<IRunStore> store;             ///< MemoryRunStore when empty
        std::unique_ptr<IRunEventChannel> events;     ///< No notifications when empty
    };

    explicit ExecutionCoordinator(Options opts);
    ~ExecutionCoordinator();

    // Non-copyable, non-movable
    ExecutionCoordinator(const ExecutionCoordinator&) = delete;
    ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    /// Stop admission, cancel queued runs, force-terminate running ones and join.
    void shutdown();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Runs ─────────────────────────────────
    Result<RunId, Rejection> submit(Submission submission);
    [[nodiscard]] Result<RunStatus> get_status(const RunId& run_id) const;
    [[nodiscard]] Result<ExecutionResult> get_result(const RunId& run_id) const;
    Result<CancelOutcome> cancel(const RunId& run_id);

    /// Block until the run is terminal or `timeout` elapses.
    Result<ExecutionResult> wait(const RunId& run_id, std::chrono::milliseconds timeout) const;

    // ── Environments ─────────────────────────
    Result<void> reload_environments(const std::vector<ExecutionEnvironment>& environments);

    // ── Accessors (for testing) ─────────────
    LauncherT& launcher() { return launcher_; }
    EnvironmentRegistry& registry() { return registry_; }
    SandboxSlots& slots() { return slots_; }
    SubmissionQueue& queue() { return queue_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }
    [[nodiscard]] size_t in_flight() const;
    [[nodiscard]] const EventDispatcher* dispatcher() const { return dispatcher_.get(); }

private:
    struct InFlight {
        RunState state{RunState::Queued};
        std::stop_source stop;
        SteadyTime enqueued_at;
    };

    static size_t resolve_worker_count(uint32_t configured);
    RunId next_run_id();

    void handle(PendingRun run, std::stop_token worker_stop);
    ExecutionResult execute_guarded(const PendingRun& run, std::stop_token stop);
    void finish(ExecutionResult result, const Submission& submission, Timestamp started_at);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;
    EnvironmentRegistry registry_;
    AdmissionPolicy policy_;
    const size_t worker_count_;

    LauncherT launcher_;
    SubmissionQueue queue_;
    SandboxSlots slots_;
    RunExecutor executor_;

    std::unique_ptr<IRunStore> store_;
    std::unique_ptr<IRunEventChannel> events_;
    std::unique_ptr<EventDispatcher> dispatcher_;
    std::unique_ptr<WorkerPool> pool_;

    mutable std::mutex mutex_;
    mutable std::condition_variable terminal_cv_;
    std::unordered_map<RunId, InFlight> in_flight_;

    std::atomic<uint64_t> run_counter_{0};
    const uint64_t epoch_tag_;
    std::atomic<bool> running_{false};
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <SandboxLauncherLike LauncherT>
ExecutionCoordinator<LauncherT>::ExecutionCoordinator(Options opts)
    : config_(std::move(opts.config))
    , logger_(detail::sink_or_null(std::move(opts.log_sink)), opts.log_level)
    , metrics_(detail::sink_or_null(std::move(opts.metrics_sink)))
    , registry_(config_.environments)
    , policy_{.max_source_bytes = config_.engine.max_source_bytes,
              .max_stdin_bytes = config_.engine.max_stdin_bytes,
              .max_test_cases = config_.engine.max_test_cases,
              .max_args = config_.engine.max_args,
              .global_ceiling = config_.limits.ceiling}
    , worker_count_(resolve_worker_count(config_.engine.worker_count))
    , launcher_(config_.sandbox, logger_, metrics_)
    , queue_(config_.engine.queue_capacity)
    , slots_(worker_count_)
    , executor_([this](const SandboxSpec& spec, std::stop_token stop) {
                    return launcher_.launch(spec, stop);
                },
                slots_, logger_)
    , store_(std::move(opts.store))
    , events_(std::move(opts.events))
    , epoch_tag_(static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch()).count())) {
    if (!store_) {
        store_ = std::make_unique<MemoryRunStore>(config_.engine.result_retention);
    }
}

template <SandboxLauncherLike LauncherT>
ExecutionCoordinator<LauncherT>::~ExecutionCoordinator() {
    shutdown();
}

template <SandboxLauncherLike LauncherT>
size_t ExecutionCoordinator<LauncherT>::resolve_worker_count(uint32_t configured) {
    if (configured > 0) return configured;
    size_t hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : hw;
}

template <SandboxLauncherLike LauncherT>
RunId ExecutionCoordinator<LauncherT>::next_run_id() {
    return "run-" + std::to_string(epoch_tag_) + "-" + std::to_string(++run_counter_);
}

template <SandboxLauncherLike LauncherT>
Result<void> ExecutionCoordinator<LauncherT>::start() {
    if (running_.exchange(true)) {
        return Error{"Already running"};
    }

    logger_.info("coordinator starting",
                 {{"launcher", std::string{LauncherT::name()}},
                  {"workers", std::to_string(worker_count_)},
                  {"queue_capacity", std::to_string(queue_.capacity())},
                  {"environments", std::to_string(registry_.size())}});

    if (config_.notify.enabled && events_) {
        dispatcher_ = std::make_unique<EventDispatcher>(*events_, config_.notify, logger_);
    }

    pool_ = std::make_unique<WorkerPool>(
        queue_,
        [this](PendingRun run, std::stop_token stop) { handle(std::move(run), stop); },
        worker_count_);

    logger_.info("coordinator started");
    return Result<void>{};
}

template <SandboxLauncherLike LauncherT>
void ExecutionCoordinator<LauncherT>::shutdown() {
    if (!running_.exchange(false)) return;

    logger_.info("coordinator shutting down", {{"in_flight", std::to_string(in_flight())}});

    // Admission is closed from here on; whatever was still queued never starts.
    for (auto& run : queue_.close()) {
        auto result = ResultCollector::cancelled("engine shutting down");
        finish(std::move(result), *run.submission, Timestamp{});
    }

    {
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : in_flight_) {
            entry.stop.request_stop();
        }
    }

    if (pool_) {
        pool_->stop();
        pool_.reset();
    }
    if (dispatcher_) {
        dispatcher_->stop();
    }

    metrics_.flush();
    logger_.info("coordinator stopped");
    logger_.flush();
}

template <SandboxLauncherLike LauncherT>
Result<RunId, Rejection> ExecutionCoordinator<LauncherT>::submit(Submission submission) {
    auto reject_with = [&](Rejection rejection) -> Result<RunId, Rejection> {
        metrics_.record_rejection(submission.environment_id, rejection);
        logger_.info("submission rejected",
                     {{"env", submission.environment_id},
                      {"reason", std::string{rejection.code()}},
                      {"detail", rejection.detail}});
        return rejection;
    };

    if (!running_.load()) {
        return reject_with(Rejection{RejectReason::ShuttingDown, "engine is not running"});
    }
    if (auto valid = validate_submission(submission, policy_); !valid) {
        return reject_with(valid.error());
    }
    auto env = registry_.resolve(submission.environment_id);
    if (!env) {
        return reject_with(env.error());
    }
    auto limits = effective_limits(**env, submission.limits, config_.limits.ceiling);
    if (!limits) {
        return reject_with(limits.error());
    }
    if ((*env)->status == EnvironmentStatus::Deprecated) {
        logger_.warn("deprecated environment requested", {{"env", (*env)->id}});
    }

    submission.run_id = next_run_id();
    submission.submitted_at = std::chrono::system_clock::now();
    auto shared = std::make_shared<const Submission>(std::move(submission));
    const RunId run_id = shared->run_id;

    {
        std::lock_guard lock(mutex_);
        in_flight_.emplace(run_id, InFlight{.state = RunState::Queued,
                                            .stop = std::stop_source{},
                                            .enqueued_at = std::chrono::steady_clock::now()});
        auto pushed = queue_.try_push(PendingRun{shared, *env, *limits});
        if (!pushed) {
            in_flight_.erase(run_id);
            return reject_with(pushed.error());
        }
    }

    metrics_.record_submission(run_id, shared->environment_id, shared->priority, queue_.size());
    logger_.debug("submission admitted",
                  {{"run", run_id},
                   {"env", shared->environment_id},
                   {"priority", std::string{to_string(shared->priority)}}});
    return run_id;
}

template <SandboxLauncherLike LauncherT>
Result<RunStatus> ExecutionCoordinator<LauncherT>::get_status(const RunId& run_id) const {
    std::lock_guard lock(mutex_);
    if (auto it = in_flight_.find(run_id); it != in_flight_.end()) {
        return RunStatus{.state = it->second.state, .result = std::nullopt};
    }
    if (auto stored = store_->get(run_id)) {
        RunState state = stored->state;
        return RunStatus{.state = state, .result = std::move(stored)};
    }
    return Error{"unknown run id '" + run_id + "'"};
}

template <SandboxLauncherLike LauncherT>
Result<ExecutionResult> ExecutionCoordinator<LauncherT>::get_result(const RunId& run_id) const {
    auto status = get_status(run_id);
    if (!status) return status.error();
    if (!status->result) {
        return Error{"run '" + run_id + "' is still " + std::string{to_string(status->state)}};
    }
    return *status->result;
}

template <SandboxLauncherLike LauncherT>
Result<ExecutionResult> ExecutionCoordinator<LauncherT>::wait(
    const RunId& run_id, std::chrono::milliseconds timeout) const {
    {
        std::unique_lock lock(mutex_);
        bool settled = terminal_cv_.wait_for(lock, timeout, [&] {
            return !in_flight_.contains(run_id);
        });
        if (!settled) {
            return Error{"timed out waiting for run '" + run_id + "'"};
        }
    }
    return get_result(run_id);
}

template <SandboxLauncherLike LauncherT>
Result<CancelOutcome> ExecutionCoordinator<LauncherT>::cancel(const RunId& run_id) {
    std::optional<PendingRun> removed;
    {
        std::lock_guard lock(mutex_);
        auto it = in_flight_.find(run_id);
        if (it == in_flight_.end()) {
            if (store_->get(run_id)) return CancelOutcome::AlreadyTerminal;
            return Error{"unknown run id '" + run_id + "'"};
        }

        it->second.stop.request_stop();
        if (it->second.state == RunState::Queued) {
            removed = queue_.remove(run_id);
        }
    }

    logger_.info("run cancel requested",
                 {{"run", run_id}, {"was", removed ? "queued" : "running"}});

    // A worker that popped the run first will see the stop request instead.
    if (removed) {
        finish(ResultCollector::cancelled("cancelled while queued"), *removed->submission,
               Timestamp{});
    }
    return CancelOutcome::Ack;
}

template <SandboxLauncherLike LauncherT>
Result<void> ExecutionCoordinator<LauncherT>::reload_environments(
    const std::vector<ExecutionEnvironment>& environments) {
    for (const auto& env : environments) {
        if (!env.max_limits.within(config_.limits.ceiling)) {
            return Error{"environment '" + env.id + "' max_limits exceed the global ceiling"};
        }
    }
    auto replaced = registry_.replace_all(environments);
    if (!replaced) {
        logger_.error("environment reload rejected", {{"error", replaced.error().message}});
        return replaced;
    }
    logger_.info("environments reloaded", {{"count", std::to_string(environments.size())}});
    return Result<void>{};
}

template <SandboxLauncherLike LauncherT>
size_t ExecutionCoordinator<LauncherT>::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_.size();
}

// ── Worker side ──────────────────────────────

template <SandboxLauncherLike LauncherT>
void ExecutionCoordinator<LauncherT>::handle(PendingRun run, std::stop_token worker_stop) {
    const RunId& run_id = run.run_id();
    std::stop_source run_stop;
    SteadyTime enqueued_at;
    {
        std::lock_guard lock(mutex_);
        auto it = in_flight_.find(run_id);
        if (it == in_flight_.end()) return;   // settled by cancel or shutdown
        it->second.state = RunState::Running;
        run_stop = it->second.stop;
        enqueued_at = it->second.enqueued_at;
    }

    // Worker shutdown reaches the run through its own stop source.
    std::stop_callback on_worker_stop(worker_stop, [run_stop]() mutable {
        run_stop.request_stop();
    });

    Timestamp started_at = std::chrono::system_clock::now();
    metrics_.record_run_started(run_id, std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - enqueued_at));
    logger_.debug("run started", {{"run", run_id}, {"env", run.environment->id}});

    ExecutionResult result = execute_guarded(run, run_stop.get_token());
    finish(std::move(result), *run.submission, started_at);
}

template <SandboxLauncherLike LauncherT>
ExecutionResult ExecutionCoordinator<LauncherT>::execute_guarded(const PendingRun& run,
                                                                 std::stop_token stop) {
    try {
        return executor_.execute(run, stop);
    } catch (const std::exception& e) {
        logger_.error("run failed inside the engine", {{"run", run.run_id()}, {"error", e.what()}});
        return ResultCollector::system_error(e.what());
    }
}

template <SandboxLauncherLike LauncherT>
void ExecutionCoordinator<LauncherT>::finish(ExecutionResult result, const Submission& submission,
                                             Timestamp started_at) {
    result.run_id = submission.run_id;
    result.environment_id = submission.environment_id;
    result.correlation_token = submission.correlation_token;
    result.submitted_at = submission.submitted_at;
    result.finished_at = std::chrono::system_clock::now();
    result.started_at = started_at == Timestamp{} ? result.finished_at : started_at;

    {
        std::lock_guard lock(mutex_);
        if (!store_->put(result)) {
            logger_.error("duplicate terminal result ignored", {{"run", result.run_id}});
            return;
        }
        in_flight_.erase(result.run_id);
    }
    terminal_cv_.notify_all();

    metrics_.record_run_finished(result);
    logger_.info("run finished",
                 {{"run", result.run_id},
                  {"env", result.environment_id},
                  {"state", std::string{to_string(result.state)}},
                  {"failure", result.failure_kind
                                  ? std::string{to_string(*result.failure_kind)} : ""}});

    if (dispatcher_) {
        dispatcher_->enqueue(std::move(result));
    }
}

}  // namespace exec_engine
