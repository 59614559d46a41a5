/**
 * @file event_channel.hpp
 * @brief Terminal-run notifications with at-least-once delivery.
 * @author Dimitris Kafetzis
 *
 * The coordinator hands each terminal result to an EventDispatcher, which
 * publishes it on its own thread through an IRunEventChannel. A failed
 * publish is retried with linear backoff up to NotifyConfig::max_attempts;
 * consumers de-duplicate by run id.
 */

#pragma once

#include "collector/execution_result.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace exec_engine {

// ─────────────────────────────────────────────
// IRunEventChannel (virtual, configured at startup)
// ─────────────────────────────────────────────

class IRunEventChannel {
public:
    virtual ~IRunEventChannel() = default;

    virtual Result<void> publish(const ExecutionResult& result) = 0;
};

/**
 * @brief Writes one `run_terminal` NDJSON event per result to a log sink.
 */
class SinkEventChannel final : public IRunEventChannel {
public:
    explicit SinkEventChannel(std::unique_ptr<ILogSink> sink);

    Result<void> publish(const ExecutionResult& result) override;

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex mutex_;
};

// ─────────────────────────────────────────────
// EventDispatcher
// ─────────────────────────────────────────────

class EventDispatcher {
public:
    EventDispatcher(IRunEventChannel& channel, NotifyConfig config, Logger& logger);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void enqueue(ExecutionResult result);

    /// Deliver everything still pending, then join the dispatch thread.
    void stop();

    [[nodiscard]] size_t delivered() const noexcept { return delivered_.load(); }
    [[nodiscard]] size_t dropped() const noexcept { return dropped_.load(); }

private:
    void dispatch_loop(std::stop_token stop);
    void deliver(const ExecutionResult& result);

    IRunEventChannel& channel_;
    NotifyConfig config_;
    Logger& logger_;

    std::deque<ExecutionResult> pending_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::atomic<size_t> delivered_{0};
    std::atomic<size_t> dropped_{0};

    std::jthread thread_;   // Last: started after everything it touches
};

}  // namespace exec_engine
