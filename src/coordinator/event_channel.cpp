/**
 * @file event_channel.cpp
 * @brief SinkEventChannel and EventDispatcher implementation.
 * @author Dimitris Kafetzis
 */

#include "coordinator/event_channel.hpp"

#include "coordinator/result_codec.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace exec_engine {

namespace {

NotifyConfig at_least_one_attempt(NotifyConfig config) {
    config.max_attempts = std::max<uint32_t>(config.max_attempts, 1);
    return config;
}

}  // anonymous namespace

// ── SinkEventChannel ─────────────────────────

SinkEventChannel::SinkEventChannel(std::unique_ptr<ILogSink> sink) : sink_(std::move(sink)) {}

Result<void> SinkEventChannel::publish(const ExecutionResult& result) {
    std::lock_guard lock(mutex_);
    sink_->write(ResultCodec::encode_event(result));
    sink_->flush();
    return {};
}

// ── EventDispatcher ──────────────────────────

EventDispatcher::EventDispatcher(IRunEventChannel& channel, NotifyConfig config, Logger& logger)
    : channel_(channel)
    , config_(at_least_one_attempt(config))
    , logger_(logger)
    , thread_([this](std::stop_token stop) { dispatch_loop(stop); }) {}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::enqueue(ExecutionResult result) {
    {
        std::lock_guard lock(mutex_);
        pending_.push_back(std::move(result));
    }
    cv_.notify_one();
}

void EventDispatcher::stop() {
    thread_.request_stop();
    if (thread_.joinable()) thread_.join();
}

void EventDispatcher::dispatch_loop(std::stop_token stop) {
    while (true) {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, stop, [this] { return !pending_.empty(); });
        if (pending_.empty()) return;   // stopped and drained

        ExecutionResult next = std::move(pending_.front());
        pending_.pop_front();
        lock.unlock();

        deliver(next);
    }
}

void EventDispatcher::deliver(const ExecutionResult& result) {
    for (uint32_t attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        Result<void> published = Error{"not attempted"};
        try {
            published = channel_.publish(result);
        } catch (const std::exception& e) {
            published = Error{e.what()};
        }

        if (published) {
            ++delivered_;
            return;
        }

        logger_.warn("run event publish failed",
                     {{"run", result.run_id},
                      {"attempt", std::to_string(attempt)},
                      {"error", published.error().message}});
        if (attempt < config_.max_attempts) {
            std::this_thread::sleep_for(
                std::chrono::milliseconds(config_.retry_backoff_ms) * attempt);
        }
    }

    ++dropped_;
    logger_.error("run event dropped", {{"run", result.run_id}});
}

}  // namespace exec_engine
