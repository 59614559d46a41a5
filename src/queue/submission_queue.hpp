/**
 * @file submission_queue.hpp
 * @brief Bounded, FIFO-within-priority queue of admitted runs.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "environment/registry.hpp"
#include "submission/submission.hpp"

#include <array>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace exec_engine {

/**
 * @brief An admitted run waiting for a worker slot.
 *
 * The environment handle is pinned at admission so a catalogue reload
 * cannot change what an already-accepted submission runs on.
 */
struct PendingRun {
    std::shared_ptr<const Submission> submission;
    EnvironmentHandle environment;
    ResourceLimits limits;

    [[nodiscard]] const RunId& run_id() const noexcept { return submission->run_id; }
};

/**
 * @brief Bounded producer/consumer channel with visible backpressure.
 *
 * try_push() never blocks: a full queue rejects with QueueFull. pop()
 * takes the oldest entry of the highest non-empty priority class, so a
 * higher class only overtakes at dequeue time.
 */
class SubmissionQueue {
public:
    explicit SubmissionQueue(size_t capacity);

    SubmissionQueue(const SubmissionQueue&) = delete;
    SubmissionQueue& operator=(const SubmissionQueue&) = delete;

    Result<void, Rejection> try_push(PendingRun run);

    /// Block until an entry is available, the queue closes, or stop is requested.
    std::optional<PendingRun> pop(std::stop_token stop);

    /// Remove a queued entry; nullopt when it is no longer queued.
    std::optional<PendingRun> remove(const RunId& run_id);

    /// Refuse further pushes, wake all waiters, and hand back what was queued.
    std::vector<PendingRun> close();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool closed() const;

private:
    [[nodiscard]] size_t size_locked() const noexcept;

    const size_t capacity_;
    std::array<std::deque<PendingRun>, kPriorityClasses> classes_;
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace exec_engine
