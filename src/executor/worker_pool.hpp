/**
 * @file worker_pool.hpp
 * @brief Fixed pool of std::jthread worker slots fed by the submission queue.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "queue/submission_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace exec_engine {

// ─────────────────────────────────────────────
// SandboxSlots
// ─────────────────────────────────────────────

/**
 * @brief Counts live sandboxes under a single mutex; never above capacity.
 */
class SandboxSlots {
public:
    class Lease {
    public:
        Lease(Lease&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() {
            if (owner_) owner_->release();
        }

    private:
        friend class SandboxSlots;
        explicit Lease(SandboxSlots* owner) noexcept : owner_(owner) {}
        SandboxSlots* owner_;
    };

    explicit SandboxSlots(size_t capacity);

    SandboxSlots(const SandboxSlots&) = delete;
    SandboxSlots& operator=(const SandboxSlots&) = delete;

    /// Wait for a free slot; nullopt when `stop` is requested first.
    std::optional<Lease> acquire(std::stop_token stop);

    [[nodiscard]] size_t live() const;
    [[nodiscard]] size_t peak() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    void release();

    const size_t capacity_;
    size_t live_{0};
    size_t peak_{0};
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

// ─────────────────────────────────────────────
// WorkerPool
// ─────────────────────────────────────────────

/**
 * @brief Each worker takes one pending run at a time and drives it to the end.
 *
 * Workers block only in SubmissionQueue::pop(). They exit when the queue is
 * closed or the pool is stopped.
 */
class WorkerPool {
public:
    using Handler = std::function<void(PendingRun, std::stop_token)>;

    WorkerPool(SubmissionQueue& queue, Handler handler, size_t num_threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Request stop on every worker and join them.
    void stop();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    SubmissionQueue& queue_;
    Handler handler_;
    std::vector<std::jthread> workers_;
    std::atomic<size_t> active_runs_{0};
};

}  // namespace exec_engine
