/**
 * @file worker_pool.cpp
 * @brief WorkerPool and SandboxSlots implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/worker_pool.hpp"

#include <algorithm>

namespace exec_engine {

// ── SandboxSlots ─────────────────────────────

SandboxSlots::SandboxSlots(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

std::optional<SandboxSlots::Lease> SandboxSlots::acquire(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait(lock, stop, [this] { return live_ < capacity_; })) {
        return std::nullopt;
    }
    ++live_;
    peak_ = std::max(peak_, live_);
    return Lease{this};
}

void SandboxSlots::release() {
    {
        std::lock_guard lock(mutex_);
        --live_;
    }
    cv_.notify_one();
}

size_t SandboxSlots::live() const {
    std::lock_guard lock(mutex_);
    return live_;
}

size_t SandboxSlots::peak() const {
    std::lock_guard lock(mutex_);
    return peak_;
}

// ── WorkerPool ───────────────────────────────

WorkerPool::WorkerPool(SubmissionQueue& queue, Handler handler, size_t num_threads)
    : queue_(queue), handler_(std::move(handler)) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    // Request stop on all jthreads first, then join
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto run = queue_.pop(stop);
        if (!run) {
            if (stop.stop_requested() || queue_.closed()) return;
            continue;
        }

        ++active_runs_;
        handler_(std::move(*run), stop);
        --active_runs_;
    }
}

size_t WorkerPool::active_count() const noexcept {
    return active_runs_.load();
}

size_t WorkerPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace exec_engine
