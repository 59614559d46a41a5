/**
 * @file submission_queue.cpp
 * @brief SubmissionQueue implementation.
 * @author Dimitris Kafetzis
 */

#include "queue/submission_queue.hpp"

#include <algorithm>

namespace exec_engine {

SubmissionQueue::SubmissionQueue(size_t capacity) : capacity_(capacity) {}

Result<void, Rejection> SubmissionQueue::try_push(PendingRun run) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return Rejection{RejectReason::ShuttingDown, "engine is shutting down"};
        }
        if (size_locked() >= capacity_) {
            return Rejection{RejectReason::QueueFull,
                             "queue holds " + std::to_string(capacity_) + " runs"};
        }
        auto cls = static_cast<size_t>(run.submission->priority);
        if (cls >= kPriorityClasses) {
            return Rejection{RejectReason::MalformedSubmission, "priority out of range"};
        }
        classes_[cls].push_back(std::move(run));
    }
    cv_.notify_one();
    return {};
}

std::optional<PendingRun> SubmissionQueue::pop(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, stop, [this] { return closed_ || size_locked() > 0; });

    if (stop.stop_requested() || closed_) return std::nullopt;

    for (size_t cls = kPriorityClasses; cls-- > 0;) {
        auto& fifo = classes_[cls];
        if (!fifo.empty()) {
            PendingRun run = std::move(fifo.front());
            fifo.pop_front();
            return run;
        }
    }
    return std::nullopt;
}

std::optional<PendingRun> SubmissionQueue::remove(const RunId& run_id) {
    std::lock_guard lock(mutex_);
    for (auto& fifo : classes_) {
        auto it = std::find_if(fifo.begin(), fifo.end(),
                               [&](const PendingRun& run) { return run.run_id() == run_id; });
        if (it != fifo.end()) {
            PendingRun run = std::move(*it);
            fifo.erase(it);
            return run;
        }
    }
    return std::nullopt;
}

std::vector<PendingRun> SubmissionQueue::close() {
    std::vector<PendingRun> drained;
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        for (size_t cls = kPriorityClasses; cls-- > 0;) {
            for (auto& run : classes_[cls]) {
                drained.push_back(std::move(run));
            }
            classes_[cls].clear();
        }
    }
    cv_.notify_all();
    return drained;
}

size_t SubmissionQueue::size() const {
    std::lock_guard lock(mutex_);
    return size_locked();
}

bool SubmissionQueue::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

size_t SubmissionQueue::size_locked() const noexcept {
    size_t total = 0;
    for (const auto& fifo : classes_) total += fifo.size();
    return total;
}

}  // namespace exec_engine
