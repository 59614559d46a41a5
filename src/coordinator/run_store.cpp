/**
 * @file run_store.cpp
 * @brief MemoryRunStore implementation.
 * @author Dimitris Kafetzis
 */

#include "coordinator/run_store.hpp"

#include <algorithm>

namespace exec_engine {

MemoryRunStore::MemoryRunStore(size_t retention) : retention_(std::max<size_t>(retention, 1)) {}

bool MemoryRunStore::put(const ExecutionResult& result) {
    std::lock_guard lock(mutex_);
    if (!results_.emplace(result.run_id, result).second) return false;
    order_.push_back(result.run_id);

    while (order_.size() > retention_) {
        results_.erase(order_.front());
        order_.pop_front();
    }
    return true;
}

std::optional<ExecutionResult> MemoryRunStore::get(const RunId& run_id) const {
    std::lock_guard lock(mutex_);
    auto it = results_.find(run_id);
    if (it == results_.end()) return std::nullopt;
    return it->second;
}

size_t MemoryRunStore::size() const {
    std::lock_guard lock(mutex_);
    return results_.size();
}

}  // namespace exec_engine
