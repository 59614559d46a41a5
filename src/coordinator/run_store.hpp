/**
 * @file run_store.hpp
 * @brief Persistence boundary for terminal run records.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "collector/execution_result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace exec_engine {

// ─────────────────────────────────────────────
// IRunStore (virtual, configured at startup)
// ─────────────────────────────────────────────

/**
 * @brief Keyed storage of terminal ExecutionResults.
 *
 * The coordinator writes each run exactly once, before the run leaves its
 * in-flight table, so a reader never finds a run in neither place.
 */
class IRunStore {
public:
    virtual ~IRunStore() = default;

    /// Store a terminal result; false when the run id is already present.
    virtual bool put(const ExecutionResult& result) = 0;
    [[nodiscard]] virtual std::optional<ExecutionResult> get(const RunId& run_id) const = 0;
    [[nodiscard]] virtual size_t size() const = 0;
};

/**
 * @brief In-memory store keeping the most recent `retention` results.
 */
class MemoryRunStore final : public IRunStore {
public:
    explicit MemoryRunStore(size_t retention);

    bool put(const ExecutionResult& result) override;
    [[nodiscard]] std::optional<ExecutionResult> get(const RunId& run_id) const override;
    [[nodiscard]] size_t size() const override;

    [[nodiscard]] size_t retention() const noexcept { return retention_; }

private:
    const size_t retention_;
    std::unordered_map<RunId, ExecutionResult> results_;
    std::deque<RunId> order_;   ///< Oldest first
    mutable std::mutex mutex_;
};

}  // namespace exec_engine
