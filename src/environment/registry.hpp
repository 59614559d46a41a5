/**
 * @file registry.hpp
 * @brief Environment registry with atomic whole-catalogue swaps.
 * @author Dimitris Kafetzis
 *
 * Readers load the current catalogue through an atomic shared_ptr and never
 * block on writers. Every update builds a fresh catalogue and publishes it
 * in one store, so a reader sees either the old mapping or the new one.
 * Resolved environments are handed out as shared_ptr<const ...>; a run that
 * already resolved an environment keeps it alive across a retire or reload.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "environment/environment.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace exec_engine {

using EnvironmentHandle = std::shared_ptr<const ExecutionEnvironment>;

class EnvironmentRegistry {
public:
    EnvironmentRegistry();
    explicit EnvironmentRegistry(const std::vector<ExecutionEnvironment>& environments);

    EnvironmentRegistry(const EnvironmentRegistry&) = delete;
    EnvironmentRegistry& operator=(const EnvironmentRegistry&) = delete;

    /**
     * @brief Look up an environment by identifier.
     *
     * Rejects with UnknownEnvironment when absent and with
     * EnvironmentUnavailable when the environment is in maintenance or
     * disabled.
     */
    [[nodiscard]] Result<EnvironmentHandle, Rejection> resolve(const EnvironmentId& id) const;

    /// Replace the whole catalogue. Nothing changes when any entry is invalid.
    Result<void> replace_all(const std::vector<ExecutionEnvironment>& environments);

    /// Add one environment; an existing identifier is never redefined.
    Result<void> register_environment(ExecutionEnvironment env);

    /// Remove an environment from future resolution.
    Result<void> retire(const EnvironmentId& id);

    [[nodiscard]] std::vector<EnvironmentHandle> list() const;
    [[nodiscard]] size_t size() const;

private:
    using Catalogue = std::unordered_map<EnvironmentId, EnvironmentHandle>;

    std::atomic<std::shared_ptr<const Catalogue>> catalogue_;
    std::mutex write_mutex_;   ///< Serializes copy-modify-publish writers
};

}  // namespace exec_engine
