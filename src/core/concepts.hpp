/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for ExecEngine interfaces.
 * @author Dimitris Kafetzis
 *
 * Compile-time interface constraints for components chosen at build time
 * rather than at runtime.
 */

#pragma once

#include "core/result.hpp"
#include "sandbox/sandbox_types.hpp"

#include <concepts>
#include <stop_token>
#include <string_view>

namespace exec_engine {

class Logger;
class MetricsCollector;

// ─────────────────────────────────────────────
// SandboxLauncherLike
// ─────────────────────────────────────────────

/**
 * @concept SandboxLauncherLike
 * @brief Constrains types that run one SandboxSpec to a terminal report.
 *
 * launch() covers the full sandbox lifecycle (create, run, destroy) and is
 * called concurrently from every worker slot. The coordinator is templated
 * on the launcher so tests can swap in a scripted one without a vtable in
 * production builds.
 */
template <typename T>
concept SandboxLauncherLike = requires(T launcher, const SandboxSpec& spec, std::stop_token stop) {
    { launcher.launch(spec, stop) } -> std::same_as<Result<SandboxReport>>;
    { T::name() } -> std::convertible_to<std::string_view>;
} && std::constructible_from<T, const SandboxOptions&, Logger&, MetricsCollector&>;

}  // namespace exec_engine
