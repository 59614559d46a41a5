/**
 * @file environment.hpp
 * @brief Execution environment definition and command templates.
 * @author Dimitris Kafetzis
 *
 * An ExecutionEnvironment names a language runtime: where its files come
 * from (image reference), how a program is compiled and run, and what
 * resources a run may use by default and at most. Instances are immutable
 * once published through the EnvironmentRegistry.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace exec_engine {

enum class EnvironmentStatus : uint8_t {
    Active,
    Deprecated,    ///< Still resolvable; callers are nudged to migrate
    Maintenance,   ///< Temporarily refused at admission
    Disabled       ///< Refused at admission
};

[[nodiscard]] constexpr std::string_view to_string(EnvironmentStatus status) noexcept {
    switch (status) {
        case EnvironmentStatus::Active:      return "active";
        case EnvironmentStatus::Deprecated:  return "deprecated";
        case EnvironmentStatus::Maintenance: return "maintenance";
        case EnvironmentStatus::Disabled:    return "disabled";
    }
    return "unknown";
}

[[nodiscard]] std::optional<EnvironmentStatus> parse_environment_status(std::string_view text) noexcept;

/// Argument vector with `{source}`, `{artifact}` and `{workdir}` placeholders.
using CommandTemplate = std::vector<std::string>;

struct CommandContext {
    std::string source;     ///< Source file name, relative to the workspace
    std::string artifact;   ///< Compiled artifact name, relative to the workspace
    std::string workdir;    ///< Working directory as seen by the program
};

/**
 * @brief Substitute placeholders in every argument of a command template.
 */
[[nodiscard]] std::vector<std::string> expand_command(const CommandTemplate& tmpl,
                                                      const CommandContext& ctx);

struct ExecutionEnvironment {
    EnvironmentId id;
    std::string display_name;

    /// "host" runs on the host filesystem behind private mounts;
    /// "dir:<path>" chroots into a prepared root filesystem.
    std::string image = "host";
    EnvironmentStatus status = EnvironmentStatus::Active;

    std::string source_file = "main.txt";
    CommandTemplate compile_command;            ///< Empty for interpreted languages
    std::string artifact;                       ///< File the compile step must produce
    CommandTemplate run_command;
    std::vector<std::string> env_vars;          ///< KEY=VALUE added to the scrubbed env

    ResourceLimits default_limits;
    ResourceLimits max_limits;
    ResourceLimits compile_limits;

    [[nodiscard]] bool compiled() const noexcept { return !compile_command.empty(); }

    /// Rootfs directory when the image is "dir:<path>", empty for "host".
    [[nodiscard]] std::string rootfs() const;
};

/**
 * @brief Check an environment definition for internal consistency.
 *
 * The run command must be non-empty, the defaults must sit within the
 * maximums, and a compiled environment must name its artifact.
 */
Result<void> validate_environment(const ExecutionEnvironment& env);

}  // namespace exec_engine
