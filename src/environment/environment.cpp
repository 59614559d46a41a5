/**
 * @file environment.cpp
 * @brief ExecutionEnvironment helpers.
 * @author Dimitris Kafetzis
 */

#include "environment/environment.hpp"

namespace exec_engine {

namespace {

constexpr std::string_view kDirImagePrefix = "dir:";

void replace_all(std::string& text, std::string_view needle, std::string_view replacement) {
    size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.replace(pos, needle.size(), replacement);
        pos += replacement.size();
    }
}

}  // anonymous namespace

std::optional<EnvironmentStatus> parse_environment_status(std::string_view text) noexcept {
    if (text == "active")      return EnvironmentStatus::Active;
    if (text == "deprecated")  return EnvironmentStatus::Deprecated;
    if (text == "maintenance") return EnvironmentStatus::Maintenance;
    if (text == "disabled")    return EnvironmentStatus::Disabled;
    return std::nullopt;
}

std::vector<std::string> expand_command(const CommandTemplate& tmpl, const CommandContext& ctx) {
    std::vector<std::string> argv;
    argv.reserve(tmpl.size());
    for (auto arg : tmpl) {
        replace_all(arg, "{source}", ctx.source);
        replace_all(arg, "{artifact}", ctx.artifact);
        replace_all(arg, "{workdir}", ctx.workdir);
        argv.push_back(std::move(arg));
    }
    return argv;
}

std::string ExecutionEnvironment::rootfs() const {
    if (image.starts_with(kDirImagePrefix)) {
        return image.substr(kDirImagePrefix.size());
    }
    return {};
}

Result<void> validate_environment(const ExecutionEnvironment& env) {
    if (env.id.empty()) {
        return Error{"environment id must not be empty"};
    }
    if (env.run_command.empty()) {
        return Error{"environment '" + env.id + "' has no run command"};
    }
    if (env.source_file.empty() || env.source_file.find('/') != std::string::npos) {
        return Error{"environment '" + env.id + "' needs a plain source file name"};
    }
    if (env.compiled() && env.artifact.empty()) {
        return Error{"environment '" + env.id + "' compiles but names no artifact"};
    }
    if (env.image != "host" && env.rootfs().empty()) {
        return Error{"environment '" + env.id + "' has unsupported image '" + env.image + "'"};
    }
    if (!env.default_limits.within(env.max_limits)) {
        return Error{"environment '" + env.id + "' default limits exceed its maximums"};
    }
    if (env.default_limits.wall_time_ms == 0 || env.default_limits.memory_bytes == 0
        || env.default_limits.cpu_time_ms == 0) {
        return Error{"environment '" + env.id + "' has a zero default limit"};
    }
    return {};
}

}  // namespace exec_engine
