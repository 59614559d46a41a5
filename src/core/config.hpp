/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"
#include "environment/environment.hpp"
#include "sandbox/sandbox_types.hpp"
#include "submission/submission.hpp"

namespace exec_engine {

struct EngineConfig {
    uint32_t worker_count = 0;          ///< 0 = hardware_concurrency
    uint32_t queue_capacity = 256;
    uint64_t max_source_bytes = 256 * 1024;
    uint64_t max_stdin_bytes = 1024 * 1024;
    uint32_t max_test_cases = 64;
    uint32_t max_args = 32;
    uint32_t result_retention = 4096;   ///< Terminal runs kept by the in-memory store
};

/**
 * @brief Global limits: defaults for environments that omit them, and a hard
 * ceiling no environment or caller can exceed.
 */
struct LimitsConfig {
    ResourceLimits defaults;
    ResourceLimits ceiling{
        .wall_time_ms = 120'000,
        .cpu_time_ms = 60'000,
        .memory_bytes = 1024ULL * 1024 * 1024,
        .max_processes = 256,
        .max_file_size_bytes = 64ULL * 1024 * 1024,
        .max_open_files = 256,
    };
};

struct NotifyConfig {
    bool enabled = true;
    uint32_t max_attempts = 3;
    uint32_t retry_backoff_ms = 50;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool log_to_stdout = true;          ///< Mirror log lines to stdout ("stdout" key)
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    EngineConfig engine;
    SandboxOptions sandbox;
    LimitsConfig limits;
    NotifyConfig notify;
    TelemetryConfig telemetry;
    std::vector<ExecutionEnvironment> environments;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Every [[environment]] entry is validated; one bad entry fails the load.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Load only the [[environment]] catalogue of a TOML file.
 *
 * Limits missing from an entry fall back to `limits`.
 */
Result<std::vector<ExecutionEnvironment>> load_environments(const std::filesystem::path& path,
                                                            const LimitsConfig& limits);

/**
 * @brief Load a list of [[test]] cases; indices follow file order.
 */
Result<std::vector<TestCase>> load_test_cases(const std::filesystem::path& path);

/**
 * @brief Create a default configuration (empty catalogue).
 */
Config default_config();

}  // namespace exec_engine
