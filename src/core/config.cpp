/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace exec_engine {

namespace {

constexpr uint64_t kMiB = 1024ULL * 1024;

template <typename T>
T read_uint(toml::node_view<const toml::node> node, T fallback) {
    auto value = node.value<int64_t>();
    if (!value || *value < 0) return fallback;
    return static_cast<T>(*value);
}

/// Overlay a limits table onto `base`. Sizes are given in MiB.
ResourceLimits read_limits(toml::node_view<const toml::node> node, ResourceLimits base) {
    if (!node.is_table()) return base;
    base.wall_time_ms = read_uint(node["wall_time_ms"], base.wall_time_ms);
    base.cpu_time_ms = read_uint(node["cpu_time_ms"], base.cpu_time_ms);
    base.memory_bytes = read_uint(node["memory_mb"], base.memory_bytes / kMiB) * kMiB;
    base.max_processes = read_uint(node["max_processes"], base.max_processes);
    base.max_file_size_bytes =
        read_uint(node["max_file_size_mb"], base.max_file_size_bytes / kMiB) * kMiB;
    base.max_open_files = read_uint(node["max_open_files"], base.max_open_files);
    return base;
}

Result<std::vector<std::string>> read_strings(toml::node_view<const toml::node> node,
                                              std::string_view key) {
    std::vector<std::string> out;
    if (!node) return out;
    const auto* arr = node.as_array();
    if (arr == nullptr) {
        return Error{"'" + std::string{key} + "' must be an array of strings"};
    }
    for (const auto& element : *arr) {
        auto text = element.value<std::string>();
        if (!text) {
            return Error{"'" + std::string{key} + "' must be an array of strings"};
        }
        out.push_back(std::move(*text));
    }
    return out;
}

Result<ExecutionEnvironment> read_environment(const toml::table& tbl, const LimitsConfig& limits) {
    const auto& node = tbl;
    ExecutionEnvironment env;
    env.id = node["id"].value_or(std::string{});
    env.display_name = node["display_name"].value_or(env.id);
    env.image = node["image"].value_or(std::string{"host"});
    env.source_file = node["source_file"].value_or(std::string{"main.txt"});
    env.artifact = node["artifact"].value_or(std::string{});

    auto status_text = node["status"].value_or(std::string{"active"});
    auto status = parse_environment_status(status_text);
    if (!status) {
        return Error{"environment '" + env.id + "' has unknown status '" + status_text + "'"};
    }
    env.status = *status;

    auto run = read_strings(node["run"], "run");
    if (!run) return run.error();
    env.run_command = std::move(*run);

    auto compile = read_strings(node["compile"], "compile");
    if (!compile) return compile.error();
    env.compile_command = std::move(*compile);

    auto env_vars = read_strings(node["env"], "env");
    if (!env_vars) return env_vars.error();
    env.env_vars = std::move(*env_vars);

    env.max_limits = read_limits(node["max_limits"], limits.ceiling);
    env.default_limits = read_limits(node["default_limits"], limits.defaults);
    env.compile_limits = read_limits(node["compile_limits"], env.max_limits);

    // An environment may never loosen the global ceiling.
    if (!env.max_limits.within(limits.ceiling)) {
        return Error{"environment '" + env.id + "' maximums exceed the global ceiling"};
    }
    if (!env.compile_limits.within(limits.ceiling)) {
        return Error{"environment '" + env.id + "' compile limits exceed the global ceiling"};
    }

    if (auto valid = validate_environment(env); !valid) {
        return valid.error();
    }
    return env;
}

Result<std::vector<ExecutionEnvironment>> read_catalogue(const toml::table& tbl,
                                                        const LimitsConfig& limits) {
    std::vector<ExecutionEnvironment> catalogue;
    auto node = tbl["environment"];
    if (!node) return catalogue;

    const auto* arr = node.as_array();
    if (arr == nullptr) {
        return Error{"'environment' must be an array of tables ([[environment]])"};
    }
    for (const auto& element : *arr) {
        const auto* entry = element.as_table();
        if (entry == nullptr) {
            return Error{"'environment' must be an array of tables ([[environment]])"};
        }
        auto env = read_environment(*entry, limits);
        if (!env) return env.error();
        for (const auto& existing : catalogue) {
            if (existing.id == env->id) {
                return Error{"environment '" + env->id + "' is defined twice"};
            }
        }
        catalogue.push_back(std::move(*env));
    }
    return catalogue;
}

LimitsConfig read_limits_config(const toml::table& tbl) {
    LimitsConfig limits;
    if (auto section = tbl["limits"]; section.is_table()) {
        limits.defaults = read_limits(section["defaults"], limits.defaults);
        limits.ceiling = read_limits(section["ceiling"], limits.ceiling);
    }
    return limits;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.worker_count = static_cast<uint32_t>(
                engine["worker_count"].value_or(int64_t{0}));
            config.engine.queue_capacity = static_cast<uint32_t>(
                engine["queue_capacity"].value_or(int64_t{256}));
            config.engine.max_source_bytes = static_cast<uint64_t>(
                engine["max_source_bytes"].value_or(int64_t{256 * 1024}));
            config.engine.max_stdin_bytes = static_cast<uint64_t>(
                engine["max_stdin_bytes"].value_or(int64_t{1024 * 1024}));
            config.engine.max_test_cases = static_cast<uint32_t>(
                engine["max_test_cases"].value_or(int64_t{64}));
            config.engine.max_args = static_cast<uint32_t>(
                engine["max_args"].value_or(int64_t{32}));
            config.engine.result_retention = static_cast<uint32_t>(
                engine["result_retention"].value_or(int64_t{4096}));
        }

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            config.sandbox.root_dir =
                sandbox["root_dir"].value_or(config.sandbox.root_dir.string());
            config.sandbox.cgroup_root = sandbox["cgroup_root"].value_or(std::string{});
            config.sandbox.use_namespaces = sandbox["use_namespaces"].value_or(true);
            config.sandbox.require_isolation = sandbox["require_isolation"].value_or(true);
            config.sandbox.output_limit_bytes = static_cast<uint64_t>(
                sandbox["output_limit_bytes"].value_or(int64_t{64 * 1024}));
            config.sandbox.teardown_grace_ms = static_cast<uint32_t>(
                sandbox["teardown_grace_ms"].value_or(int64_t{500}));
            config.sandbox.watchdog_interval_ms = static_cast<uint32_t>(
                sandbox["watchdog_interval_ms"].value_or(int64_t{10}));
            config.sandbox.address_space_multiplier = static_cast<uint32_t>(
                sandbox["address_space_multiplier"].value_or(int64_t{0}));
            config.sandbox.search_path =
                sandbox["search_path"].value_or(config.sandbox.search_path);
        }

        // [limits], [limits.defaults], [limits.ceiling]
        config.limits = read_limits_config(tbl);
        if (!config.limits.defaults.within(config.limits.ceiling)) {
            return Error{"[limits.defaults] exceed [limits.ceiling]"};
        }

        // [notify]
        if (auto notify = tbl["notify"]; notify.is_table()) {
            config.notify.enabled = notify["enabled"].value_or(true);
            config.notify.max_attempts = static_cast<uint32_t>(
                notify["max_attempts"].value_or(int64_t{3}));
            config.notify.retry_backoff_ms = static_cast<uint32_t>(
                notify["retry_backoff_ms"].value_or(int64_t{50}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.log_to_stdout = telemetry["stdout"].value_or(true);
        }

        // [[environment]]
        auto catalogue = read_catalogue(tbl, config.limits);
        if (!catalogue) return catalogue.error();
        config.environments = std::move(*catalogue);

        if (config.engine.queue_capacity == 0) {
            return Error{"[engine] queue_capacity must be positive"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<std::vector<ExecutionEnvironment>> load_environments(const std::filesystem::path& path,
                                                            const LimitsConfig& limits) {
    if (!std::filesystem::exists(path)) {
        return Error{"Catalogue file not found: " + path.string()};
    }
    try {
        auto tbl = toml::parse_file(path.string());
        return read_catalogue(tbl, limits);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<std::vector<TestCase>> load_test_cases(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Test file not found: " + path.string()};
    }
    try {
        auto tbl = toml::parse_file(path.string());
        std::vector<TestCase> cases;

        const auto* arr = tbl["test"].as_array();
        if (arr == nullptr) {
            return Error{"test file has no [[test]] tables"};
        }
        uint32_t index = 0;
        for (const auto& element : *arr) {
            const auto* entry = element.as_table();
            if (entry == nullptr) {
                return Error{"'test' must be an array of tables ([[test]])"};
            }
            const auto& node = *entry;
            TestCase tc;
            tc.index = index++;
            tc.input = node["input"].value_or(std::string{});
            tc.expected_output = node["expected"].value_or(std::string{});
            tc.epsilon = node["epsilon"].value_or(1e-6);
            tc.points = static_cast<uint32_t>(node["points"].value_or(int64_t{1}));
            tc.hidden = node["hidden"].value_or(false);

            auto mode_text = node["mode"].value_or(std::string{"exact"});
            auto mode = parse_comparison_mode(mode_text);
            if (!mode) {
                return Error{"test " + std::to_string(tc.index) + " has unknown mode '"
                             + mode_text + "'"};
            }
            tc.mode = *mode;
            cases.push_back(std::move(tc));
        }
        return cases;
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace exec_engine
