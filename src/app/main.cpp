/**
 * @file main.cpp
 * @brief ExecEngine command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Runs one submission through the full coordinator pipeline:
 *   Config → Logger → Registry → Admission → Queue → Worker → Sandbox → Collector → Harness
 * and prints the terminal ExecutionResult as JSON on stdout.
 */

#include "coordinator/execution_coordinator.hpp"
#include "coordinator/result_codec.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "sandbox/launcher.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace exec_engine;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitRejected = 2;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string env_id;
    std::filesystem::path source_path;
    std::optional<std::filesystem::path> stdin_path;
    std::optional<std::filesystem::path> tests_path;
    std::vector<std::string> program_args;
    LimitOverrides limits;
    Priority priority = Priority::Normal;
    std::string correlation;
    std::string log_dir;
    bool list_envs = false;
};

void print_usage() {
    std::cout << "Usage: exec_engine [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --env <id>           Environment to run in\n"
              << "  --source <path>      Program source file\n"
              << "  --stdin <path>       File fed to the program's stdin\n"
              << "  --tests <path>       TOML file of [[test]] cases\n"
              << "  --arg <value>        Program argument (repeatable)\n"
              << "  --wall-ms <n>        Wall-clock limit override\n"
              << "  --cpu-ms <n>         CPU time limit override\n"
              << "  --memory-mb <n>      Memory limit override\n"
              << "  --priority <p>       low | normal | high\n"
              << "  --correlation <t>    Correlation token echoed in the result\n"
              << "  --log-dir <path>     Log output directory\n"
              << "  --list-envs          Print the environment catalogue and exit\n"
              << "  --help, -h           Show this help message\n";
}

std::optional<uint64_t> parse_u64(const std::string& text) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string{argv[++i]};
        };
        auto number = [&]() -> Result<uint64_t> {
            auto text = next();
            if (!text) return Error{arg + " needs a value"};
            auto value = parse_u64(*text);
            if (!value) return Error{arg + " expects a non-negative integer, got '" + *text + "'"};
            return *value;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitOk);
        } else if (arg == "--list-envs") {
            args.list_envs = true;
        } else if (arg == "--wall-ms" || arg == "--cpu-ms" || arg == "--memory-mb") {
            auto value = number();
            if (!value) return value.error();
            if (arg == "--wall-ms") args.limits.wall_time_ms = *value;
            if (arg == "--cpu-ms") args.limits.cpu_time_ms = *value;
            if (arg == "--memory-mb") args.limits.memory_bytes = *value * 1024 * 1024;
        } else {
            auto value = next();
            if (!value) return Error{"unknown option or missing value: " + arg};
            if (arg == "--config") {
                args.config_path = *value;
            } else if (arg == "--env") {
                args.env_id = *value;
            } else if (arg == "--source") {
                args.source_path = *value;
            } else if (arg == "--stdin") {
                args.stdin_path = *value;
            } else if (arg == "--tests") {
                args.tests_path = *value;
            } else if (arg == "--arg") {
                args.program_args.push_back(*value);
            } else if (arg == "--priority") {
                auto priority = parse_priority(*value);
                if (!priority) return Error{"unknown priority '" + *value + "'"};
                args.priority = *priority;
            } else if (arg == "--correlation") {
                args.correlation = *value;
            } else if (arg == "--log-dir") {
                args.log_dir = *value;
            } else {
                return Error{"unknown option: " + arg};
            }
        }
    }

    if (!args.list_envs && (args.env_id.empty() || args.source_path.empty())) {
        return Error{"--env and --source are required (see --help)"};
    }
    return args;
}

Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return Error{"cannot read " + path.string()};
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry) {
    std::vector<std::unique_ptr<ILogSink>> sinks;
    if (!telemetry.log_dir.empty()) {
        sinks.push_back(std::make_unique<JsonFileSink>(
            telemetry.log_dir, "exec_engine", telemetry.max_file_size_mb, telemetry.rotate_count));
    }
    if (telemetry.log_to_stdout) {
        sinks.push_back(std::make_unique<StdoutSink>());
    }
    if (sinks.empty()) return std::make_unique<NullSink>();
    return std::make_unique<TeeSink>(std::move(sinks));
}

std::unique_ptr<ILogSink> make_file_sink(const TelemetryConfig& telemetry,
                                         const std::string& prefix) {
    if (telemetry.log_dir.empty()) return std::make_unique<NullSink>();
    return std::make_unique<JsonFileSink>(telemetry.log_dir, prefix,
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

Result<Submission> build_submission(const CLIArgs& args) {
    Submission submission;
    submission.environment_id = args.env_id;
    submission.args = args.program_args;
    submission.limits = args.limits;
    submission.priority = args.priority;
    submission.correlation_token = args.correlation;

    auto source = read_file(args.source_path);
    if (!source) return source.error();
    submission.source_code = std::move(*source);

    if (args.stdin_path) {
        auto input = read_file(*args.stdin_path);
        if (!input) return input.error();
        submission.stdin_data = std::move(*input);
    }
    if (args.tests_path) {
        auto cases = load_test_cases(*args.tests_path);
        if (!cases) return cases.error();
        submission.test_cases = std::move(*cases);
    }
    return submission;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << "exec_engine: " << args.error().message << std::endl;
        return kExitConfigError;
    }

    // Load configuration
    auto config_result = load_config(args->config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return kExitConfigError;
    }
    auto config = std::move(*config_result);
    if (!args->log_dir.empty()) config.telemetry.log_dir = args->log_dir;

    if (args->list_envs) {
        for (const auto& env : config.environments) {
            std::cout << ResultCodec::encode_environment(env) << '\n';
        }
        return kExitOk;
    }

    auto submission = build_submission(*args);
    if (!submission) {
        std::cerr << "exec_engine: " << submission.error().message << std::endl;
        return kExitConfigError;
    }

    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    // Largest possible run: every test at the ceiling wall time, plus compile and teardown.
    size_t sandboxes = submission->test_cases.size() + 2;
    auto budget = std::chrono::milliseconds(
        config.limits.ceiling.wall_time_ms + config.sandbox.teardown_grace_ms) * sandboxes;

    ExecutionCoordinator<LinuxSandboxLauncher>::Options options{
        .config = config,
        .log_sink = make_log_sink(config.telemetry),
        .log_level = level,
        .metrics_sink = make_file_sink(config.telemetry, "metrics"),
        .store = nullptr,
        .events = std::make_unique<SinkEventChannel>(make_file_sink(config.telemetry, "events")),
    };

    std::unique_ptr<ExecutionCoordinator<LinuxSandboxLauncher>> coordinator;
    try {
        coordinator = std::make_unique<ExecutionCoordinator<LinuxSandboxLauncher>>(std::move(options));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize engine: " << e.what() << std::endl;
        return kExitConfigError;
    }

    if (auto started = coordinator->start(); !started) {
        std::cerr << "Failed to start engine: " << started.error().message << std::endl;
        return kExitConfigError;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto run_id = coordinator->submit(std::move(*submission));
    if (!run_id) {
        std::cout << ResultCodec::encode_rejection(run_id.error()) << std::endl;
        coordinator->shutdown();
        return kExitRejected;
    }

    // Poll so a signal can turn into a cancel of the run.
    auto deadline = std::chrono::steady_clock::now() + budget;
    std::optional<ExecutionResult> result;
    bool cancel_sent = false;
    while (!result) {
        auto waited = coordinator->wait(*run_id, std::chrono::milliseconds(100));
        if (waited) {
            result = std::move(*waited);
            break;
        }
        if ((g_shutdown_requested || std::chrono::steady_clock::now() > deadline) && !cancel_sent) {
            if (auto cancelled = coordinator->cancel(*run_id); !cancelled) {
                coordinator->logger().error("cancel failed",
                                            {{"run", *run_id},
                                             {"error", cancelled.error().message}});
            }
            cancel_sent = true;
        }
    }

    std::cout << ResultCodec::encode_result(*result) << std::endl;
    coordinator->shutdown();
    return kExitOk;
}
