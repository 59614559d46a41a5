/**
 * @file test_run_executor.cpp
 * @brief Tests for compile/run/test sequencing against a scripted launcher.
 */

#include "executor/run_executor.hpp"

#include "sandbox/launcher.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <csignal>
#include <stdexcept>
#include <thread>

using namespace exec_engine;

namespace {

bool ends_with(const std::string& text, std::string_view suffix) {
    return text.size() >= suffix.size()
        && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::shared_ptr<const ExecutionEnvironment> interpreted_env() {
    auto env = std::make_shared<ExecutionEnvironment>();
    env->id = "python3.11";
    env->source_file = "main.py";
    env->run_command = {"python3", "{source}"};
    return env;
}

std::shared_ptr<const ExecutionEnvironment> compiled_env() {
    auto env = std::make_shared<ExecutionEnvironment>();
    env->id = "cpp17";
    env->source_file = "main.cpp";
    env->artifact = "main";
    env->compile_command = {"g++", "-o", "{artifact}", "{source}"};
    env->run_command = {"./{artifact}"};
    env->compile_limits.wall_time_ms = 20'000;
    return env;
}

}  // namespace

class RunExecutorTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    MetricsCollector metrics_{std::make_unique<NullSink>()};
    SandboxSlots slots_{2};
    ScriptedLauncher launcher_{SandboxOptions{}, logger_, metrics_};
    RunExecutor executor_{[this](const SandboxSpec& spec, std::stop_token stop) {
                              return launcher_.launch(spec, stop);
                          },
                          slots_, logger_};

    PendingRun make_run(std::shared_ptr<const ExecutionEnvironment> env,
                        std::vector<TestCase> tests = {}) {
        auto submission = std::make_shared<Submission>();
        submission->run_id = "r1";
        submission->environment_id = env->id;
        submission->source_code = "source text";
        submission->stdin_data = "input";
        submission->args = {"--flag"};
        submission->test_cases = std::move(tests);
        return PendingRun{submission, std::move(env), ResourceLimits{}};
    }

    ExecutionResult execute(const PendingRun& run) {
        std::stop_source stop;
        return executor_.execute(run, stop.get_token());
    }
};

TEST_F(RunExecutorTest, InterpretedSingleRun) {
    launcher_.set_script([](const SandboxSpec&, std::stop_token) -> Result<SandboxReport> {
        return ScriptedLauncher::exited(0, "1\n");
    });

    auto result = execute(make_run(interpreted_env()));
    EXPECT_EQ(result.state, RunState::Completed);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_data, "1\n");
    EXPECT_FALSE(result.tests.has_value());

    auto specs = launcher_.launched();
    ASSERT_EQ(specs.size(), 1u);
    EXPECT_EQ(specs[0].label, "r1");
    EXPECT_EQ(specs[0].argv, (std::vector<std::string>{"python3", "main.py", "--flag"}));
    EXPECT_EQ(specs[0].stdin_data, "input");
    ASSERT_EQ(specs[0].files.size(), 1u);
    EXPECT_EQ(specs[0].files[0].name, "main.py");
    EXPECT_EQ(specs[0].files[0].content, "source text");
    EXPECT_EQ(specs[0].env.front(), kSandboxPath);
    EXPECT_EQ(slots_.live(), 0u);
}

TEST_F(RunExecutorTest, CompileThenRunWithArtifact) {
    launcher_.set_script([](const SandboxSpec& spec, std::stop_token) -> Result<SandboxReport> {
        if (ends_with(spec.label, "-compile")) {
            auto report = ScriptedLauncher::exited(0);
            report.collected_file = "binary-bytes";
            return report;
        }
        return ScriptedLauncher::exited(0, "ok");
    });

    auto env = compiled_env();
    auto result = execute(make_run(env));
    EXPECT_EQ(result.state, RunState::Completed);
    EXPECT_EQ(result.stdout_data, "ok");

    auto specs = launcher_.launched();
    ASSERT_EQ(specs.size(), 2u);
    EXPECT_EQ(specs[0].label, "r1-compile");
    EXPECT_EQ(specs[0].argv, (std::vector<std::string>{"g++", "-o", "main", "main.cpp"}));
    EXPECT_EQ(specs[0].collect_file, "main");
    EXPECT_EQ(specs[0].limits, env->compile_limits);

    EXPECT_EQ(specs[1].argv, (std::vector<std::string>{"./main", "--flag"}));
    ASSERT_EQ(specs[1].files.size(), 2u);
    EXPECT_EQ(specs[1].files[1].name, "main");
    EXPECT_EQ(specs[1].files[1].content, "binary-bytes");
    EXPECT_TRUE(specs[1].files[1].executable);
}

TEST_F(RunExecutorTest, CompileErrorSkipsRun) {
    launcher_.set_script([](const SandboxSpec&, std::stop_token) -> Result<SandboxReport> {
        return ScriptedLauncher::exited(1, "", "main.cpp:1: error");
    });

    auto result = execute(make_run(compiled_env()));
    EXPECT_EQ(result.state, RunState::CrashFailed);
    EXPECT_EQ(result.failure_kind, FailureKind::CompileError);
    EXPECT_EQ(result.stderr_data, "main.cpp:1: error");
    EXPECT_EQ(launcher_.launch_count(), 1u);
}

TEST_F(RunExecutorTest, TestsRunOnePerSandbox) {
    launcher_.set_script([](const SandboxSpec& spec, std::stop_token) -> Result<SandboxReport> {
        return ScriptedLauncher::exited(0, spec.stdin_data);
    });

    std::vector<TestCase> tests = {
        TestCase{.index = 0, .input = "a", .expected_output = "a"},
        TestCase{.index = 1, .input = "b", .expected_output = "not b"},
        TestCase{.index = 2, .input = "c", .expected_output = "c"},
    };
    auto result = execute(make_run(interpreted_env(), tests));

    EXPECT_EQ(result.state, RunState::Completed);
    ASSERT_TRUE(result.tests.has_value());
    EXPECT_EQ(result.tests->verdict, Verdict::SomeFailed);
    EXPECT_EQ(result.tests->failing, (std::vector<uint32_t>{1}));
    EXPECT_EQ(result.stdout_data, "c");
    EXPECT_EQ(result.cpu_time_ms, 6u);

    auto specs = launcher_.launched();
    ASSERT_EQ(specs.size(), 3u);
    EXPECT_EQ(specs[0].label, "r1-t0");
    EXPECT_EQ(specs[2].label, "r1-t2");
    EXPECT_EQ(specs[1].stdin_data, "b");
}

TEST_F(RunExecutorTest, CrashingTestStopsTheRest) {
    launcher_.set_script([](const SandboxSpec& spec, std::stop_token) -> Result<SandboxReport> {
        if (spec.stdin_data == "b") return ScriptedLauncher::signaled(SIGSEGV);
        return ScriptedLauncher::exited(0, spec.stdin_data);
    });

    std::vector<TestCase> tests = {
        TestCase{.index = 0, .input = "a", .expected_output = "a"},
        TestCase{.index = 1, .input = "b", .expected_output = "b"},
        TestCase{.index = 2, .input = "c", .expected_output = "c"},
    };
    auto result = execute(make_run(interpreted_env(), tests));

    EXPECT_EQ(result.state, RunState::CrashFailed);
    EXPECT_EQ(result.failure_kind, FailureKind::Crash);
    EXPECT_FALSE(result.exit_code.has_value());
    ASSERT_TRUE(result.tests.has_value());
    EXPECT_EQ(result.tests->verdict, Verdict::Errored);
    EXPECT_EQ(launcher_.launch_count(), 2u);
}

TEST_F(RunExecutorTest, LaunchErrorIsSystemError) {
    launcher_.set_script([](const SandboxSpec&, std::stop_token) -> Result<SandboxReport> {
        return Error{"clone failed"};
    });

    auto result = execute(make_run(interpreted_env()));
    EXPECT_EQ(result.state, RunState::CrashFailed);
    EXPECT_EQ(result.failure_kind, FailureKind::SystemError);
    EXPECT_EQ(result.failure_detail, "clone failed");
}

TEST_F(RunExecutorTest, LaunchExceptionIsSystemError) {
    launcher_.set_script([](const SandboxSpec&, std::stop_token) -> Result<SandboxReport> {
        throw std::runtime_error("boom");
    });

    auto result = execute(make_run(interpreted_env()));
    EXPECT_EQ(result.failure_kind, FailureKind::SystemError);
    EXPECT_EQ(result.failure_detail, "sandbox launch threw: boom");
    EXPECT_EQ(slots_.live(), 0u);
}

TEST_F(RunExecutorTest, StopBeforeStartLaunchesNothing) {
    std::stop_source stop;
    stop.request_stop();
    auto result = executor_.execute(make_run(interpreted_env()), stop.get_token());
    EXPECT_EQ(result.state, RunState::Cancelled);
    EXPECT_EQ(launcher_.launch_count(), 0u);
}

TEST_F(RunExecutorTest, StopWhileRunningCancels) {
    launcher_.set_script([](const SandboxSpec&, std::stop_token stop) -> Result<SandboxReport> {
        return ScriptedLauncher::hold_until_stopped(stop);
    });

    std::stop_source stop;
    std::jthread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stop.request_stop();
    });
    auto result = executor_.execute(make_run(interpreted_env()), stop.get_token());
    EXPECT_EQ(result.state, RunState::Cancelled);
    EXPECT_EQ(result.failure_kind, FailureKind::Cancelled);
}

TEST(SandboxEnvironmentTest, OverridesAndAppends) {
    ExecutionEnvironment env;
    env.env_vars = {"LANG=en_US.UTF-8", "PYTHONHASHSEED=0"};

    auto vars = sandbox_environment(env);
    EXPECT_NE(std::find(vars.begin(), vars.end(), "LANG=en_US.UTF-8"), vars.end());
    EXPECT_EQ(std::find(vars.begin(), vars.end(), "LANG=C.UTF-8"), vars.end());
    EXPECT_EQ(vars.back(), "PYTHONHASHSEED=0");
    EXPECT_EQ(vars.front(), kSandboxPath);
}
