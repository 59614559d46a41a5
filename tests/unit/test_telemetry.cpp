/**
 * @file test_telemetry.cpp
 * @brief Tests for log sinks, the logger, metrics, JSON encoding and run events.
 */

#include "coordinator/event_channel.hpp"
#include "coordinator/result_codec.hpp"
#include "core/json.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace exec_engine;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

ExecutionResult sample_result() {
    ExecutionResult result;
    result.run_id = "run-1-1";
    result.environment_id = "python3.11";
    result.correlation_token = "corr-7";
    result.state = RunState::Completed;
    result.exit_code = 0;
    result.stdout_data = "line one\n\"quoted\"";
    result.cpu_time_ms = 12;
    result.wall_time_ms = 30;
    result.peak_memory_bytes = 2048;
    return result;
}

}  // namespace

// ═══════════════════════════════════════════════
// JSON helpers
// ═══════════════════════════════════════════════

TEST(JsonTest, EscapesControlCharacters) {
    EXPECT_EQ(json_escape("a\"b\\c\n"), "a\\\"b\\\\c\\n");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
    EXPECT_EQ(json_quote("x"), "\"x\"");
}

TEST(JsonTest, TimestampIsUtcWithMillis) {
    Timestamp ts{std::chrono::milliseconds(1'500)};
    EXPECT_EQ(format_timestamp(ts), "1970-01-01T00:00:01.500Z");
}

// ═══════════════════════════════════════════════
// Sinks and Logger
// ═══════════════════════════════════════════════

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ee_test_sink";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(JsonFileSinkTest, WritesOneLinePerRecord) {
    JsonFileSink sink(temp_dir_, "engine");
    sink.write(R"({"a":1})");
    sink.write(R"({"b":2})");
    sink.flush();
    EXPECT_EQ(read_file(sink.active_path()), "{\"a\":1}\n{\"b\":2}\n");
}

TEST_F(JsonFileSinkTest, RotatesAndCapsArchives) {
    JsonFileSink sink(temp_dir_, "engine", 50, 2);
    sink.set_max_file_size_bytes(10);

    sink.write("first-line-xx");
    sink.write("second-line-x");
    sink.write("third-line-xx");
    sink.write("fourth-line-x");
    sink.flush();

    EXPECT_EQ(read_file(sink.active_path()), "fourth-line-x\n");
    EXPECT_EQ(read_file(sink.archive_path(1)), "third-line-xx\n");
    EXPECT_EQ(read_file(sink.archive_path(2)), "second-line-x\n");
    EXPECT_FALSE(std::filesystem::exists(sink.archive_path(3)));
}

TEST(TeeSinkTest, FansOut) {
    auto a = std::make_unique<MemorySink>();
    auto b = std::make_unique<MemorySink>();
    auto* a_ptr = a.get();
    auto* b_ptr = b.get();

    std::vector<std::unique_ptr<ILogSink>> sinks;
    sinks.push_back(std::move(a));
    sinks.push_back(std::move(b));
    TeeSink tee(std::move(sinks));
    tee.write("x");

    EXPECT_EQ(a_ptr->lines().size(), 1u);
    EXPECT_EQ(b_ptr->lines().size(), 1u);
}

TEST(LoggerTest, EmitsStructuredFields) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    Logger logger(std::move(sink), LogLevel::Info);

    logger.info("run finished", {{"run", "run-1-1"}, {"state", "completed"}});

    ASSERT_EQ(lines->lines().size(), 1u);
    const auto& line = lines->lines()[0];
    EXPECT_TRUE(contains(line, R"("level":"info")"));
    EXPECT_TRUE(contains(line, R"("msg":"run finished")"));
    EXPECT_TRUE(contains(line, R"("run":"run-1-1")"));
    EXPECT_TRUE(contains(line, R"("state":"completed")"));
    EXPECT_TRUE(contains(line, R"("ts":")"));
    EXPECT_EQ(line.back(), '}');
}

TEST(LoggerTest, FiltersBelowLevel) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");
    EXPECT_EQ(lines->lines().size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("d");
    EXPECT_EQ(lines->lines().size(), 3u);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

// ═══════════════════════════════════════════════
// MetricsCollector
// ═══════════════════════════════════════════════

TEST(MetricsCollectorTest, RecordsRunLifecycle) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    MetricsCollector metrics(std::move(sink));

    metrics.record_submission("run-1-1", "python3.11", Priority::High, 3);
    metrics.record_run_started("run-1-1", Duration{250});
    auto result = sample_result();
    result.state = RunState::TimedOut;
    result.failure_kind = FailureKind::Timeout;
    metrics.record_run_finished(result);
    metrics.record_rejection("nope", Rejection{RejectReason::UnknownEnvironment, "nope"});

    auto all = lines->lines();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_TRUE(contains(all[0], R"("event":"submission_admitted")"));
    EXPECT_TRUE(contains(all[0], R"("queue_depth":3)"));
    EXPECT_TRUE(contains(all[1], R"("queued_us":250)"));
    EXPECT_TRUE(contains(all[2], R"("state":"timed_out")"));
    EXPECT_TRUE(contains(all[2], R"("failure":"timeout")"));
    EXPECT_TRUE(contains(all[3], R"("reason":"unknown_environment")"));
}

// ═══════════════════════════════════════════════
// ResultCodec
// ═══════════════════════════════════════════════

TEST(ResultCodecTest, EncodesResult) {
    auto json = ResultCodec::encode_result(sample_result());
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_TRUE(contains(json, R"("run_id":"run-1-1")"));
    EXPECT_TRUE(contains(json, R"("state":"completed")"));
    EXPECT_TRUE(contains(json, R"("exit_code":0)"));
    EXPECT_TRUE(contains(json, R"("failure_kind":null)"));
    EXPECT_TRUE(contains(json, R"("stdout":"line one\n\"quoted\"")"));
    EXPECT_TRUE(contains(json, R"("tests":null)"));
    EXPECT_EQ(json.find('\n'), std::string::npos);
}

TEST(ResultCodecTest, CrashHasNullExitCode) {
    auto result = sample_result();
    result.state = RunState::CrashFailed;
    result.exit_code.reset();
    result.failure_kind = FailureKind::Crash;
    result.failure_detail = "terminated by segmentation fault";

    auto json = ResultCodec::encode_result(result);
    EXPECT_TRUE(contains(json, R"("exit_code":null)"));
    EXPECT_TRUE(contains(json, R"("failure_kind":"crash")"));
}

TEST(ResultCodecTest, EncodesTestReport) {
    TestReport report;
    report.verdict = Verdict::SomeFailed;
    report.failing = {1};
    report.points_earned = 1;
    report.points_possible = 2;
    TestCaseResult hidden;
    hidden.index = 1;
    hidden.status = TestStatus::Failed;
    hidden.hidden = true;
    report.cases.push_back(hidden);

    auto json = ResultCodec::encode_test_report(report);
    EXPECT_TRUE(contains(json, R"("verdict":"some_failed")"));
    EXPECT_TRUE(contains(json, R"("failing":[1])"));
    EXPECT_TRUE(contains(json, R"("actual_output":null)"));
}

TEST(ResultCodecTest, EncodesEventAndRejection) {
    auto event = ResultCodec::encode_event(sample_result());
    EXPECT_EQ(event.rfind(R"({"event":"run_terminal")", 0), 0u);
    EXPECT_TRUE(contains(event, R"("result":{"run_id":"run-1-1")"));

    auto rejected = ResultCodec::encode_rejection(
        Rejection{RejectReason::QueueFull, "queue is full"});
    EXPECT_EQ(rejected, R"({"rejected":"queue_full","detail":"queue is full"})");
}

TEST(ResultCodecTest, EncodesEnvironment) {
    ExecutionEnvironment env;
    env.id = "cpp17";
    env.display_name = "C++17";
    env.compile_command = {"g++", "{source}"};
    env.artifact = "main";
    env.run_command = {"./{artifact}"};

    auto json = ResultCodec::encode_environment(env);
    EXPECT_TRUE(contains(json, R"("id":"cpp17")"));
    EXPECT_TRUE(contains(json, R"("compiled":true)"));
    EXPECT_TRUE(contains(json, R"("status":"active")"));
}

// ═══════════════════════════════════════════════
// Run events
// ═══════════════════════════════════════════════

namespace {

class FlakyChannel : public IRunEventChannel {
public:
    explicit FlakyChannel(int failures) : failures_left_(failures) {}

    Result<void> publish(const ExecutionResult& /*result*/) override {
        ++attempts;
        if (failures_left_.fetch_sub(1) > 0) return Error{"broker unavailable"};
        ++published;
        return {};
    }

    std::atomic<int> attempts{0};
    std::atomic<int> published{0};

private:
    std::atomic<int> failures_left_;
};

}  // namespace

TEST(EventDispatcherTest, RetriesUntilDelivered) {
    FlakyChannel channel(2);
    Logger logger(std::make_unique<NullSink>());
    EventDispatcher dispatcher(channel, NotifyConfig{.max_attempts = 3, .retry_backoff_ms = 1},
                               logger);

    dispatcher.enqueue(sample_result());
    dispatcher.stop();

    EXPECT_EQ(channel.attempts.load(), 3);
    EXPECT_EQ(channel.published.load(), 1);
    EXPECT_EQ(dispatcher.delivered(), 1u);
    EXPECT_EQ(dispatcher.dropped(), 0u);
}

TEST(EventDispatcherTest, DropsAfterMaxAttempts) {
    FlakyChannel channel(100);
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    Logger logger(std::move(sink));
    EventDispatcher dispatcher(channel, NotifyConfig{.max_attempts = 2, .retry_backoff_ms = 1},
                               logger);

    dispatcher.enqueue(sample_result());
    dispatcher.stop();

    EXPECT_EQ(channel.attempts.load(), 2);
    EXPECT_EQ(dispatcher.dropped(), 1u);
    auto all = lines->lines();
    ASSERT_FALSE(all.empty());
    EXPECT_TRUE(contains(all.back(), R"("msg":"run event dropped")"));
}

TEST(EventDispatcherTest, StopDrainsPending) {
    FlakyChannel channel(0);
    Logger logger(std::make_unique<NullSink>());
    EventDispatcher dispatcher(channel, NotifyConfig{}, logger);

    for (int i = 0; i < 10; ++i) {
        auto result = sample_result();
        result.run_id = "run-1-" + std::to_string(i);
        dispatcher.enqueue(std::move(result));
    }
    dispatcher.stop();
    EXPECT_EQ(dispatcher.delivered(), 10u);
}

TEST(SinkEventChannelTest, WritesTerminalEvent) {
    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    SinkEventChannel channel(std::move(sink));

    ASSERT_TRUE(channel.publish(sample_result()).has_value());
    ASSERT_EQ(lines->lines().size(), 1u);
    EXPECT_TRUE(contains(lines->lines()[0], R"("event":"run_terminal")"));
}
