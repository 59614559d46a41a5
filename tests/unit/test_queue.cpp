/**
 * @file test_queue.cpp
 * @brief Tests for SubmissionQueue ordering, backpressure and close.
 */

#include "queue/submission_queue.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace exec_engine;

namespace {

PendingRun make_run(const std::string& id, Priority priority = Priority::Normal) {
    auto submission = std::make_shared<Submission>();
    submission->run_id = id;
    submission->environment_id = "sh";
    submission->priority = priority;
    return PendingRun{submission, nullptr, ResourceLimits{}};
}

}  // namespace

TEST(SubmissionQueueTest, FifoWithinClass) {
    SubmissionQueue queue(8);
    ASSERT_TRUE(queue.try_push(make_run("r1")).has_value());
    ASSERT_TRUE(queue.try_push(make_run("r2")).has_value());
    ASSERT_TRUE(queue.try_push(make_run("r3")).has_value());

    std::stop_source stop;
    EXPECT_EQ(queue.pop(stop.get_token())->run_id(), "r1");
    EXPECT_EQ(queue.pop(stop.get_token())->run_id(), "r2");
    EXPECT_EQ(queue.pop(stop.get_token())->run_id(), "r3");
}

TEST(SubmissionQueueTest, HigherPriorityDequeuedFirst) {
    SubmissionQueue queue(8);
    ASSERT_TRUE(queue.try_push(make_run("low", Priority::Low)).has_value());
    ASSERT_TRUE(queue.try_push(make_run("normal", Priority::Normal)).has_value());
    ASSERT_TRUE(queue.try_push(make_run("high-1", Priority::High)).has_value());
    ASSERT_TRUE(queue.try_push(make_run("high-2", Priority::High)).has_value());

    std::stop_source stop;
    EXPECT_EQ(queue.pop(stop.get_token())->run_id(), "high-1");
    EXPECT_EQ(queue.pop(stop.get_token())->run_id(), "high-2");
    EXPECT_EQ(queue.pop(stop.get_token())->run_id(), "normal");
    EXPECT_EQ(queue.pop(stop.get_token())->run_id(), "low");
}

TEST(SubmissionQueueTest, FullQueueRejectsWithoutBlocking) {
    SubmissionQueue queue(2);
    ASSERT_TRUE(queue.try_push(make_run("r1")).has_value());
    ASSERT_TRUE(queue.try_push(make_run("r2")).has_value());

    auto start = std::chrono::steady_clock::now();
    auto third = queue.try_push(make_run("r3"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error().reason, RejectReason::QueueFull);
    EXPECT_LT(elapsed, std::chrono::milliseconds(100));
    EXPECT_EQ(queue.size(), 2u);
}

TEST(SubmissionQueueTest, OutOfRangePriorityIsRefused) {
    SubmissionQueue queue(4);
    auto pushed = queue.try_push(make_run("r1", static_cast<Priority>(5)));
    ASSERT_FALSE(pushed.has_value());
    EXPECT_EQ(pushed.error().reason, RejectReason::MalformedSubmission);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(SubmissionQueueTest, RemoveQueuedRun) {
    SubmissionQueue queue(4);
    ASSERT_TRUE(queue.try_push(make_run("r1")).has_value());
    ASSERT_TRUE(queue.try_push(make_run("r2", Priority::High)).has_value());

    auto removed = queue.remove("r2");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->run_id(), "r2");
    EXPECT_FALSE(queue.remove("r2").has_value());
    EXPECT_EQ(queue.size(), 1u);
}

TEST(SubmissionQueueTest, PopBlocksUntilPush) {
    SubmissionQueue queue(4);
    std::optional<PendingRun> popped;

    std::jthread consumer([&](std::stop_token stop) { popped = queue.pop(stop); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_TRUE(queue.try_push(make_run("late")).has_value());
    consumer.join();

    ASSERT_TRUE(popped.has_value());
    EXPECT_EQ(popped->run_id(), "late");
}

TEST(SubmissionQueueTest, PopReturnsOnStop) {
    SubmissionQueue queue(4);
    std::stop_source stop;
    std::jthread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stop.request_stop();
    });
    EXPECT_FALSE(queue.pop(stop.get_token()).has_value());
}

TEST(SubmissionQueueTest, CloseDrainsAndRefuses) {
    SubmissionQueue queue(4);
    ASSERT_TRUE(queue.try_push(make_run("r1")).has_value());
    ASSERT_TRUE(queue.try_push(make_run("r2", Priority::High)).has_value());

    auto drained = queue.close();
    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0].run_id(), "r2");
    EXPECT_TRUE(queue.closed());
    EXPECT_EQ(queue.size(), 0u);

    auto rejected = queue.try_push(make_run("r3"));
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().reason, RejectReason::ShuttingDown);

    std::stop_source stop;
    EXPECT_FALSE(queue.pop(stop.get_token()).has_value());
}
