// =============================================================================
// Unit tests for TimeoutExecutor (src/timeout_executor.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "timeout_executor.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace tapdeck;
using namespace std::chrono;

TEST(TimeoutExecutorTest, ReturnsValue) {
    TimeoutExecutor exec(2);
    int v = exec.run([] { return 41 + 1; }, "answer", 1.0);
    EXPECT_EQ(v, 42);
}

TEST(TimeoutExecutorTest, VoidCall) {
    TimeoutExecutor exec(1);
    std::atomic<bool> ran{false};
    exec.run([&] { ran = true; }, "void_call", 1.0);
    EXPECT_TRUE(ran.load());
}

TEST(TimeoutExecutorTest, ExceptionPropagatesUnchanged) {
    TimeoutExecutor exec(1);
    EXPECT_THROW(exec.run([]() -> int { throw std::invalid_argument("bad"); }, "throws", 1.0),
                 std::invalid_argument);
}

TEST(TimeoutExecutorTest, TimeoutCarriesOperationName) {
    TimeoutExecutor exec(1);
    try {
        exec.run([] { std::this_thread::sleep_for(milliseconds(300)); }, "screencap", 0.05);
        FAIL() << "expected TimeoutError";
    } catch (const TimeoutError& e) {
        EXPECT_EQ(e.operation(), "screencap");
        EXPECT_DOUBLE_EQ(e.deadlineSeconds(), 0.05);
        EXPECT_NE(std::string(e.what()).find("screencap timed out"), std::string::npos);
    }
    EXPECT_EQ(exec.abandonedCount(), 1u);
}

TEST(TimeoutExecutorTest, TimeoutReturnsPromptly) {
    TimeoutExecutor exec(1);
    auto start = steady_clock::now();
    EXPECT_THROW(exec.run([] { std::this_thread::sleep_for(milliseconds(500)); }, "hang", 0.05),
                 TimeoutError);
    EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - start).count(), 400);
}

// A hung call occupies one worker; the rest keep serving.
TEST(TimeoutExecutorTest, HungCallDoesNotBlockOtherWorkers) {
    TimeoutExecutor exec(2);
    EXPECT_THROW(exec.run([] { std::this_thread::sleep_for(milliseconds(400)); }, "hang", 0.02),
                 TimeoutError);

    auto start = steady_clock::now();
    int v = exec.run([] { return 7; }, "quick", 1.0);
    EXPECT_EQ(v, 7);
    EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - start).count(), 200);
}

// The abandoned call still runs to completion (at-least-once).
TEST(TimeoutExecutorTest, AbandonedCallStillCompletes) {
    std::atomic<bool> finished{false};
    {
        TimeoutExecutor exec(1);
        EXPECT_THROW(exec.run([&] {
            std::this_thread::sleep_for(milliseconds(100));
            finished = true;
        }, "slow", 0.01), TimeoutError);
        EXPECT_FALSE(finished.load());
    }
    // Destructor joined the worker
    EXPECT_TRUE(finished.load());
}

TEST(TimeoutExecutorTest, WorkerCountFloor) {
    TimeoutExecutor exec(0);
    EXPECT_EQ(exec.workerCount(), 1);
    TimeoutExecutor exec4;
    EXPECT_EQ(exec4.workerCount(), TimeoutExecutor::kDefaultWorkers);
}

TEST(TimeoutExecutorTest, ConcurrentCallers) {
    TimeoutExecutor exec(4);
    std::atomic<int> sum{0};
    std::vector<std::thread> threads;
    for (int i = 1; i <= 8; ++i) {
        threads.emplace_back([&, i] { sum += exec.run([i] { return i; }, "add", 2.0); });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(sum.load(), 36);
}
