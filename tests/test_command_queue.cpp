// =============================================================================
// Unit tests for CommandQueue (src/command_queue.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "command_queue.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tapdeck;
using namespace tapdeck::testing_support;
using namespace std::chrono;

namespace {

template<typename Pred>
bool waitFor(Pred pred, milliseconds timeout = milliseconds(3000)) {
    auto until = steady_clock::now() + timeout;
    while (steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(5));
    }
    return pred();
}

class Recorder {
public:
    std::function<void()> add(const std::string& name) {
        return [this, name] {
            std::lock_guard<std::mutex> lock(mutex_);
            order_.push_back(name);
        };
    }
    std::vector<std::string> order() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> order_;
};

} // namespace

// ---------------------------------------------------------------------------
// Worker mode
// ---------------------------------------------------------------------------
TEST(CommandQueueTest, WorkerRunsInSubmissionOrder) {
    auto sink = std::make_shared<RecordingSink>();
    CommandQueue q(sink, "phone");
    Recorder rec;

    std::mutex producer_mutex;
    int next = 0;
    const std::vector<std::string> names = {"A", "B", "C"};
    std::vector<std::thread> producers;
    for (int i = 0; i < 3; ++i) {
        producers.emplace_back([&] {
            std::lock_guard<std::mutex> lock(producer_mutex);
            const std::string& n = names[next++];
            q.queueCommand(rec.add(n), n);
        });
    }
    for (auto& t : producers) t.join();

    ASSERT_TRUE(waitFor([&] { return rec.order().size() == 3; }));
    EXPECT_EQ(rec.order(), names);
    EXPECT_TRUE(q.workerRunning());
    EXPECT_TRUE(sink->contains("A"));
}

TEST(CommandQueueTest, WorkerSurvivesFailingCommand) {
    auto sink = std::make_shared<RecordingSink>();
    CommandQueue q(sink);
    Recorder rec;

    q.queueCommand([] { throw std::runtime_error("boom"); }, "bad tap");
    q.queueCommand(rec.add("after"), "good tap");

    ASSERT_TRUE(waitFor([&] { return rec.order().size() == 1; }));
    EXPECT_TRUE(sink->contains("Command error: boom"));
    EXPECT_TRUE(q.workerRunning());
}

TEST(CommandQueueTest, StopJoinsWorkerAndRestartWorks) {
    CommandQueue q;
    Recorder rec;
    q.queueCommand(rec.add("first"));
    ASSERT_TRUE(waitFor([&] { return rec.order().size() == 1; }));

    q.stop();
    EXPECT_FALSE(q.workerRunning());

    q.queueCommand(rec.add("second"));
    ASSERT_TRUE(waitFor([&] { return rec.order().size() == 2; }));
    EXPECT_EQ(rec.order().back(), "second");
    EXPECT_EQ(q.size(), 0u);
}

TEST(CommandQueueTest, StopOnIdleQueueIsNoop) {
    CommandQueue q;
    q.stop();
    q.stop();
    EXPECT_FALSE(q.workerRunning());
    EXPECT_EQ(q.size(), 0u);
}

// ---------------------------------------------------------------------------
// Inline drain
// ---------------------------------------------------------------------------
TEST(CommandQueueTest, InlineModeDoesNotStartWorker) {
    CommandQueue q;
    q.setInlineDrain(true);
    Recorder rec;
    q.queueCommand(rec.add("x"), "x");

    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_FALSE(q.workerRunning());
    EXPECT_TRUE(rec.order().empty());
    EXPECT_EQ(q.size(), 1u);
}

TEST(CommandQueueTest, DrainRunsEverythingOnCallingThread) {
    auto sink = std::make_shared<RecordingSink>();
    CommandQueue q(sink);
    q.setInlineDrain(true);

    const auto caller = std::this_thread::get_id();
    std::vector<std::thread::id> seen;
    Recorder rec;
    for (const char* n : {"tap 1", "tap 2", "tap 3"}) {
        auto record = rec.add(n);
        q.queueCommand([&seen, record] { seen.push_back(std::this_thread::get_id()); record(); }, n);
    }

    q.drainNow();
    EXPECT_EQ(rec.order(), (std::vector<std::string>{"tap 1", "tap 2", "tap 3"}));
    for (const auto& id : seen) EXPECT_EQ(id, caller);
    EXPECT_EQ(q.size(), 0u);
    EXPECT_TRUE(q.info().commands.empty());
    EXPECT_TRUE(sink->contains("[CMD] tap 2"));
}

// Actions that run the stop check themselves (remote taps through Bot) must
// not pull the next item ahead of their own work.
TEST(CommandQueueTest, NestedDrainKeepsSubmissionOrder) {
    CommandQueue q;
    q.setInlineDrain(true);

    Recorder rec;
    std::vector<bool> saw_draining;
    for (const char* n : {"A", "B", "C"}) {
        auto record = rec.add(n);
        q.queueCommand([&q, &saw_draining, record] {
            saw_draining.push_back(q.draining());
            if (q.inlineDrain() && q.size() > 0) q.drainNow();
            record();
        }, n);
    }

    q.drainNow();
    EXPECT_EQ(rec.order(), (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(saw_draining, (std::vector<bool>{true, true, true}));
    EXPECT_FALSE(q.draining());
    EXPECT_EQ(q.size(), 0u);
}

TEST(CommandQueueTest, DrainGuardReleasedAfterStopSignal) {
    CommandQueue q;
    q.setInlineDrain(true);
    q.queueCommand([] { throw StopSignal(StopSignal::Reason::UserStop, "stop"); }, "stop");
    EXPECT_THROW(q.drainNow(), StopSignal);
    EXPECT_FALSE(q.draining());

    Recorder rec;
    q.queueCommand(rec.add("after"), "after");
    q.drainNow();
    EXPECT_EQ(rec.order(), (std::vector<std::string>{"after"}));
}

TEST(CommandQueueTest, DrainOnEmptyQueueReturnsImmediately) {
    CommandQueue q;
    q.setInlineDrain(true);
    auto start = steady_clock::now();
    q.drainNow();
    q.drainNow();
    EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - start).count(), 50);
    EXPECT_EQ(q.size(), 0u);
}

TEST(CommandQueueTest, DrainLogsCommandErrorsAndContinues) {
    auto sink = std::make_shared<RecordingSink>();
    CommandQueue q(sink);
    q.setInlineDrain(true);
    Recorder rec;

    q.queueCommand([] { throw std::runtime_error("swipe failed"); }, "swipe");
    q.queueCommand(rec.add("next"), "next");

    EXPECT_NO_THROW(q.drainNow());
    EXPECT_EQ(rec.order().size(), 1u);
    EXPECT_TRUE(sink->contains("[CMD] Error: swipe failed"));
}

TEST(CommandQueueTest, DrainPropagatesStopSignal) {
    CommandQueue q;
    q.setInlineDrain(true);
    Recorder rec;

    q.queueCommand([] { throw StopSignal(StopSignal::Reason::UserStop, "stop"); }, "stopper");
    q.queueCommand(rec.add("later"), "later");

    EXPECT_THROW(q.drainNow(), StopSignal);
    EXPECT_TRUE(rec.order().empty());
    EXPECT_EQ(q.size(), 1u);
    EXPECT_EQ(q.info().commands.size(), 1u);
}

TEST(CommandQueueTest, DrainDiscardsStaleSentinel) {
    CommandQueue q;
    Recorder rec;
    q.queueCommand(rec.add("warmup"));
    ASSERT_TRUE(waitFor([&] { return rec.order().size() == 1; }));
    q.stop();

    q.setInlineDrain(true);
    q.queueCommand(rec.add("inline"), "inline");
    q.drainNow();
    EXPECT_EQ(rec.order().back(), "inline");
    EXPECT_EQ(q.size(), 0u);
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------
TEST(CommandQueueTest, TimestampHistoryIsCapped) {
    CommandQueue q;
    q.setInlineDrain(true);
    for (int i = 0; i < 60; ++i) {
        q.queueCommand([] {}, "cmd " + std::to_string(i));
    }

    CommandQueueInfo info = q.info();
    EXPECT_EQ(info.queue_size, 60u);
    ASSERT_EQ(info.commands.size(), CommandQueue::kMaxTimestamps);
    EXPECT_EQ(info.commands.front().description, "cmd 10");
    EXPECT_EQ(info.commands.back().description, "cmd 59");
    EXPECT_EQ(info.commands.front().queued_at.size(), 8u);  // HH:MM:SS
    EXPECT_GE(info.commands.front().delay_seconds, 0.0);
}

TEST(CommandQueueTest, UnnamedCommandListedAsUnknown) {
    CommandQueue q;
    q.setInlineDrain(true);
    q.queueCommand([] {});
    ASSERT_EQ(q.info().commands.size(), 1u);
    EXPECT_EQ(q.info().commands[0].description, "Unknown command");
}

TEST(CommandQueueTest, PublishesQueuedEvent) {
    std::vector<CommandQueuedEvent> events;
    auto sub = bus().subscribe<CommandQueuedEvent>(
        [&](const CommandQueuedEvent& e) { events.push_back(e); });

    CommandQueue q(nullptr, "tablet");
    q.setInlineDrain(true);
    q.queueCommand([] {}, "tap 5 5");
    q.queueCommand([] {}, "tap 6 6");

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].device, "tablet");
    EXPECT_EQ(events[1].description, "tap 6 6");
    EXPECT_EQ(events[1].queue_size, 2u);
}
