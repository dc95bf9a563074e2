// =============================================================================
// Tapdeck - Command Queue
// =============================================================================
// FIFO of externally injected actions (remote taps, swipes, skip requests) for
// one automation instance. Actions run one at a time in submission order,
// either on a lazily started worker thread or inline from the automation
// loop's stop check (drainNow), never both at once for the same item.
// =============================================================================
#pragma once

#include "log_sink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tapdeck {

struct QueuedCommand {
    std::function<void()> action;
    std::string description;
    std::chrono::system_clock::time_point queued_at;
};

struct CommandQueueInfo {
    struct Entry {
        std::string description;
        std::string queued_at;     // HH:MM:SS
        double delay_seconds = 0;  // time spent waiting so far
    };
    size_t queue_size = 0;
    std::vector<Entry> commands;
};

class CommandQueue {
public:
    static constexpr size_t kMaxTimestamps = 50;
    static constexpr std::chrono::milliseconds kPollInterval{500};
    static constexpr std::chrono::milliseconds kJoinTimeout{2000};

    explicit CommandQueue(std::shared_ptr<LogSink> sink = nullptr, std::string device = "");
    ~CommandQueue();

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // Appends an action. Starts the worker unless it already runs or inline
    // drain mode is on.
    void queueCommand(std::function<void()> action, const std::string& description = "");

    // Inline mode: the automation loop drains from its stop check and no
    // worker is auto-started.
    void setInlineDrain(bool enabled) { inline_drain_ = enabled; }
    bool inlineDrain() const { return inline_drain_.load(); }

    // Runs every queued action on the calling thread. A stop sentinel is put
    // back for the worker. StopSignal from an action propagates; other errors
    // are logged. No-op on an empty queue, and while a drain is already in
    // progress (an action calling back into the stop check).
    void drainNow();
    bool draining() const { return draining_.load(); }

    void start();

    // Flags the worker down, enqueues the sentinel and waits up to
    // kJoinTimeout for the worker to exit.
    void stop();

    bool workerRunning() const;
    size_t size() const;
    CommandQueueInfo info() const;

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::condition_variable exited_cv;
        std::deque<std::optional<QueuedCommand>> items;   // nullopt = stop sentinel
        std::deque<std::pair<std::string, std::chrono::system_clock::time_point>> timestamps;
        std::atomic<bool> running{false};
        bool worker_exited = true;
    };

    static void workerLoop(std::shared_ptr<State> state, std::shared_ptr<LogSink> sink);
    static void popTimestamp(State& state);

    std::shared_ptr<State> state_;
    std::shared_ptr<LogSink> sink_;
    std::string device_;
    std::atomic<bool> inline_drain_{false};
    std::atomic<bool> draining_{false};

    std::mutex worker_mutex_;
    std::thread worker_;
};

} // namespace tapdeck
