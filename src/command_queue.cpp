#include "command_queue.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "tapdeck_log.hpp"

#include <algorithm>
#include <ctime>

namespace tapdeck {

namespace {

std::string clockTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    return buf;
}

} // anonymous namespace

CommandQueue::CommandQueue(std::shared_ptr<LogSink> sink, std::string device)
    : state_(std::make_shared<State>()),
      sink_(sink ? std::move(sink) : std::make_shared<ProcessLogSink>("cmdqueue")),
      device_(std::move(device)) {}

CommandQueue::~CommandQueue() {
    stop();
}

void CommandQueue::queueCommand(std::function<void()> action, const std::string& description) {
    if (!inline_drain_.load() && !workerRunning()) {
        start();
    }

    QueuedCommand cmd;
    cmd.action = std::move(action);
    cmd.description = description;
    cmd.queued_at = std::chrono::system_clock::now();

    size_t depth = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->timestamps.emplace_back(description.empty() ? "Unknown command" : description,
                                        cmd.queued_at);
        if (state_->timestamps.size() > kMaxTimestamps) state_->timestamps.pop_front();
        state_->items.emplace_back(std::move(cmd));
        depth = state_->items.size();
    }
    state_->cv.notify_one();

    CommandQueuedEvent evt;
    evt.device = device_;
    evt.description = description;
    evt.queue_size = depth;
    bus().publish(evt);
}

void CommandQueue::start() {
    std::lock_guard<std::mutex> wl(worker_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->running.load()) return;
        // Stale sentinels from an earlier stop()
        state_->items.erase(std::remove_if(state_->items.begin(), state_->items.end(),
                                           [](const std::optional<QueuedCommand>& i) { return !i; }),
                            state_->items.end());
        state_->running = true;
        // A detached worker that has not left its loop yet picks the work up again.
        if (!state_->worker_exited) return;
        state_->worker_exited = false;
    }
    if (worker_.joinable()) worker_.join();
    worker_ = std::thread(&CommandQueue::workerLoop, state_, sink_);
    TLOG_DEBUG("cmdqueue", "Worker started%s%s", device_.empty() ? "" : " for ", device_.c_str());
}

void CommandQueue::stop() {
    std::lock_guard<std::mutex> wl(worker_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->running.load() && state_->worker_exited) return;
        state_->running = false;
        state_->items.emplace_back(std::nullopt);
    }
    state_->cv.notify_all();

    if (!worker_.joinable()) return;

    bool exited;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        exited = state_->exited_cv.wait_for(lock, kJoinTimeout,
                                            [this] { return state_->worker_exited; });
    }
    if (exited) {
        worker_.join();
    } else {
        // Still inside a long action; it owns its share of the state.
        TLOG_WARN("cmdqueue", "Worker did not exit within %lldms, detaching",
                  (long long)kJoinTimeout.count());
        worker_.detach();
    }
}

bool CommandQueue::workerRunning() const {
    return state_->running.load();
}

size_t CommandQueue::size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    size_t n = 0;
    for (const auto& item : state_->items) {
        if (item) ++n;
    }
    return n;
}

CommandQueueInfo CommandQueue::info() const {
    CommandQueueInfo out;
    auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (const auto& item : state_->items) {
        if (item) ++out.queue_size;
    }
    for (const auto& [desc, ts] : state_->timestamps) {
        CommandQueueInfo::Entry e;
        e.description = desc;
        e.queued_at = clockTime(ts);
        e.delay_seconds = std::chrono::duration<double>(now - ts).count();
        out.commands.push_back(std::move(e));
    }
    return out;
}

void CommandQueue::popTimestamp(State& state) {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.timestamps.empty()) state.timestamps.pop_front();
}

void CommandQueue::drainNow() {
    bool expected = false;
    if (!draining_.compare_exchange_strong(expected, true)) return;
    struct DrainGuard {
        std::atomic<bool>& flag;
        ~DrainGuard() { flag = false; }
    } guard{draining_};

    for (;;) {
        std::optional<QueuedCommand> item;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->items.empty()) return;
            if (!state_->items.front()) {
                // Sentinel belongs to a live worker; otherwise it is stale.
                if (!state_->worker_exited) return;
                state_->items.pop_front();
                continue;
            }
            item = std::move(state_->items.front());
            state_->items.pop_front();
        }

        try {
            item->action();
            if (!item->description.empty()) sink_->log("[CMD] " + item->description);
        } catch (const StopSignal&) {
            popTimestamp(*state_);
            throw;
        } catch (const std::exception& e) {
            TLOG_ERROR("cmdqueue", "%s", CommandError(item->description, e.what()).what());
            sink_->log(std::string("[CMD] Error: ") + e.what());
        }
        popTimestamp(*state_);
    }
}

void CommandQueue::workerLoop(std::shared_ptr<State> state, std::shared_ptr<LogSink> sink) {
    for (;;) {
        std::optional<QueuedCommand> item;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait_for(lock, kPollInterval, [&] {
                return !state->items.empty() || !state->running.load();
            });
            bool sentinel = !state->items.empty() && !state->items.front();
            if (!state->running.load() || sentinel) {
                if (sentinel) state->items.pop_front();
                state->running = false;
                state->worker_exited = true;
                state->exited_cv.notify_all();
                return;
            }
            if (state->items.empty()) continue;
            item = std::move(state->items.front());
            state->items.pop_front();
        }

        try {
            item->action();
            if (!item->description.empty()) sink->log(item->description);
        } catch (const std::exception& e) {
            TLOG_ERROR("cmdqueue", "%s", CommandError(item->description, e.what()).what());
            sink->log(std::string("Command error: ") + e.what());
        }
        popTimestamp(*state);
    }
}

} // namespace tapdeck
