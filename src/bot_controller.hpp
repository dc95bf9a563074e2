// =============================================================================
// Tapdeck - Bot Controller
// =============================================================================
// Lifecycle of one automation instance: a background thread connects the
// device session, builds the Bot and its AutomationLoop and runs the loop
// until a StopSignal. Status changes go out on the event bus.
// =============================================================================
#pragma once

#include "action_registry.hpp"
#include "automation_loop.hpp"
#include "bot.hpp"
#include "cancellation_token.hpp"
#include "device_context.hpp"
#include "device_session.hpp"
#include "event_bus.hpp"
#include "log_sink.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace tapdeck {

struct ControllerOptions {
    std::string identity;        // device serial the session binds to
    std::string device_name;     // configured name, used in logs and events
    std::string findimg_path;
    LoopSettings loop;
    AutomationLoop::ClockFn clock;   // null = steady_clock
};

class BotController {
public:
    BotController(DeviceContext& ctx, std::shared_ptr<Transport> transport,
                  const ActionRegistry& registry, ControllerOptions options,
                  std::shared_ptr<LogSink> sink = nullptr);
    ~BotController();

    BotController(const BotController&) = delete;
    BotController& operator=(const BotController&) = delete;

    // False if an instance is already running.
    bool start();

    // Cancels the token, stops the session and the command queue. Does not join.
    void stop();

    // True once the background thread has finished.
    bool wait(std::chrono::milliseconds timeout);

    bool running() const { return running_.load(); }
    BotStatus status() const;
    std::string lastError() const;

    // Forwarded to the live instance; false when nothing is running.
    bool trigger(const std::string& command_id);
    bool queueCommand(std::function<void()> action, const std::string& description = "");
    bool requestSkip();

    // The session of the current (or last) run, for the screenshot poller.
    std::shared_ptr<DeviceSession> session() const;

private:
    void threadMain(std::shared_ptr<DeviceSession> session, std::shared_ptr<Bot> bot,
                    std::shared_ptr<AutomationLoop> loop);
    void publish(BotStatus status, const std::string& message);
    void finish();

    DeviceContext& ctx_;
    std::shared_ptr<Transport> transport_;
    const ActionRegistry& registry_;
    const ControllerOptions options_;
    std::shared_ptr<LogSink> sink_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    BotStatus status_ = BotStatus::Stopped;
    std::string last_error_;

    CancellationToken token_;
    std::shared_ptr<DeviceSession> session_;
    std::shared_ptr<Bot> bot_;
    std::shared_ptr<AutomationLoop> loop_;
};

} // namespace tapdeck
