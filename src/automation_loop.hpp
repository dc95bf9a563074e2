// =============================================================================
// Tapdeck - Automation Loop
// =============================================================================
// Idle -> Running -> (Stopping) -> Idle. Each iteration:
//   1. enabled actions in configured order, subject to per-action cooldowns
//   2. an idle screen capture when nothing ran (keeps live feeds warm)
//   3. pending one-shot command triggers
//   4. the recover routine when fix is enabled
//   5. the configured sleep, interruptible
// StopSignal ends the loop; any other error is logged and the loop goes on.
// =============================================================================
#pragma once

#include "action_registry.hpp"
#include "config_loader.hpp"
#include "log_sink.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tapdeck {

class Bot;

struct LoopSettings {
    std::vector<std::string> functions;        // execution order
    std::set<std::string> enabled;
    std::map<std::string, double> cooldowns;   // seconds
    std::vector<std::string> commands;
    double sleep_seconds = 0.0;
    bool fix_enabled = false;
    int stop_limit = 6;
    double error_pause_seconds = 1.0;          // after a failed action / iteration

    static LoopSettings fromConfig(const config::BotConfig& cfg);
};

class AutomationLoop {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    enum class State { Idle, Running, Stopping };

    AutomationLoop(Bot& bot, const ActionRegistry& registry, LoopSettings settings,
                   std::string device_name, ClockFn clock = nullptr);

    // Blocks until a StopSignal (user stop, lost connection) ends the loop.
    void run();

    // One pass of steps 1-5. Returns true if any action ran. Throws StopSignal.
    bool runIteration();

    // Marks a command to run at the next trigger check. False for unknown ids.
    bool trigger(const std::string& command_id);

    void setEnabled(const std::string& id, bool enabled);
    bool isEnabled(const std::string& id) const;
    void setFixEnabled(bool enabled);
    void setSleepSeconds(double seconds);

    // Seconds left before id may run again; nullopt when it is not cooling down.
    std::optional<double> cooldownRemaining(const std::string& id) const;
    void setLastRun(const std::string& id, Clock::time_point when);

    State state() const { return state_.load(); }
    LoopSettings settings() const;

private:
    // Returns false when the rest of the iteration is skipped.
    bool runActions(bool& any_ran);
    void runTriggeredCommands();
    void runRecover();
    void status(const std::string& message);

    Bot& bot_;
    const ActionRegistry& registry_;
    const std::string device_;
    ClockFn clock_;
    std::atomic<State> state_{State::Idle};

    mutable std::mutex mutex_;
    LoopSettings settings_;
    std::map<std::string, Clock::time_point> last_run_;
    std::set<std::string> pending_triggers_;
};

} // namespace tapdeck
