#include "automation_loop.hpp"
#include "bot.hpp"
#include "event_bus.hpp"
#include "tapdeck_log.hpp"
#include <cstdio>

namespace tapdeck {

LoopSettings LoopSettings::fromConfig(const config::BotConfig& cfg) {
    LoopSettings s;
    s.functions = cfg.functions;
    s.enabled.insert(cfg.enabled.begin(), cfg.enabled.end());
    s.cooldowns = cfg.cooldowns;
    s.commands = cfg.commands;
    s.sleep_seconds = cfg.sleep_seconds;
    s.fix_enabled = cfg.fix_enabled;
    s.stop_limit = cfg.stop_limit;
    return s;
}

AutomationLoop::AutomationLoop(Bot& bot, const ActionRegistry& registry, LoopSettings settings,
                               std::string device_name, ClockFn clock)
    : bot_(bot),
      registry_(registry),
      device_(std::move(device_name)),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })),
      settings_(std::move(settings)) {}

// =============================================================================
// Settings / introspection
// =============================================================================

LoopSettings AutomationLoop::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void AutomationLoop::setEnabled(const std::string& id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (enabled) settings_.enabled.insert(id);
    else settings_.enabled.erase(id);
}

bool AutomationLoop::isEnabled(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.enabled.count(id) > 0;
}

void AutomationLoop::setFixEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.fix_enabled = enabled;
}

void AutomationLoop::setSleepSeconds(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.sleep_seconds = seconds < 0 ? 0 : seconds;
}

std::optional<double> AutomationLoop::cooldownRemaining(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cd = settings_.cooldowns.find(id);
    if (cd == settings_.cooldowns.end() || cd->second <= 0) return std::nullopt;
    auto last = last_run_.find(id);
    if (last == last_run_.end()) return std::nullopt;

    double elapsed = std::chrono::duration<double>(clock_() - last->second).count();
    double remaining = cd->second - elapsed;
    if (remaining <= 0) return std::nullopt;
    return remaining;
}

void AutomationLoop::setLastRun(const std::string& id, Clock::time_point when) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_run_[id] = when;
}

bool AutomationLoop::trigger(const std::string& command_id) {
    if (!registry_.command(command_id)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    pending_triggers_.insert(command_id);
    return true;
}

void AutomationLoop::status(const std::string& message) {
    StatusEvent evt;
    evt.device = device_;
    evt.status = BotStatus::Running;
    evt.message = message;
    bus().publish(evt);
}

// =============================================================================
// Loop
// =============================================================================

void AutomationLoop::run() {
    state_ = State::Running;
    // Remote commands run from checkShouldStop() from here on; a worker
    // started before the loop hands its remaining items over.
    bot_.commandQueue().setInlineDrain(true);
    bot_.commandQueue().stop();
    TLOG_INFO("loop", "%s: automation loop started", device_.c_str());

    for (;;) {
        try {
            runIteration();
        } catch (const StopSignal& e) {
            if (e.reason() == StopSignal::Reason::UserStop) {
                bot_.log("Bot stopped by user");
            } else {
                bot_.log(std::string("Android connection stopped: ") + e.what());
            }
            break;
        } catch (const std::exception& e) {
            if (bot_.token().cancelled()) {
                bot_.log(std::string("ERROR during shutdown: ") + e.what());
                break;
            }
            StatusEvent evt;
            evt.device = device_;
            evt.status = BotStatus::Error;
            evt.message = e.what();
            bus().publish(evt);
            bot_.log(std::string("ERROR: ") + e.what());
            try {
                bot_.sleep(settings().error_pause_seconds);
            } catch (const StopSignal&) {
                bot_.log("Bot stopped by user");
                break;
            }
        }
    }

    state_ = State::Stopping;
    bot_.commandQueue().setInlineDrain(false);
    TLOG_INFO("loop", "%s: automation loop stopped", device_.c_str());
    state_ = State::Idle;
}

bool AutomationLoop::runIteration() {
    bool any_ran = false;
    const bool proceed = runActions(any_ran);

    if (!any_ran) {
        try {
            bot_.screenshot();
        } catch (const StopSignal&) {
            throw;
        } catch (const std::exception& e) {
            TLOG_DEBUG("loop", "%s: idle screenshot failed: %s", device_.c_str(), e.what());
        }
    }

    runTriggeredCommands();

    if (!proceed) return any_ran;

    runRecover();

    const double sleep_s = settings().sleep_seconds;
    if (sleep_s > 0) {
        char buf[48];
        snprintf(buf, sizeof(buf), "Sleeping %gs", sleep_s);
        status(buf);
        bot_.sleep(sleep_s);
    }
    return any_ran;
}

bool AutomationLoop::runActions(bool& any_ran) {
    const LoopSettings s = settings();
    ActionContext ctx;
    ctx.device = device_;
    ctx.stop_limit = s.stop_limit;

    for (const auto& id : s.functions) {
        bot_.checkShouldStop();
        if (bot_.token().consumeSkip()) {
            status("Skip requested - skipping " + id);
            return false;
        }

        if (!isEnabled(id)) continue;
        if (cooldownRemaining(id)) continue;

        const ActionHandler* handler = registry_.action(id);
        if (!handler) {
            TLOG_WARN("loop", "%s: no handler for %s", device_.c_str(), id.c_str());
            continue;
        }

        status(id);
        try {
            ActionResult result = (*handler)(bot_, ctx);
            any_ran = true;
            TLOG_DEBUG("loop", "%s: %s -> %s", device_.c_str(), id.c_str(), actionResultStr(result));

            if (result != ActionResult::NotRun) setLastRun(id, clock_());
            if (result == ActionResult::Completed) {
                setEnabled(id, false);
                bot_.log(id + " completed - disabled");
            }
        } catch (const StopSignal& e) {
            if (e.reason() == StopSignal::Reason::UserStop) {
                bot_.log("Stopped during " + id);
            } else {
                bot_.log("Android connection lost during " + id);
            }
            throw;
        } catch (const std::exception& e) {
            bot_.log("ERROR in " + id + ": " + e.what());
            status("Error in " + id);
            bot_.sleep(s.error_pause_seconds);
        }
    }
    return true;
}

void AutomationLoop::runTriggeredCommands() {
    const LoopSettings s = settings();
    ActionContext ctx;
    ctx.device = device_;
    ctx.stop_limit = s.stop_limit;

    for (const auto& id : registry_.commandIds()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_triggers_.erase(id) == 0) continue;
        }
        const CommandHandler* handler = registry_.command(id);
        status(id + " (command)");
        try {
            (*handler)(bot_, ctx);
        } catch (const StopSignal&) {
            bot_.log("Stopped during " + id + " command");
            throw;
        } catch (const std::exception& e) {
            bot_.log("ERROR in " + id + " command: " + e.what());
        }
    }
}

void AutomationLoop::runRecover() {
    const LoopSettings s = settings();
    const CommandHandler& recover = registry_.recover();
    if (!s.fix_enabled || !recover) return;

    ActionContext ctx;
    ctx.device = device_;
    ctx.stop_limit = s.stop_limit;

    status("Fix/Recover");
    try {
        recover(bot_, ctx);
    } catch (const StopSignal& e) {
        if (e.reason() == StopSignal::Reason::UserStop) {
            bot_.log("Stopped during Fix/Recover");
        } else {
            bot_.log("Android connection lost during Fix/Recover");
        }
        throw;
    } catch (const std::exception& e) {
        bot_.log(std::string("ERROR in Fix/Recover: ") + e.what());
    }
}

} // namespace tapdeck
