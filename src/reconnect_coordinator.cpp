#include "reconnect_coordinator.hpp"
#include "errors.hpp"
#include "tapdeck_log.hpp"

namespace tapdeck {

ReconnectState& ReconnectCoordinator::stateFor(const std::string& identity) {
    {
        std::shared_lock<std::shared_mutex> read(mutex_);
        auto it = states_.find(identity);
        if (it != states_.end()) return *it->second;
    }

    std::unique_lock<std::shared_mutex> write(mutex_);
    auto it = states_.find(identity);
    if (it != states_.end()) return *it->second;

    auto& slot = states_[identity];
    slot = std::make_unique<ReconnectState>();
    return *slot;
}

size_t ReconnectCoordinator::size() const {
    std::shared_lock<std::shared_mutex> read(mutex_);
    return states_.size();
}

ReconnectCoordinator::Outcome ReconnectCoordinator::recover(
        const std::string& identity, uint64_t observed_epoch,
        const std::string& failure, const ReconnectHooks& hooks) {
    ReconnectState& state = stateFor(identity);
    auto say = [&hooks](const std::string& msg) { if (hooks.log) hooks.log(msg); };

    std::lock_guard<std::mutex> lock(state.mutex);

    if (state.permanent_failure.load()) {
        throw StopSignal(StopSignal::Reason::ConnectionLost,
                         "Device connection permanently failed");
    }

    // A reconnect finished after our attempt started: the connection we failed
    // on is gone already.
    if (state.epoch.load() != observed_epoch) {
        state.just_reconnected = false;
        TLOG_DEBUG("reconnect", "%s: reconnected by another caller, retrying", identity.c_str());
        return Outcome::PeerReconnected;
    }
    // Left over from a reconnect that preceded our attempt; it does not cover
    // this failure.
    state.just_reconnected = false;

    state.probe_loops.fetch_add(1);
    say(failure + " - Reconnecting...");
    TLOG_WARN("reconnect", "%s: %s, starting reconnect", identity.c_str(), failure.c_str());

    size_t device_count = 0;
    try {
        device_count = hooks.refresh_devices();
    } catch (const std::exception& e) {
        state.permanent_failure = true;
        throw StopSignal(StopSignal::Reason::NoDevices,
                         std::string("ADB error during reconnection: ") + e.what());
    }
    if (device_count == 0) {
        state.permanent_failure = true;
        throw StopSignal(StopSignal::Reason::NoDevices, "No devices attached during reconnection");
    }

    const int max_attempts = hooks.max_attempts < 1 ? 1 : hooks.max_attempts;
    int attempts = 0;
    for (;;) {
        bool matched = false;
        try {
            matched = hooks.probe();
        } catch (const StopSignal&) {
            throw;
        } catch (const std::exception& e) {
            TLOG_WARN("reconnect", "%s: probe failed: %s", identity.c_str(), e.what());
        }
        if (matched) break;

        ++attempts;
        if (hooks.should_stop && hooks.should_stop()) {
            say("Reconnection stopped by user");
            throw StopSignal(StopSignal::Reason::UserStop, "Reconnection stopped by user");
        }
        if (attempts >= max_attempts) {
            state.permanent_failure = true;
            say("Reconnection failed after " + std::to_string(max_attempts) + " attempts");
            throw StopSignal(StopSignal::Reason::ConnectionLost,
                             "Reconnection failed after " + std::to_string(max_attempts) + " attempts");
        }
        say("Reconnection failed, retrying... (" + std::to_string(attempts) + "/" +
            std::to_string(max_attempts) + ")");
    }

    state.just_reconnected = true;
    state.permanent_failure = false;
    state.epoch.fetch_add(1);
    TLOG_INFO("reconnect", "%s: reconnected after %d failed probe(s)", identity.c_str(), attempts);
    return Outcome::Reconnected;
}

} // namespace tapdeck
