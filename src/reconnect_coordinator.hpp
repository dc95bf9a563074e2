// =============================================================================
// Tapdeck - Reconnect Coordinator
// =============================================================================
// Shared reconnect state per device identity. When several callers hit a
// broken connection at once, the first to take the state lock runs the probe
// loop; the others wait on the lock and then simply retry their call.
//
//   Connected --failure--> lock --permanent_failure--> StopSignal
//                               --peer reconnected---> retry once
//                               --owner: refresh + probe loop
//                                     --no devices / exhausted--> permanent, StopSignal
//                                     --user stop--------------> StopSignal
//                                     --match------------------> retry once
// =============================================================================
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tapdeck {

struct ReconnectState {
    std::mutex mutex;                            // held while reconnecting
    bool just_reconnected = false;               // guarded by mutex
    std::atomic<bool> permanent_failure{false};  // sticky until an explicit connect
    std::atomic<uint64_t> epoch{0};              // bumped on every successful reconnect
    std::atomic<uint64_t> probe_loops{0};        // reconnect procedures actually run
};

// Session-side operations the coordinator drives while it owns the state.
struct ReconnectHooks {
    // Re-reads the device list and returns its size. Throws when the server
    // is unreachable; any exception ends the reconnect as NoDevices.
    std::function<size_t()> refresh_devices;
    // One pass over the device list; true once the identity matched. A throw
    // other than StopSignal counts as a failed attempt.
    std::function<bool()> probe;
    std::function<bool()> should_stop;
    std::function<void(const std::string&)> log;
    int max_attempts = 10;
};

class ReconnectCoordinator {
public:
    enum class Outcome {
        Reconnected,      // this caller ran the probe loop and succeeded
        PeerReconnected,  // another caller fixed the connection meanwhile
    };

    // Idempotent per identity; reference valid for the coordinator's lifetime.
    ReconnectState& stateFor(const std::string& identity);

    // Called after an operation failed. observed_epoch is the state's epoch
    // read before the failed attempt started. Blocks on the state lock, never
    // spins. Throws StopSignal on permanent failure, user stop, missing
    // devices or exhausted attempts. The caller retries its operation once
    // after a normal return.
    Outcome recover(const std::string& identity, uint64_t observed_epoch,
                    const std::string& failure, const ReconnectHooks& hooks);

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<ReconnectState>> states_;
};

} // namespace tapdeck
