// =============================================================================
// Tapdeck - Command Lock Registry
// =============================================================================
// One timed mutex per device identity. Every subsystem that talks to a device
// (automation loop, remote commands, screenshot poller) goes through the same
// lock, so a device never has two ADB commands in flight.
// Entries live as long as the registry; identities are few and long-lived.
// =============================================================================
#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tapdeck {

class CommandLockRegistry {
public:
    // Idempotent per identity; the returned reference stays valid for the
    // registry's lifetime.
    std::timed_mutex& getLock(const std::string& identity);

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::timed_mutex>> locks_;
};

} // namespace tapdeck
