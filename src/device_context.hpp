// =============================================================================
// Tapdeck - Device Context
// =============================================================================
// Process-scoped state shared by every DeviceSession: the command lock and
// reconnect registries, the timeout worker pool and the device-layer settings.
// The application owns one; tests build a fresh one per case.
// =============================================================================
#pragma once

#include "command_lock_registry.hpp"
#include "config_loader.hpp"
#include "reconnect_coordinator.hpp"
#include "timeout_executor.hpp"

#include <mutex>

namespace tapdeck {

struct DeviceSettings {
    int max_reconnect_attempts = 10;
    double adb_timeout_s = 30.0;
    double lock_timeout_s = 10.0;
    int adb_workers = TimeoutExecutor::kDefaultWorkers;
    double probe_retry_delay_s = 1.0;  // pause after a probe pass with no match

    static DeviceSettings fromConfig(const config::AppConfig& cfg);
};

class DeviceContext {
public:
    explicit DeviceContext(const DeviceSettings& settings = DeviceSettings());

    DeviceContext(const DeviceContext&) = delete;
    DeviceContext& operator=(const DeviceContext&) = delete;

    DeviceSettings settings() const;

    // Applies reloaded configuration. The worker pool keeps its size.
    void setSettings(const DeviceSettings& settings);

    CommandLockRegistry& locks() { return locks_; }
    ReconnectCoordinator& reconnects() { return reconnects_; }
    TimeoutExecutor& executor() { return executor_; }

private:
    mutable std::mutex settings_mutex_;
    DeviceSettings settings_;
    CommandLockRegistry locks_;
    ReconnectCoordinator reconnects_;
    TimeoutExecutor executor_;
};

} // namespace tapdeck
