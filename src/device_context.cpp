#include "device_context.hpp"
#include "tapdeck_log.hpp"

namespace tapdeck {

DeviceSettings DeviceSettings::fromConfig(const config::AppConfig& cfg) {
    DeviceSettings s;
    s.max_reconnect_attempts = cfg.device.max_reconnect_attempts;
    s.adb_timeout_s = cfg.device.adb_timeout_s;
    s.lock_timeout_s = cfg.device.lock_timeout_s;
    s.adb_workers = cfg.device.adb_workers;
    return s;
}

DeviceContext::DeviceContext(const DeviceSettings& settings)
    : settings_(settings), executor_(settings.adb_workers) {}

DeviceSettings DeviceContext::settings() const {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return settings_;
}

void DeviceContext::setSettings(const DeviceSettings& settings) {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    if (settings.adb_workers != settings_.adb_workers) {
        TLOG_WARN("device", "adb_workers change (%d -> %d) takes effect on restart",
                  settings_.adb_workers, settings.adb_workers);
    }
    int workers = settings_.adb_workers;
    settings_ = settings;
    settings_.adb_workers = workers;
}

} // namespace tapdeck
