// =============================================================================
// Tapdeck - Screenshot Poller
// =============================================================================
// Live feed for remote monitoring: captures the screen at a fixed interval
// through a DeviceSession (so it queues behind the automation loop on the
// same command lock) and publishes ScreenshotEvent. Ticks before the session
// is connected are skipped.
// =============================================================================
#pragma once

#include "device_session.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace tapdeck {

class ScreenshotPoller {
public:
    ScreenshotPoller(std::shared_ptr<DeviceSession> session, std::chrono::milliseconds interval);
    ~ScreenshotPoller();

    ScreenshotPoller(const ScreenshotPoller&) = delete;
    ScreenshotPoller& operator=(const ScreenshotPoller&) = delete;

    void start();
    void stop();

    bool running() const { return running_.load(); }
    uint64_t published() const { return sequence_.load(); }
    uint64_t failures() const { return failures_.load(); }
    // Ticks that found the session not connected yet.
    uint64_t skipped() const { return skipped_.load(); }

private:
    void pollLoop();

    std::shared_ptr<DeviceSession> session_;
    const std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> sequence_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> skipped_{0};
    std::thread thread_;
};

} // namespace tapdeck
