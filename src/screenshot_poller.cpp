#include "screenshot_poller.hpp"
#include "event_bus.hpp"
#include "tapdeck_log.hpp"

namespace tapdeck {

static constexpr const char* TAG = "poller";

ScreenshotPoller::ScreenshotPoller(std::shared_ptr<DeviceSession> session,
                                   std::chrono::milliseconds interval)
    : session_(std::move(session)), interval_(interval) {}

ScreenshotPoller::~ScreenshotPoller() {
    stop();
}

void ScreenshotPoller::start() {
    if (running_) return;
    if (thread_.joinable()) thread_.join();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    thread_ = std::thread(&ScreenshotPoller::pollLoop, this);
}

void ScreenshotPoller::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void ScreenshotPoller::pollLoop() {
    TLOG_INFO(TAG, "%s: polling every %lldms", session_->deviceName().c_str(),
              (long long)interval_.count());

    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) break;
        }

        // Not bound yet (connect still running): a capture now would start a
        // second probe loop next to connect's own.
        if (!session_->isConnected()) {
            ++skipped_;
            continue;
        }

        try {
            ScreenImage img = session_->captureScreen();
            ScreenshotEvent evt;
            evt.device = session_->deviceName();
            evt.image = std::make_shared<const ScreenImage>(std::move(img));
            evt.sequence = ++sequence_;
            bus().publish(evt);
        } catch (const StopSignal& e) {
            TLOG_INFO(TAG, "%s: poller ended: %s", session_->deviceName().c_str(), e.what());
            break;
        } catch (const std::exception& e) {
            ++failures_;
            TLOG_WARN(TAG, "%s: capture failed: %s", session_->deviceName().c_str(), e.what());
        }
    }
    running_ = false;
}

} // namespace tapdeck
