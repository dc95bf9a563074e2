// =============================================================================
// Tapdeck - Device Session
// =============================================================================
// Logical connection to one device. Every operation:
//   1. takes the identity's command lock (bounded wait -> LockTimeout)
//   2. runs the transport call on the timeout executor (-> TimeoutError)
//   3. releases the lock
//   4. on any failure except StopSignal/LockTimeout, engages the reconnect
//      coordinator and retries once
// The bound device handle is replaced in place on reconnect.
// =============================================================================
#pragma once

#include "device_context.hpp"
#include "errors.hpp"
#include "log_sink.hpp"
#include "screen_image.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

namespace tapdeck {

namespace keycode {
constexpr int kEnter = 66;
constexpr int kBackspace = 67;
constexpr int kBack = 4;
constexpr int kHome = 3;
} // namespace keycode

class DeviceSession {
public:
    static constexpr double kSwipeMarginS = 10.0;
    static constexpr int kDefaultSwipeMs = 500;

    DeviceSession(DeviceContext& ctx, std::shared_ptr<Transport> transport,
                  std::string identity, std::string device_name = "",
                  std::shared_ptr<LogSink> sink = nullptr);

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // Lists devices and probes until one reports this identity.
    // Throws StopSignal when the server is unreachable, no device is attached,
    // the user stopped, or max_reconnect_attempts probe passes found nothing.
    // Success clears a sticky permanent failure for the identity.
    void connect();

    ScreenImage captureScreen();

    // x2/y2 == -1 fall back to x1/y1; identical endpoints issue a tap.
    void touch(int x1, int y1, int x2 = -1, int y2 = -1,
               int duration_ms = kDefaultSwipeMs, bool suppress_log = false);
    void tap(int x, int y) { touch(x, y); }
    void swipe(int x1, int y1, int x2, int y2, int duration_ms = kDefaultSwipeMs) {
        touch(x1, y1, x2, y2, duration_ms);
    }

    // Literal text followed by Enter.
    void sendText(const std::string& text);
    void pressEnter();
    void pressBackspace(int count = 1);
    void pressKey(int code);

    // Cooperative stop: aborts connect/reconnect probe loops.
    void stop() { should_stop_ = true; }
    bool shouldStop() const { return should_stop_.load(); }

    bool isConnected() const;
    const std::string& identity() const { return identity_; }
    const std::string& deviceName() const { return device_name_; }
    ReconnectState& reconnectState() { return reconnect_state_; }

    // Swipes take at least their own duration plus a margin.
    static double swipeDeadline(double default_s, int duration_ms) {
        double needed = duration_ms / 1000.0 + kSwipeMarginS;
        return needed > default_s ? needed : default_s;
    }

    // Runs op; on a retryable failure hands off to the reconnect coordinator
    // and runs op once more. StopSignal and LockTimeout pass straight through.
    template<typename F>
    auto withRetry(const std::string& operation, F&& op) -> std::invoke_result_t<F&> {
        if (reconnect_state_.permanent_failure.load()) {
            throw StopSignal(StopSignal::Reason::ConnectionLost,
                             "Device connection permanently failed");
        }
        const uint64_t epoch = reconnect_state_.epoch.load();
        try {
            return op();
        } catch (const StopSignal&) {
            throw;
        } catch (const LockTimeout&) {
            throw;
        } catch (const std::exception& e) {
            recover(operation, epoch, e.what());
        }
        return op();
    }

private:
    DeviceHandlePtr boundHandle() const;
    void bindHandle(DeviceHandlePtr handle);

    // Takes the command lock and runs call(handle) on the executor.
    template<typename F>
    auto guarded(const std::string& operation, double deadline_s,
                 const DeviceHandlePtr& handle, F&& call)
        -> std::invoke_result_t<F&, DeviceHandle&> {
        std::timed_mutex& cmd_lock = ctx_.locks().getLock(identity_);
        const double lock_timeout = ctx_.settings().lock_timeout_s;
        std::unique_lock<std::timed_mutex> lock(cmd_lock, std::defer_lock);
        if (!lock.try_lock_for(std::chrono::duration<double>(lock_timeout))) {
            throw LockTimeout(operation, lock_timeout);
        }
        if (!handle) throw ConnectionFault("Device not connected");

        try {
            return ctx_.executor().run(
                [handle, call]() { return call(*handle); }, operation, deadline_s);
        } catch (const TimeoutError& e) {
            say("[Warning] " + std::string(e.what()));
            throw;
        }
    }

    template<typename F>
    auto guarded(const std::string& operation, double deadline_s, F&& call)
        -> std::invoke_result_t<F&, DeviceHandle&> {
        return guarded(operation, deadline_s, boundHandle(), std::forward<F>(call));
    }

    void recover(const std::string& operation, uint64_t observed_epoch, const std::string& error);
    size_t refreshDevices();
    bool probeOnce();
    void sleepUnlessStopped(double seconds) const;
    void say(const std::string& message) const;

    DeviceContext& ctx_;
    std::shared_ptr<Transport> transport_;
    const std::string identity_;
    const std::string device_name_;
    std::shared_ptr<LogSink> sink_;
    ReconnectState& reconnect_state_;
    std::atomic<bool> should_stop_{false};

    mutable std::mutex handle_mutex_;
    DeviceHandlePtr handle_;
    std::vector<DeviceHandlePtr> devices_;
};

} // namespace tapdeck
