#include "device_session.hpp"
#include "adb_security.hpp"
#include "tapdeck_log.hpp"

#include <algorithm>
#include <thread>

namespace tapdeck {

namespace {

constexpr const char* kSerialProperty = "ro.boot.serialno";

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // anonymous namespace

DeviceSession::DeviceSession(DeviceContext& ctx, std::shared_ptr<Transport> transport,
                             std::string identity, std::string device_name,
                             std::shared_ptr<LogSink> sink)
    : ctx_(ctx),
      transport_(std::move(transport)),
      identity_(std::move(identity)),
      device_name_(device_name.empty() ? identity_ : std::move(device_name)),
      sink_(sink ? std::move(sink) : std::make_shared<ProcessLogSink>("session")),
      reconnect_state_(ctx.reconnects().stateFor(identity_)) {}

// =============================================================================
// Connection
// =============================================================================

void DeviceSession::connect() {
    std::vector<DeviceHandlePtr> devices;
    try {
        devices = transport_->listDevices();
    } catch (const DeviceError& e) {
        say(std::string("ADB ERROR: ADB server not running - ") + e.what());
        throw StopSignal(StopSignal::Reason::NoDevices,
                         std::string("ADB server not running: ") + e.what());
    }
    if (devices.empty()) {
        say("ADB ERROR: No devices attached");
        throw StopSignal(StopSignal::Reason::NoDevices, "No devices attached");
    }
    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        devices_ = std::move(devices);
    }

    const int max_attempts = std::max(1, ctx_.settings().max_reconnect_attempts);
    int attempts = 0;
    while (!probeOnce()) {
        ++attempts;
        if (shouldStop()) {
            say("Connection stopped by user");
            throw StopSignal(StopSignal::Reason::UserStop, "Connection stopped by user");
        }
        if (attempts >= max_attempts) {
            say("Connection failed after " + std::to_string(max_attempts) + " attempts");
            throw StopSignal(StopSignal::Reason::ConnectionLost,
                             "Connection failed after " + std::to_string(max_attempts) + " attempts");
        }
        say("Connection failed, retrying... (" + std::to_string(attempts) + "/" +
            std::to_string(max_attempts) + ")");
    }

    {
        std::lock_guard<std::mutex> lock(reconnect_state_.mutex);
        reconnect_state_.permanent_failure = false;
        reconnect_state_.epoch.fetch_add(1);
    }
}

bool DeviceSession::isConnected() const {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    return handle_ != nullptr;
}

DeviceHandlePtr DeviceSession::boundHandle() const {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    return handle_;
}

void DeviceSession::bindHandle(DeviceHandlePtr handle) {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    handle_ = std::move(handle);
}

size_t DeviceSession::refreshDevices() {
    auto devices = transport_->listDevices();
    std::lock_guard<std::mutex> lock(handle_mutex_);
    devices_ = std::move(devices);
    return devices_.size();
}

bool DeviceSession::probeOnce() {
    std::vector<DeviceHandlePtr> devices;
    {
        std::lock_guard<std::mutex> lock(handle_mutex_);
        devices = devices_;
    }
    const double deadline = ctx_.settings().adb_timeout_s;

    for (const auto& dev : devices) {
        if (!dev) continue;
        std::string reported;
        try {
            reported = trim(guarded("getprop", deadline, dev,
                [](DeviceHandle& h) { return h.getProperty(kSerialProperty); }));
        } catch (const StopSignal&) {
            throw;
        } catch (const DeviceError& e) {
            say(std::string("Device connection error: ") + e.what());
            continue;
        }
        if (!reported.empty()) say("Detected serial: " + reported);

        if ((!reported.empty() && reported.find(identity_) != std::string::npos) ||
            dev->serial() == identity_) {
            bindHandle(dev);
            say("Connected to device: " + device_name_ + " (serial: " +
                (reported.empty() ? dev->serial() : reported) + ")");
            return true;
        }
    }

    sleepUnlessStopped(ctx_.settings().probe_retry_delay_s);
    return false;
}

void DeviceSession::sleepUnlessStopped(double seconds) const {
    using namespace std::chrono;
    auto until = steady_clock::now() + duration_cast<steady_clock::duration>(duration<double>(seconds));
    while (!shouldStop()) {
        auto now = steady_clock::now();
        if (now >= until) break;
        std::this_thread::sleep_for(std::min<steady_clock::duration>(until - now, milliseconds(50)));
    }
}

void DeviceSession::recover(const std::string& operation, uint64_t observed_epoch,
                            const std::string& error) {
    ReconnectHooks hooks;
    hooks.refresh_devices = [this]() { return refreshDevices(); };
    hooks.probe = [this]() { return probeOnce(); };
    hooks.should_stop = [this]() { return shouldStop(); };
    hooks.log = [this](const std::string& msg) { say(msg); };
    hooks.max_attempts = ctx_.settings().max_reconnect_attempts;

    auto outcome = ctx_.reconnects().recover(identity_, observed_epoch,
                                             operation + " failed: " + error, hooks);
    TLOG_DEBUG("session", "%s: %s, retrying %s", identity_.c_str(),
               outcome == ReconnectCoordinator::Outcome::Reconnected ? "reconnected" : "peer reconnected",
               operation.c_str());
}

void DeviceSession::say(const std::string& message) const {
    sink_->log(message);
}

// =============================================================================
// Operations
// =============================================================================

ScreenImage DeviceSession::captureScreen() {
    return withRetry("capture_screen", [this]() {
        std::vector<uint8_t> bytes = guarded("screencap", ctx_.settings().adb_timeout_s,
            [](DeviceHandle& h) { return h.captureScreenRaw(); });

        try {
            return decodeCapture(bytes);
        } catch (const ConnectionFault& e) {
            say(std::string("[Warning] ") + e.what());
            throw;
        }
    });
}

void DeviceSession::touch(int x1, int y1, int x2, int y2, int duration_ms, bool suppress_log) {
    if (x2 == -1) x2 = x1;
    if (y2 == -1) y2 = y1;

    withRetry("touch", [&]() {
        const double default_deadline = ctx_.settings().adb_timeout_s;
        if (x2 == x1 && y2 == y1) {
            if (!suppress_log) {
                say("Touch: (" + std::to_string(x1) + ", " + std::to_string(y1) + ")");
            }
            std::string cmd = "input tap " + std::to_string(x1) + " " + std::to_string(y1);
            guarded("tap", default_deadline, [cmd](DeviceHandle& h) { return h.shell(cmd); });
        } else {
            if (!suppress_log) {
                say("Swipe: (" + std::to_string(x1) + ", " + std::to_string(y1) + ") -> (" +
                    std::to_string(x2) + ", " + std::to_string(y2) + ") [" +
                    std::to_string(duration_ms) + "ms]");
            }
            std::string cmd = "input swipe " + std::to_string(x1) + " " + std::to_string(y1) + " " +
                              std::to_string(x2) + " " + std::to_string(y2) + " " +
                              std::to_string(duration_ms);
            guarded("swipe", swipeDeadline(default_deadline, duration_ms),
                    [cmd](DeviceHandle& h) { return h.shell(cmd); });
        }
    });
}

void DeviceSession::sendText(const std::string& text) {
    withRetry("send_text", [&]() {
        say("Text input: \"" + text + "\"");
        std::string cmd = "input text " + security::quoteShellArg(text);
        guarded("send_text", ctx_.settings().adb_timeout_s,
                [cmd](DeviceHandle& h) { return h.shell(cmd); });
    });
    pressEnter();
}

void DeviceSession::pressEnter() {
    withRetry("press_enter", [this]() {
        guarded("press_enter", ctx_.settings().adb_timeout_s,
                [](DeviceHandle& h) { return h.shell("input keyevent " + std::to_string(keycode::kEnter)); });
    });
}

void DeviceSession::pressBackspace(int count) {
    if (count <= 0) return;
    withRetry("press_backspace", [this, count]() {
        // One lock hold for the whole burst
        guarded("press_backspace", ctx_.settings().adb_timeout_s, [count](DeviceHandle& h) {
            const std::string cmd = "input keyevent " + std::to_string(keycode::kBackspace);
            for (int i = 0; i < count; ++i) h.shell(cmd);
        });
    });
}

void DeviceSession::pressKey(int code) {
    withRetry("press_key", [this, code]() {
        std::string cmd = "input keyevent " + std::to_string(code);
        guarded("press_key", ctx_.settings().adb_timeout_s,
                [cmd](DeviceHandle& h) { return h.shell(cmd); });
    });
}

} // namespace tapdeck
