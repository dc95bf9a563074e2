// =============================================================================
// Tapdeck - Device Layer Error Taxonomy
// =============================================================================
// TimeoutError / ConnectionFault  -> retried once through the reconnect path
// StopSignal                      -> never retried, terminates the owning loop
// LockTimeout                     -> not retried, surfaces a stuck command lock
// CommandError                    -> a queued command failed; logged only
// =============================================================================
#pragma once

#include <cstdio>
#include <stdexcept>
#include <string>

namespace tapdeck {

class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

// An operation exceeded its deadline. The underlying transport call is not
// cancelled and may still complete later.
class TimeoutError : public DeviceError {
public:
    TimeoutError(std::string operation, double deadline_s)
        : DeviceError(operation + " timed out after " + formatSeconds(deadline_s) + " seconds"),
          operation_(std::move(operation)), deadline_s_(deadline_s) {}

    const std::string& operation() const { return operation_; }
    double deadlineSeconds() const { return deadline_s_; }

private:
    static std::string formatSeconds(double s) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%g", s);
        return buf;
    }

    std::string operation_;
    double deadline_s_;
};

// Transport raised during a device call, or returned malformed data.
class ConnectionFault : public DeviceError {
public:
    explicit ConnectionFault(const std::string& what) : DeviceError(what) {}
};

class StopSignal : public DeviceError {
public:
    enum class Reason {
        UserStop,        // cooperative stop requested
        ConnectionLost,  // reconnect exhausted or permanently failed
        NoDevices,       // ADB server unreachable or reports no devices
    };

    StopSignal(Reason reason, const std::string& what)
        : DeviceError(what), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

inline const char* stopReasonStr(StopSignal::Reason r) {
    switch (r) {
        case StopSignal::Reason::UserStop:       return "user stop";
        case StopSignal::Reason::ConnectionLost: return "connection lost";
        case StopSignal::Reason::NoDevices:      return "no devices";
    }
    return "?";
}

class LockTimeout : public DeviceError {
public:
    LockTimeout(std::string operation, double waited_s)
        : DeviceError("Could not acquire ADB lock for " + operation + " (timeout)"),
          operation_(std::move(operation)), waited_s_(waited_s) {}

    const std::string& operation() const { return operation_; }
    double waitedSeconds() const { return waited_s_; }

private:
    std::string operation_;
    double waited_s_;
};

class CommandError : public std::runtime_error {
public:
    CommandError(std::string description, const std::string& cause)
        : std::runtime_error(description + ": " + cause),
          description_(std::move(description)) {}

    const std::string& description() const { return description_; }

private:
    std::string description_;
};

} // namespace tapdeck
