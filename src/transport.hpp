// =============================================================================
// Tapdeck - Device Transport Interface
// =============================================================================
// What the device session needs from the ADB layer. AdbClient is the real
// implementation; tests plug in scripted fakes.
// =============================================================================
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tapdeck {

// One attached device as reported by the server. Calls block and throw
// ConnectionFault on transport errors.
class DeviceHandle {
public:
    virtual ~DeviceHandle() = default;

    virtual std::string serial() const = 0;
    virtual std::string getProperty(const std::string& key) = 0;
    virtual std::vector<uint8_t> captureScreenRaw() = 0;
    virtual std::string shell(const std::string& command) = 0;
};

using DeviceHandlePtr = std::shared_ptr<DeviceHandle>;

class Transport {
public:
    virtual ~Transport() = default;

    // Throws ConnectionFault when the server cannot be reached.
    virtual std::vector<DeviceHandlePtr> listDevices() = 0;
};

} // namespace tapdeck
