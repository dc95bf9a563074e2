// =============================================================================
// Tapdeck - ADB Server Client
// =============================================================================
// Talks the ADB host smart-socket protocol directly to the local ADB server
// (default 127.0.0.1:5037) instead of spawning the adb binary:
//
//   request : 4 hex digit length + payload      "000chost:version"
//   reply   : "OKAY" | "FAIL" + 4 hex length + message
//
// host:devices answers with a length-prefixed table. Device services first
// switch the connection with host:transport:<serial>, then run shell:<cmd>
// or exec:<cmd> whose output streams until the server closes the socket.
// =============================================================================
#pragma once

#include "transport.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tapdeck {
namespace adb {

constexpr int kDefaultPort = 5037;
constexpr size_t kMaxCaptureBytes = 50u * 1024u * 1024u;
constexpr size_t kMaxShellBytes = 4u * 1024u * 1024u;
constexpr size_t kMaxRequestBytes = 0xFFFF;

// Length-prefixed request frame. Throws ConnectionFault if too long.
std::string encodeRequest(const std::string& payload);

// Parses a 4 hex digit length; -1 if malformed.
int decodeLength(const char* hex4);

struct DeviceListEntry {
    std::string serial;
    std::string state;   // "device", "offline", "unauthorized", ...
};

// Parses the host:devices table ("serial\tstate" lines).
std::vector<DeviceListEntry> parseDeviceList(const std::string& text);

// Serials that are online, addressable and pass validation.
std::vector<std::string> usableSerials(const std::vector<DeviceListEntry>& entries);

struct Endpoint {
    std::string host = "127.0.0.1";
    int port = kDefaultPort;
    double io_timeout_s = 60.0;   // socket receive timeout
};

class AdbClient : public Transport {
public:
    explicit AdbClient(Endpoint endpoint = Endpoint());

    std::vector<DeviceHandlePtr> listDevices() override;

    // Raw host:devices table.
    std::vector<DeviceListEntry> deviceTable();

    // host:version as an integer.
    int serverVersion();

    const Endpoint& endpoint() const { return endpoint_; }

private:
    Endpoint endpoint_;
};

class AdbDevice : public DeviceHandle {
public:
    // Throws ConnectionFault for serials that fail validation.
    AdbDevice(Endpoint endpoint, std::string serial);

    std::string serial() const override { return serial_; }
    std::string getProperty(const std::string& key) override;
    std::vector<uint8_t> captureScreenRaw() override;
    std::string shell(const std::string& command) override;

private:
    std::vector<uint8_t> runService(const std::string& service, size_t max_bytes);

    Endpoint endpoint_;
    std::string serial_;
};

} // namespace adb
} // namespace tapdeck
