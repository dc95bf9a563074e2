// =============================================================================
// Tapdeck - ADB Server Client Implementation
// =============================================================================
#include "adb_client.hpp"
#include "adb_security.hpp"
#include "errors.hpp"
#include "tapdeck_log.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>

namespace tapdeck {
namespace adb {

namespace {

// Owns one connection to the ADB server.
class ServerSocket {
public:
    explicit ServerSocket(const Endpoint& ep) {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;
        std::string port = std::to_string(ep.port);
        int rc = getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &res);
        if (rc != 0) {
            throw ConnectionFault("ADB server address " + ep.host + ": " + gai_strerror(rc));
        }

        int last_errno = 0;
        for (addrinfo* ai = res; ai; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_errno = errno; continue; }

            timeval tv{};
            tv.tv_sec = (time_t)ep.io_timeout_s;
            tv.tv_usec = (suseconds_t)((ep.io_timeout_s - (double)tv.tv_sec) * 1e6);
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

            if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
                fd_ = fd;
                break;
            }
            last_errno = errno;
            ::close(fd);
        }
        freeaddrinfo(res);

        if (fd_ < 0) {
            throw ConnectionFault("Cannot connect to ADB server at " + ep.host + ":" +
                                  port + " (" + std::strerror(last_errno) + ")");
        }
    }

    ~ServerSocket() { if (fd_ >= 0) ::close(fd_); }

    ServerSocket(const ServerSocket&) = delete;
    ServerSocket& operator=(const ServerSocket&) = delete;

    void sendRequest(const std::string& payload) {
        std::string frame = encodeRequest(payload);
        size_t sent = 0;
        while (sent < frame.size()) {
            ssize_t n = ::send(fd_, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw ConnectionFault("ADB send failed: " + std::string(std::strerror(errno)));
            }
            sent += (size_t)n;
        }
    }

    void readExact(char* buf, size_t len) {
        size_t got = 0;
        while (got < len) {
            ssize_t n = ::recv(fd_, buf + got, len - got, 0);
            if (n == 0) throw ConnectionFault("ADB server closed the connection");
            if (n < 0) {
                if (errno == EINTR) continue;
                throw ConnectionFault("ADB recv failed: " + std::string(std::strerror(errno)));
            }
            got += (size_t)n;
        }
    }

    // Reads OKAY, or turns FAIL into a ConnectionFault carrying the message.
    void expectOkay(const std::string& request) {
        char status[4];
        readExact(status, 4);
        if (std::memcmp(status, "OKAY", 4) == 0) return;
        if (std::memcmp(status, "FAIL", 4) == 0) {
            throw ConnectionFault("ADB " + request + " failed: " + readLengthPrefixed());
        }
        throw ConnectionFault("ADB " + request + ": unexpected reply '" +
                              std::string(status, 4) + "'");
    }

    std::string readLengthPrefixed() {
        char hex[4];
        readExact(hex, 4);
        int len = decodeLength(hex);
        if (len < 0) throw ConnectionFault("ADB reply has malformed length");
        std::string out((size_t)len, '\0');
        if (len > 0) readExact(&out[0], (size_t)len);
        return out;
    }

    std::vector<uint8_t> readToEnd(size_t max_bytes) {
        std::vector<uint8_t> out;
        uint8_t buf[64 * 1024];
        for (;;) {
            ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n == 0) break;
            if (n < 0) {
                if (errno == EINTR) continue;
                throw ConnectionFault("ADB stream read failed: " + std::string(std::strerror(errno)));
            }
            if (out.size() + (size_t)n > max_bytes) {
                throw ConnectionFault("ADB stream exceeds " + std::to_string(max_bytes) + " bytes");
            }
            out.insert(out.end(), buf, buf + n);
        }
        return out;
    }

private:
    int fd_ = -1;
};

bool isValidPropertyKey(const std::string& key) {
    if (key.empty() || key.size() > 128) return false;
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// =============================================================================
// Framing helpers
// =============================================================================

std::string encodeRequest(const std::string& payload) {
    if (payload.size() > kMaxRequestBytes) {
        throw ConnectionFault("ADB request too long (" + std::to_string(payload.size()) + " bytes)");
    }
    char hex[5];
    snprintf(hex, sizeof(hex), "%04x", (unsigned)payload.size());
    return std::string(hex, 4) + payload;
}

int decodeLength(const char* hex4) {
    int value = 0;
    for (int i = 0; i < 4; ++i) {
        char c = hex4[i];
        int digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
        else return -1;
        value = value * 16 + digit;
    }
    return value;
}

std::vector<DeviceListEntry> parseDeviceList(const std::string& text) {
    std::vector<DeviceListEntry> entries;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.find("List of devices") != std::string::npos) continue;
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
        if (line.empty()) continue;

        size_t tab_pos = line.find('\t');
        if (tab_pos == std::string::npos) continue;

        DeviceListEntry e;
        e.serial = line.substr(0, tab_pos);
        e.state = line.substr(tab_pos + 1);
        entries.push_back(std::move(e));
    }
    return entries;
}

std::vector<std::string> usableSerials(const std::vector<DeviceListEntry>& entries) {
    std::vector<std::string> serials;
    for (const auto& e : entries) {
        if (e.state != "device") continue;
        if (security::isMdnsRecord(e.serial)) continue;
        if (!security::isValidAdbId(e.serial)) {
            TLOG_WARN("adb", "Ignoring device with invalid serial (%zu chars)", e.serial.size());
            continue;
        }
        serials.push_back(e.serial);
    }
    return serials;
}

// =============================================================================
// AdbClient
// =============================================================================

AdbClient::AdbClient(Endpoint endpoint) : endpoint_(std::move(endpoint)) {}

std::vector<DeviceListEntry> AdbClient::deviceTable() {
    ServerSocket sock(endpoint_);
    sock.sendRequest("host:devices");
    sock.expectOkay("host:devices");
    return parseDeviceList(sock.readLengthPrefixed());
}

std::vector<DeviceHandlePtr> AdbClient::listDevices() {
    auto serials = usableSerials(deviceTable());
    TLOG_DEBUG("adb", "host:devices -> %zu usable", serials.size());

    std::vector<DeviceHandlePtr> devices;
    devices.reserve(serials.size());
    for (auto& serial : serials) {
        devices.push_back(std::make_shared<AdbDevice>(endpoint_, std::move(serial)));
    }
    return devices;
}

int AdbClient::serverVersion() {
    ServerSocket sock(endpoint_);
    sock.sendRequest("host:version");
    sock.expectOkay("host:version");
    std::string payload = sock.readLengthPrefixed();
    if (payload.size() != 4) throw ConnectionFault("ADB host:version: malformed reply");
    int v = decodeLength(payload.data());
    if (v < 0) throw ConnectionFault("ADB host:version: malformed reply");
    return v;
}

// =============================================================================
// AdbDevice
// =============================================================================

AdbDevice::AdbDevice(Endpoint endpoint, std::string serial)
    : endpoint_(std::move(endpoint)), serial_(std::move(serial)) {
    if (!security::isValidAdbId(serial_)) {
        throw ConnectionFault("Invalid device serial");
    }
}

std::vector<uint8_t> AdbDevice::runService(const std::string& service, size_t max_bytes) {
    ServerSocket sock(endpoint_);
    const std::string transport = "host:transport:" + serial_;
    sock.sendRequest(transport);
    sock.expectOkay(transport);
    sock.sendRequest(service);
    sock.expectOkay(service.substr(0, service.find(':')));
    return sock.readToEnd(max_bytes);
}

std::string AdbDevice::getProperty(const std::string& key) {
    if (!isValidPropertyKey(key)) {
        throw ConnectionFault("Invalid property key: " + key);
    }
    std::string value = shell("getprop " + key);
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
        value.pop_back();
    }
    return value;
}

std::vector<uint8_t> AdbDevice::captureScreenRaw() {
    auto bytes = runService("exec:screencap -p", kMaxCaptureBytes);
    TLOG_TRACE("adb", "%s: screencap %zu bytes", serial_.c_str(), bytes.size());
    return bytes;
}

std::string AdbDevice::shell(const std::string& command) {
    auto out = runService("shell:" + command, kMaxShellBytes);
    return std::string(out.begin(), out.end());
}

} // namespace adb
} // namespace tapdeck
