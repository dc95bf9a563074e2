// =============================================================================
// Unit tests for the ADB server client (src/adb_client.hpp)
// =============================================================================
// A small in-process server speaks the smart-socket protocol on an ephemeral
// port so the client is exercised end to end without a real adb.
// =============================================================================
#include <gtest/gtest.h>
#include "adb_client.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <thread>

using namespace tapdeck;
using namespace tapdeck::adb;

// =============================================================================
// Framing
// =============================================================================

TEST(AdbFramingTest, EncodeRequest) {
    EXPECT_EQ(encodeRequest("host:version"), "000chost:version");
    EXPECT_EQ(encodeRequest(""), "0000");
    EXPECT_EQ(encodeRequest(std::string(300, 'a')).substr(0, 4), "012c");
}

TEST(AdbFramingTest, OversizedRequestThrows) {
    EXPECT_THROW(encodeRequest(std::string(kMaxRequestBytes + 1, 'x')), ConnectionFault);
    EXPECT_NO_THROW(encodeRequest(std::string(kMaxRequestBytes, 'x')));
}

TEST(AdbFramingTest, DecodeLength) {
    EXPECT_EQ(decodeLength("000c"), 12);
    EXPECT_EQ(decodeLength("FFFF"), 0xFFFF);
    EXPECT_EQ(decodeLength("0a0B"), 0x0a0b);
    EXPECT_EQ(decodeLength("00g0"), -1);
    EXPECT_EQ(decodeLength("-001"), -1);
}

// =============================================================================
// Device table
// =============================================================================

TEST(AdbDeviceListTest, ParsesTable) {
    auto entries = parseDeviceList(
        "List of devices attached\n"
        "emulator-5554\tdevice\n"
        "\n"
        "R58M123ABC\tunauthorized\r\n"
        "garbage line without tab\n"
        "192.168.1.20:5555\toffline \n");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].serial, "emulator-5554");
    EXPECT_EQ(entries[0].state, "device");
    EXPECT_EQ(entries[1].serial, "R58M123ABC");
    EXPECT_EQ(entries[1].state, "unauthorized");
    EXPECT_EQ(entries[2].state, "offline");
}

TEST(AdbDeviceListTest, EmptyTable) {
    EXPECT_TRUE(parseDeviceList("").empty());
    EXPECT_TRUE(parseDeviceList("List of devices attached\n\n").empty());
}

TEST(AdbDeviceListTest, UsableSerialsFiltersStateAndName) {
    std::vector<DeviceListEntry> entries = {
        {"emulator-5554", "device"},
        {"R58M123ABC", "unauthorized"},
        {"192.168.1.20:5555", "offline"},
        {"adb-R58M-xyz._adb-tls-connect._tcp", "device"},
        {"bad;rm -rf", "device"},
        {"127.0.0.1:5555", "device"},
    };
    auto serials = usableSerials(entries);
    EXPECT_EQ(serials, (std::vector<std::string>{"emulator-5554", "127.0.0.1:5555"}));
}

TEST(AdbDeviceTest, InvalidSerialRejected) {
    EXPECT_THROW(AdbDevice(Endpoint(), "dev$(reboot)"), ConnectionFault);
    EXPECT_THROW(AdbDevice(Endpoint(), ""), ConnectionFault);
    EXPECT_NO_THROW(AdbDevice(Endpoint(), "emulator-5554"));
}

// =============================================================================
// Against an in-process server
// =============================================================================

namespace {

class FakeAdbServer {
public:
    FakeAdbServer() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 8);
        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { acceptLoop(); });
    }

    ~FakeAdbServer() {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        if (thread_.joinable()) thread_.join();
    }

    Endpoint endpoint() const {
        Endpoint ep;
        ep.host = "127.0.0.1";
        ep.port = port_;
        ep.io_timeout_s = 5.0;
        return ep;
    }

    std::string devices_table = "emulator-5554\tdevice\nR58M\toffline\n";
    std::string reported_serial = "EMU5554SERIAL";
    std::vector<uint8_t> screencap;
    std::vector<std::string> shell_log;

private:
    void acceptLoop() {
        for (;;) {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) return;
            serve(fd);
            ::close(fd);
        }
    }

    static bool readRequest(int fd, std::string& out) {
        char hex[5] = {0};
        if (!readExact(fd, hex, 4)) return false;
        int len = decodeLength(hex);
        if (len < 0) return false;
        out.assign((size_t)len, '\0');
        return len == 0 || readExact(fd, &out[0], (size_t)len);
    }

    static bool readExact(int fd, char* buf, size_t len) {
        size_t got = 0;
        while (got < len) {
            ssize_t n = ::recv(fd, buf + got, len - got, 0);
            if (n <= 0) return false;
            got += (size_t)n;
        }
        return true;
    }

    static void sendAll(int fd, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += (size_t)n;
        }
    }

    static std::string prefixed(const std::string& payload) {
        char hex[5];
        snprintf(hex, sizeof(hex), "%04x", (unsigned)payload.size());
        return std::string(hex, 4) + payload;
    }

    void serve(int fd) {
        std::string req;
        if (!readRequest(fd, req)) return;

        if (req == "host:version") {
            sendAll(fd, "OKAY" + prefixed("0029"));
            return;
        }
        if (req == "host:devices") {
            sendAll(fd, "OKAY" + prefixed(devices_table));
            return;
        }
        if (req.rfind("host:transport:", 0) == 0) {
            if (req != "host:transport:emulator-5554") {
                sendAll(fd, "FAIL" + prefixed("device not found"));
                return;
            }
            sendAll(fd, "OKAY");
            std::string service;
            if (!readRequest(fd, service)) return;
            if (service == "exec:screencap -p") {
                sendAll(fd, "OKAY" + std::string(screencap.begin(), screencap.end()));
            } else if (service == "shell:getprop ro.boot.serialno") {
                sendAll(fd, "OKAY" + reported_serial + "\r\n");
            } else if (service.rfind("shell:", 0) == 0) {
                shell_log.push_back(service.substr(6));
                sendAll(fd, "OKAY");
            } else {
                sendAll(fd, "FAIL" + prefixed("unknown service"));
            }
            return;
        }
        sendAll(fd, "FAIL" + prefixed("unknown host service"));
    }

    int listen_fd_ = -1;
    int port_ = 0;
    std::thread thread_;
};

} // namespace

TEST(AdbClientTest, ServerVersion) {
    FakeAdbServer server;
    AdbClient client(server.endpoint());
    EXPECT_EQ(client.serverVersion(), 0x29);
}

TEST(AdbClientTest, ListDevicesReturnsOnlineDevices) {
    FakeAdbServer server;
    AdbClient client(server.endpoint());

    auto table = client.deviceTable();
    EXPECT_EQ(table.size(), 2u);

    auto devices = client.listDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0]->serial(), "emulator-5554");
}

TEST(AdbClientTest, DeviceServices) {
    FakeAdbServer server;
    server.screencap = testing_support::encodePng(testing_support::solidImage(4, 4, 1, 2, 3));
    AdbClient client(server.endpoint());
    auto devices = client.listDevices();
    ASSERT_EQ(devices.size(), 1u);
    auto& dev = devices[0];

    EXPECT_EQ(dev->getProperty("ro.boot.serialno"), "EMU5554SERIAL");
    EXPECT_EQ(dev->captureScreenRaw(), server.screencap);
    dev->shell("input tap 10 20");
    ASSERT_EQ(server.shell_log.size(), 1u);
    EXPECT_EQ(server.shell_log[0], "input tap 10 20");
}

TEST(AdbClientTest, InvalidPropertyKeyRejected) {
    FakeAdbServer server;
    AdbDevice dev(server.endpoint(), "emulator-5554");
    EXPECT_THROW(dev.getProperty("ro.x; reboot"), ConnectionFault);
}

TEST(AdbClientTest, ServerFailBecomesConnectionFault) {
    FakeAdbServer server;
    AdbDevice gone(server.endpoint(), "vanished-1");
    try {
        gone.shell("echo hi");
        FAIL() << "expected ConnectionFault";
    } catch (const ConnectionFault& e) {
        EXPECT_NE(std::string(e.what()).find("device not found"), std::string::npos);
    }
}

TEST(AdbClientTest, UnreachableServer) {
    Endpoint ep;
    ep.host = "127.0.0.1";
    ep.port = 1;
    AdbClient client(ep);
    EXPECT_THROW(client.listDevices(), ConnectionFault);
}
