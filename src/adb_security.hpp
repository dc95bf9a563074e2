#pragma once
// =============================================================================
// adb_security.hpp
//
// Validation for everything that ends up inside an ADB service request.
// Device serials name the transport; shell arguments are quoted before they
// reach the device shell.
// =============================================================================

#include <cctype>
#include <cstring>
#include <string>

namespace tapdeck {
namespace security {

// Dangerous shell metacharacters that could enable command injection
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";

/**
 * Validate ADB device serial format.
 * Valid formats:
 *   - Serial number: alphanumeric, may include ':', '.', '-', '_'
 *   - IP:port: xxx.xxx.xxx.xxx:port
 */
inline bool isValidAdbId(const std::string& adb_id) {
    if (adb_id.empty() || adb_id.length() > 64) {
        return false;
    }

    for (char c : adb_id) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            return false;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }

    return true;
}

// mDNS service records listed by `host:devices`
// (e.g. adb-XXXX-abc._adb-tls-connect._tcp) are not addressable devices.
inline bool isMdnsRecord(const std::string& adb_id) {
    return adb_id.rfind("adb-", 0) == 0 && adb_id.find("._adb") != std::string::npos;
}

/**
 * Quote one argument for the device shell. The whole argument is wrapped in
 * single quotes; embedded single quotes become '\''.
 */
inline std::string quoteShellArg(const std::string& arg) {
    std::string quoted;
    quoted.reserve(arg.length() + 2);
    quoted += '\'';
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

} // namespace security
} // namespace tapdeck
