#pragma once
// =============================================================================
// Tapdeck Config Loader
// =============================================================================
// Loads master.json (process-wide settings, device list) and an optional game
// file that overlays it. Parsed with nlohmann/json; loaded once and cached.
// =============================================================================

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "result.hpp"
#include "tapdeck_log.hpp"

namespace tapdeck {
namespace config {

struct AdbConfig {
    std::string host = "127.0.0.1";
    int port = 5037;
};

// Device layer tunables
struct DeviceLayerConfig {
    int max_reconnect_attempts = 10;
    double adb_timeout_s = 30.0;     // default operation deadline
    double lock_timeout_s = 10.0;    // command lock acquire bound
    int adb_workers = 4;             // timeout executor pool size
};

struct DeviceEntry {
    std::string serial;
    nlohmann::json options = nlohmann::json::object();  // merged master + game keys
};

struct BotConfig {
    std::vector<std::string> functions;          // loop order
    std::vector<std::string> enabled;            // initially enabled subset
    std::map<std::string, double> cooldowns;     // id -> seconds
    std::vector<std::string> commands;           // triggerable command ids
    double sleep_seconds = 0.0;
    bool fix_enabled = false;
    int stop_limit = 6;
    std::string findimg_path;
};

struct LogConfig {
    std::string path;            // empty = stderr only
    std::string level = "info";
};

struct AppConfig {
    AdbConfig adb;
    DeviceLayerConfig device;
    std::map<std::string, DeviceEntry> devices;  // name -> entry
    BotConfig bot;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].is_object() && j[section].contains(key)) {
            return j[section][key].get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        TLOG_WARN("config", "%s.%s has wrong type, using default (%s)",
                  section.c_str(), key.c_str(), e.what());
    }
    return def;
}

template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& key, const T& def) {
    try {
        if (j.contains(key)) return j[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        TLOG_WARN("config", "%s has wrong type, using default (%s)", key.c_str(), e.what());
    }
    return def;
}

// Reads and parses one JSON file. Missing file -> kErrNotFound,
// malformed JSON -> kErrParse.
Result<nlohmann::json> readJsonFile(const std::string& path);

// Master values first, game keys overlaid; devices merged per key.
nlohmann::json mergeConfigs(const nlohmann::json& master, const nlohmann::json& game);

AppConfig parseConfig(const nlohmann::json& j);

// Missing or malformed files fall back to defaults with a log line.
AppConfig loadConfig(const std::string& master_path = "master.json",
                     const std::string& game_path = "");

// Cached configuration. setConfigPaths() selects the files and drops the cache.
void setConfigPaths(const std::string& master_path, const std::string& game_path = "");
AppConfig getConfig();
AppConfig reloadConfig();

Result<std::string> getSerial(const AppConfig& cfg, const std::string& device_name);
std::vector<std::string> availableDevices(const AppConfig& cfg);

template<typename T>
T getDeviceOption(const AppConfig& cfg, const std::string& device_name,
                  const std::string& option, const T& def) {
    auto it = cfg.devices.find(device_name);
    if (it == cfg.devices.end()) return def;
    return jsonGet<T>(it->second.options, option, def);
}

// "45s" below one minute, otherwise rounded minutes ("5m").
std::string formatCooldownTime(double seconds);

} // namespace config
} // namespace tapdeck
