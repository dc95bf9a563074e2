// =============================================================================
// Tapdeck Config Loader
// =============================================================================
#include "config_loader.hpp"

#include <cmath>
#include <fstream>
#include <mutex>
#include <optional>

namespace tapdeck {
namespace config {

namespace {

std::mutex g_cache_mutex;
std::string g_master_path = "master.json";
std::string g_game_path;
std::optional<AppConfig> g_cached;

std::vector<std::string> stringList(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& v : j[key]) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

} // anonymous namespace

Result<nlohmann::json> readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<nlohmann::json>("config file not found: " + path, kErrNotFound);
    }
    try {
        return Ok(nlohmann::json::parse(file));
    } catch (const nlohmann::json::exception& e) {
        return Err<nlohmann::json>(path + ": JSON parse error: " + e.what(), kErrParse);
    }
}

nlohmann::json mergeConfigs(const nlohmann::json& master, const nlohmann::json& game) {
    nlohmann::json merged = master.is_object() ? master : nlohmann::json::object();
    if (!game.is_object()) return merged;

    for (auto it = game.begin(); it != game.end(); ++it) {
        if (it.key() != "devices") merged[it.key()] = it.value();
    }

    if (game.contains("devices") && game["devices"].is_object()) {
        nlohmann::json& devices = merged["devices"];
        if (!devices.is_object()) devices = nlohmann::json::object();
        for (auto dev = game["devices"].begin(); dev != game["devices"].end(); ++dev) {
            if (!dev.value().is_object()) continue;
            nlohmann::json& target = devices[dev.key()];
            if (!target.is_object()) target = nlohmann::json::object();
            target.update(dev.value());
        }
    }
    return merged;
}

AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig config;

    config.adb.host = jsonGet<std::string>(j, "adb", "host", "127.0.0.1");
    config.adb.port = jsonGet<int>(j, "adb", "port", 5037);

    config.device.max_reconnect_attempts = jsonGet<int>(j, "max_reconnect_attempts", 10);
    config.device.adb_timeout_s = jsonGet<double>(j, "adb_timeout", 30.0);
    config.device.lock_timeout_s = jsonGet<double>(j, "lock_timeout", 10.0);
    config.device.adb_workers = jsonGet<int>(j, "adb_workers", 4);
    if (config.device.max_reconnect_attempts < 1) config.device.max_reconnect_attempts = 1;
    if (config.device.adb_workers < 1) config.device.adb_workers = 1;

    if (j.contains("devices") && j["devices"].is_object()) {
        for (auto it = j["devices"].begin(); it != j["devices"].end(); ++it) {
            if (!it.value().is_object()) continue;
            DeviceEntry entry;
            entry.options = it.value();
            entry.serial = jsonGet<std::string>(it.value(), "serial", "");
            config.devices[it.key()] = std::move(entry);
        }
    }

    config.bot.functions = stringList(j, "functions");
    config.bot.enabled = j.contains("enabled") ? stringList(j, "enabled") : config.bot.functions;
    config.bot.commands = stringList(j, "commands");
    if (j.contains("cooldowns") && j["cooldowns"].is_object()) {
        for (auto it = j["cooldowns"].begin(); it != j["cooldowns"].end(); ++it) {
            if (it.value().is_number()) config.bot.cooldowns[it.key()] = it.value().get<double>();
        }
    }
    config.bot.sleep_seconds = jsonGet<double>(j, "bot_settings", "sleep_seconds", 0.0);
    config.bot.fix_enabled = jsonGet<bool>(j, "bot_settings", "fix_enabled", false);
    config.bot.stop_limit = jsonGet<int>(j, "bot_settings", "stop", 6);
    config.bot.findimg_path = jsonGet<std::string>(j, "findimg_path", "");

    config.log.path = jsonGet<std::string>(j, "log", "path", "");
    config.log.level = jsonGet<std::string>(j, "log", "level", "info");

    return config;
}

AppConfig loadConfig(const std::string& master_path, const std::string& game_path) {
    nlohmann::json master = nlohmann::json::object();
    auto master_res = readJsonFile(master_path);
    if (master_res) {
        master = std::move(master_res).value();
    } else if (master_res.error().code == kErrNotFound) {
        TLOG_WARN("config", "%s not found, using defaults", master_path.c_str());
    } else {
        TLOG_ERROR("config", "%s", master_res.error().message.c_str());
    }

    nlohmann::json game = nlohmann::json::object();
    if (!game_path.empty()) {
        auto game_res = readJsonFile(game_path);
        if (game_res) {
            game = std::move(game_res).value();
        } else {
            TLOG_ERROR("config", "%s", game_res.error().message.c_str());
        }
    }

    AppConfig config = parseConfig(mergeConfigs(master, game));

    TLOG_INFO("config", "Loaded: adb=%s:%d, devices=%zu, functions=%zu, max_reconnect=%d, adb_timeout=%.1fs",
              config.adb.host.c_str(), config.adb.port, config.devices.size(),
              config.bot.functions.size(), config.device.max_reconnect_attempts,
              config.device.adb_timeout_s);
    return config;
}

void setConfigPaths(const std::string& master_path, const std::string& game_path) {
    std::lock_guard<std::mutex> lock(g_cache_mutex);
    g_master_path = master_path;
    g_game_path = game_path;
    g_cached.reset();
}

AppConfig getConfig() {
    std::lock_guard<std::mutex> lock(g_cache_mutex);
    if (!g_cached) g_cached = loadConfig(g_master_path, g_game_path);
    return *g_cached;
}

AppConfig reloadConfig() {
    std::lock_guard<std::mutex> lock(g_cache_mutex);
    g_cached = loadConfig(g_master_path, g_game_path);
    return *g_cached;
}

Result<std::string> getSerial(const AppConfig& cfg, const std::string& device_name) {
    auto it = cfg.devices.find(device_name);
    if (it == cfg.devices.end()) {
        return Err<std::string>("Unknown device: " + device_name, kErrNotFound);
    }
    if (it->second.serial.empty()) {
        return Err<std::string>("Device " + device_name + " has no serial", kErrValidation);
    }
    return Ok(it->second.serial);
}

std::vector<std::string> availableDevices(const AppConfig& cfg) {
    std::vector<std::string> names;
    for (const auto& [name, entry] : cfg.devices) names.push_back(name);
    return names;
}

std::string formatCooldownTime(double seconds) {
    if (seconds < 60) {
        return std::to_string(static_cast<int>(seconds)) + "s";
    }
    return std::to_string(static_cast<long>(std::lround(seconds / 60.0))) + "m";
}

} // namespace config
} // namespace tapdeck
