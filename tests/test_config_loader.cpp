// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, file loading, master/game merge, cache, accessors
// =============================================================================
#include <gtest/gtest.h>
#include <fstream>
#include <cstdio>
#include "config_loader.hpp"

using namespace tapdeck;
using namespace tapdeck::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static std::string tmpPath(const char* name) {
    return ::testing::TempDir() + name;
}

static std::string writeTmpJson(const char* name, const char* content) {
    std::string path = tmpPath(name);
    std::ofstream f(path);
    f << content;
    return path;
}

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.adb.host,                          "127.0.0.1");
    EXPECT_EQ(cfg.adb.port,                          5037);
    EXPECT_EQ(cfg.device.max_reconnect_attempts,     10);
    EXPECT_DOUBLE_EQ(cfg.device.adb_timeout_s,       30.0);
    EXPECT_DOUBLE_EQ(cfg.device.lock_timeout_s,      10.0);
    EXPECT_EQ(cfg.device.adb_workers,                4);
    EXPECT_EQ(cfg.bot.stop_limit,                    6);
    EXPECT_FALSE(cfg.bot.fix_enabled);
    EXPECT_EQ(cfg.log.level,                         "info");
    EXPECT_TRUE(cfg.log.path.empty());
}

TEST(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    AppConfig cfg = loadConfig("__nonexistent_config_xyz.json");
    EXPECT_EQ(cfg.adb.port, 5037);
    EXPECT_EQ(cfg.device.max_reconnect_attempts, 10);
    EXPECT_TRUE(cfg.devices.empty());
}

// ---------------------------------------------------------------------------
// readJsonFile
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, ReadJsonFileMissing) {
    auto res = readJsonFile("__nonexistent_config_xyz.json");
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.error().code, kErrNotFound);
}

TEST(ConfigLoaderTest, ReadJsonFileMalformed) {
    std::string path = writeTmpJson("tapdeck_bad.json", "{ not json ");
    auto res = readJsonFile(path);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.error().code, kErrParse);
    std::remove(path.c_str());
}

TEST(ConfigLoaderTest, MalformedFileFallsBackToDefaults) {
    std::string path = writeTmpJson("tapdeck_bad2.json", "{\"adb\": ");
    AppConfig cfg = loadConfig(path);
    EXPECT_EQ(cfg.adb.port, 5037);
    std::remove(path.c_str());
}

// ---------------------------------------------------------------------------
// parseConfig
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, ParseAllKeys) {
    auto j = nlohmann::json::parse(R"({
        "adb": {"host": "10.0.0.2", "port": 5038},
        "max_reconnect_attempts": 3,
        "adb_timeout": 12.5,
        "lock_timeout": 2,
        "adb_workers": 8,
        "devices": {"phone": {"serial": "R5CT123", "lang": "en"}},
        "functions": ["doA", "doB"],
        "enabled": ["doB"],
        "cooldowns": {"doA": 300, "doB": 45.5},
        "commands": ["cmdX"],
        "bot_settings": {"sleep_seconds": 2, "fix_enabled": true, "stop": 9},
        "findimg_path": "needles",
        "log": {"path": "tapdeck.log", "level": "debug"}
    })");
    AppConfig cfg = parseConfig(j);

    EXPECT_EQ(cfg.adb.host, "10.0.0.2");
    EXPECT_EQ(cfg.adb.port, 5038);
    EXPECT_EQ(cfg.device.max_reconnect_attempts, 3);
    EXPECT_DOUBLE_EQ(cfg.device.adb_timeout_s, 12.5);
    EXPECT_DOUBLE_EQ(cfg.device.lock_timeout_s, 2.0);
    EXPECT_EQ(cfg.device.adb_workers, 8);
    ASSERT_EQ(cfg.devices.count("phone"), 1u);
    EXPECT_EQ(cfg.devices["phone"].serial, "R5CT123");
    EXPECT_EQ(cfg.bot.functions, (std::vector<std::string>{"doA", "doB"}));
    EXPECT_EQ(cfg.bot.enabled, (std::vector<std::string>{"doB"}));
    EXPECT_DOUBLE_EQ(cfg.bot.cooldowns["doA"], 300.0);
    EXPECT_DOUBLE_EQ(cfg.bot.cooldowns["doB"], 45.5);
    EXPECT_EQ(cfg.bot.commands, (std::vector<std::string>{"cmdX"}));
    EXPECT_DOUBLE_EQ(cfg.bot.sleep_seconds, 2.0);
    EXPECT_TRUE(cfg.bot.fix_enabled);
    EXPECT_EQ(cfg.bot.stop_limit, 9);
    EXPECT_EQ(cfg.bot.findimg_path, "needles");
    EXPECT_EQ(cfg.log.path, "tapdeck.log");
    EXPECT_EQ(cfg.log.level, "debug");
}

TEST(ConfigLoaderTest, EnabledDefaultsToFunctions) {
    auto j = nlohmann::json::parse(R"({"functions": ["doA", "doB"]})");
    AppConfig cfg = parseConfig(j);
    EXPECT_EQ(cfg.bot.enabled, cfg.bot.functions);
}

TEST(ConfigLoaderTest, WrongTypeUsesDefault) {
    auto j = nlohmann::json::parse(R"({"adb": {"port": "not-a-number"}, "adb_timeout": "x"})");
    AppConfig cfg = parseConfig(j);
    EXPECT_EQ(cfg.adb.port, 5037);
    EXPECT_DOUBLE_EQ(cfg.device.adb_timeout_s, 30.0);
}

TEST(ConfigLoaderTest, WorkerAndAttemptFloors) {
    auto j = nlohmann::json::parse(R"({"max_reconnect_attempts": 0, "adb_workers": -2})");
    AppConfig cfg = parseConfig(j);
    EXPECT_EQ(cfg.device.max_reconnect_attempts, 1);
    EXPECT_EQ(cfg.device.adb_workers, 1);
}

// ---------------------------------------------------------------------------
// mergeConfigs
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, GameOverlaysMaster) {
    auto master = nlohmann::json::parse(R"({
        "adb_timeout": 30,
        "functions": ["doOld"],
        "devices": {"phone": {"serial": "AAA", "lang": "en"}, "tablet": {"serial": "BBB"}}
    })");
    auto game = nlohmann::json::parse(R"({
        "functions": ["doNew"],
        "devices": {"phone": {"lang": "ja", "account": 2}}
    })");
    auto merged = mergeConfigs(master, game);

    EXPECT_EQ(merged["adb_timeout"], 30);
    EXPECT_EQ(merged["functions"], nlohmann::json::array({"doNew"}));
    EXPECT_EQ(merged["devices"]["phone"]["serial"], "AAA");
    EXPECT_EQ(merged["devices"]["phone"]["lang"], "ja");
    EXPECT_EQ(merged["devices"]["phone"]["account"], 2);
    EXPECT_EQ(merged["devices"]["tablet"]["serial"], "BBB");
}

TEST(ConfigLoaderTest, LoadConfigMergesFiles) {
    std::string master = writeTmpJson("tapdeck_master.json",
        R"({"devices": {"phone": {"serial": "AAA"}}, "adb": {"port": 5039}})");
    std::string game = writeTmpJson("tapdeck_game.json",
        R"({"functions": ["doHelloWorld"], "devices": {"phone": {"lang": "ja"}}})");

    AppConfig cfg = loadConfig(master, game);
    EXPECT_EQ(cfg.adb.port, 5039);
    EXPECT_EQ(cfg.bot.functions.size(), 1u);
    EXPECT_EQ(getDeviceOption<std::string>(cfg, "phone", "lang", "en"), "ja");
    EXPECT_EQ(getSerial(cfg, "phone").value(), "AAA");

    std::remove(master.c_str());
    std::remove(game.c_str());
}

// ---------------------------------------------------------------------------
// Cache
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, CachedUntilReload) {
    std::string path = writeTmpJson("tapdeck_cache.json", R"({"adb_workers": 2})");
    setConfigPaths(path);
    EXPECT_EQ(getConfig().device.adb_workers, 2);

    writeTmpJson("tapdeck_cache.json", R"({"adb_workers": 6})");
    EXPECT_EQ(getConfig().device.adb_workers, 2);
    EXPECT_EQ(reloadConfig().device.adb_workers, 6);
    EXPECT_EQ(getConfig().device.adb_workers, 6);

    std::remove(path.c_str());
    setConfigPaths("master.json");
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, GetSerialErrors) {
    AppConfig cfg;
    cfg.devices["nosn"] = DeviceEntry{};
    EXPECT_EQ(getSerial(cfg, "missing").error().code, kErrNotFound);
    EXPECT_EQ(getSerial(cfg, "nosn").error().code, kErrValidation);
}

TEST(ConfigLoaderTest, AvailableDevicesSorted) {
    AppConfig cfg;
    cfg.devices["tablet"] = DeviceEntry{};
    cfg.devices["phone"] = DeviceEntry{};
    EXPECT_EQ(availableDevices(cfg), (std::vector<std::string>{"phone", "tablet"}));
}

TEST(ConfigLoaderTest, DeviceOptionDefaults) {
    AppConfig cfg;
    EXPECT_EQ(getDeviceOption<int>(cfg, "ghost", "account", 7), 7);
}

TEST(ConfigLoaderTest, FormatCooldownTime) {
    EXPECT_EQ(formatCooldownTime(0), "0s");
    EXPECT_EQ(formatCooldownTime(45), "45s");
    EXPECT_EQ(formatCooldownTime(59.9), "59s");
    EXPECT_EQ(formatCooldownTime(60), "1m");
    EXPECT_EQ(formatCooldownTime(89), "1m");
    EXPECT_EQ(formatCooldownTime(90), "2m");
    EXPECT_EQ(formatCooldownTime(300), "5m");
}
