// =============================================================================
// Tapdeck - headless runner
// =============================================================================
// tapdeck --config <master.json> [--game <game.json>] --device <name>
//         [--poll-ms N] [--log-level L]
// tapdeck --config <master.json> --list-devices
// =============================================================================
#include "adb_client.hpp"
#include "bot_controller.hpp"
#include "config_loader.hpp"
#include "device_context.hpp"
#include "event_bus.hpp"
#include "screenshot_poller.hpp"
#include "tapdeck_log.hpp"
#include "games/template_game.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

using namespace tapdeck;

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running = false;
}

struct Args {
    std::string config = "master.json";
    std::string game;
    std::string device;
    std::string log_level;
    int poll_ms = 0;
    bool list_devices = false;
};

void usage(const char* prog) {
    fprintf(stderr,
            "Usage: %s --config <master.json> [--game <game.json>] --device <name>\n"
            "          [--poll-ms N] [--log-level trace|debug|info|warn|error]\n"
            "       %s --config <master.json> --list-devices\n",
            prog, prog);
}

bool parseArgs(int argc, char* argv[], Args& out) {
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        auto next = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                fprintf(stderr, "%s needs a value\n", name);
                return nullptr;
            }
            return argv[++i];
        };
        if (strcmp(a, "--config") == 0) {
            const char* v = next(a); if (!v) return false; out.config = v;
        } else if (strcmp(a, "--game") == 0) {
            const char* v = next(a); if (!v) return false; out.game = v;
        } else if (strcmp(a, "--device") == 0) {
            const char* v = next(a); if (!v) return false; out.device = v;
        } else if (strcmp(a, "--log-level") == 0) {
            const char* v = next(a); if (!v) return false; out.log_level = v;
        } else if (strcmp(a, "--poll-ms") == 0) {
            const char* v = next(a); if (!v) return false;
            char* end = nullptr;
            long n = strtol(v, &end, 10);
            if (!end || *end != '\0' || n < 0) {
                fprintf(stderr, "--poll-ms: invalid value '%s'\n", v);
                return false;
            }
            out.poll_ms = static_cast<int>(n);
        } else if (strcmp(a, "--list-devices") == 0) {
            out.list_devices = true;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", a);
            return false;
        }
    }
    return true;
}

int listDevices(const config::AppConfig& cfg) {
    adb::Endpoint ep;
    ep.host = cfg.adb.host;
    ep.port = cfg.adb.port;
    adb::AdbClient client(ep);
    try {
        auto table = client.deviceTable();
        printf("ADB server %s:%d (version %d)\n", ep.host.c_str(), ep.port, client.serverVersion());
        for (const auto& entry : table) {
            printf("  %-32s %s\n", entry.serial.c_str(), entry.state.c_str());
        }
        printf("%zu device(s)\n", table.size());
        return 0;
    } catch (const DeviceError& e) {
        fprintf(stderr, "ADB server not reachable: %s\n", e.what());
        return 1;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Args args;
    if (!parseArgs(argc, argv, args)) {
        usage(argv[0]);
        return 2;
    }

    config::setConfigPaths(args.config, args.game);
    config::AppConfig cfg = config::getConfig();

    if (!cfg.log.path.empty() && !log::openLogFile(cfg.log.path.c_str())) {
        TLOG_WARN("main", "cannot open log file %s", cfg.log.path.c_str());
    }
    const std::string level_name = args.log_level.empty() ? cfg.log.level : args.log_level;
    log::Level level;
    if (log::parseLevel(level_name, level)) {
        log::setLogLevel(level);
    } else {
        TLOG_WARN("main", "unknown log level '%s'", level_name.c_str());
    }

    if (args.list_devices) {
        int rc = listDevices(cfg);
        log::closeLogFile();
        return rc;
    }

    if (args.device.empty()) {
        fprintf(stderr, "--device is required. Configured devices:\n");
        for (const auto& name : config::availableDevices(cfg)) fprintf(stderr, "  %s\n", name.c_str());
        usage(argv[0]);
        return 2;
    }

    auto serial = config::getSerial(cfg, args.device);
    if (!serial) {
        TLOG_ERROR("main", "%s", serial.error().message.c_str());
        return 1;
    }

    ActionRegistry registry = games::templateGame();
    auto valid = registry.validate(cfg.bot.functions, cfg.bot.commands);
    if (!valid) {
        TLOG_ERROR("main", "%s", valid.error().message.c_str());
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    TLOG_INFO("main", "tapdeck starting: device=%s serial=%s", args.device.c_str(),
              serial.value().c_str());

    DeviceContext ctx(DeviceSettings::fromConfig(cfg));

    adb::Endpoint ep;
    ep.host = cfg.adb.host;
    ep.port = cfg.adb.port;
    auto transport = std::make_shared<adb::AdbClient>(ep);

    auto status_sub = bus().subscribe<StatusEvent>([](const StatusEvent& e) {
        TLOG_INFO("status", "%s: %s %s", e.device.c_str(), botStatusStr(e.status), e.message.c_str());
    });

    ControllerOptions opts;
    opts.identity = serial.value();
    opts.device_name = args.device;
    opts.findimg_path = cfg.bot.findimg_path;
    opts.loop = LoopSettings::fromConfig(cfg.bot);

    BotController controller(ctx, transport, registry, opts);
    if (!controller.start()) return 1;

    std::unique_ptr<ScreenshotPoller> poller;
    if (args.poll_ms > 0) {
        poller = std::make_unique<ScreenshotPoller>(controller.session(),
                                                    std::chrono::milliseconds(args.poll_ms));
        poller->start();
    }

    while (g_running && controller.running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    TLOG_INFO("main", "shutting down");
    bus().publish(ShutdownEvent{});
    controller.stop();
    if (poller) poller->stop();
    if (!controller.wait(std::chrono::seconds(30))) {
        TLOG_WARN("main", "automation thread did not finish within 30s");
    }

    const bool failed = controller.status() == BotStatus::Error;
    if (failed) TLOG_ERROR("main", "last error: %s", controller.lastError().c_str());
    log::closeLogFile();
    return failed ? 1 : 0;
}
