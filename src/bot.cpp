#include "bot.hpp"
#include "event_bus.hpp"
#include "tapdeck_log.hpp"

#include <cmath>
#include <cstdio>
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace tapdeck {

namespace {

struct Bgra { uint8_t b, g, r, a; };
constexpr Bgra kRed{0, 0, 255, 255};
constexpr Bgra kGreen{0, 255, 0, 255};

void plot(ScreenImage& img, int x, int y, Bgra c) {
    if (x < 0 || y < 0 || x >= img.width || y >= img.height) return;
    uint8_t* p = &img.bgra[((size_t)y * img.width + x) * 4];
    p[0] = c.b; p[1] = c.g; p[2] = c.r; p[3] = c.a;
}

void drawRect(ScreenImage& img, int x, int y, int w, int h, Bgra c, int thickness) {
    for (int t = 0; t < thickness; ++t) {
        for (int i = x; i < x + w; ++i) {
            plot(img, i, y + t, c);
            plot(img, i, y + h - 1 - t, c);
        }
        for (int j = y; j < y + h; ++j) {
            plot(img, x + t, j, c);
            plot(img, x + w - 1 - t, j, c);
        }
    }
}

void drawCrosshair(ScreenImage& img, int x, int y, Bgra c, int size) {
    for (int d = -size; d <= size; ++d) {
        plot(img, x + d, y, c);
        plot(img, x, y + d, c);
    }
    for (int dy = -5; dy <= 5; ++dy) {
        for (int dx = -5; dx <= 5; ++dx) {
            if (dx * dx + dy * dy <= 25) plot(img, x + dx, y + dy, c);
        }
    }
}

std::string percent(float score) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%.2f", std::round(score * 10000.0f) / 100.0f);
    return buf;
}

} // anonymous namespace

Bot::Bot(DeviceSession& session, CancellationToken token,
         std::shared_ptr<LogSink> sink, const std::string& findimg_path)
    : session_(session),
      token_(std::move(token)),
      sink_(sink ? std::move(sink) : std::make_shared<ProcessLogSink>("bot")),
      queue_(sink_, session.deviceName()) {
    if (!findimg_path.empty()) setFindimgPath(findimg_path);
}

void Bot::checkShouldStop() {
    if (token_.cancelled()) {
        throw StopSignal(StopSignal::Reason::UserStop, "Bot execution stopped by user");
    }
    if (queue_.inlineDrain() && queue_.size() > 0) {
        queue_.drainNow();
    }
}

void Bot::sleep(double seconds) {
    using namespace std::chrono;
    const auto until = steady_clock::now() + duration_cast<steady_clock::duration>(duration<double>(seconds));
    for (;;) {
        checkShouldStop();
        auto now = steady_clock::now();
        if (now >= until) return;
        std::this_thread::sleep_for(std::min<steady_clock::duration>(until - now, kSleepTick));
    }
}

void Bot::log(const std::string& message, const ScreenImage* image) {
    sink_->log(message, image);
}

// =============================================================================
// Device actions
// =============================================================================

void Bot::tap(int x, int y) {
    checkShouldStop();
    if (debug()) {
        ScreenImage annotated = screenshot();
        drawCrosshair(annotated, x, y, kRed, 25);
        log("TAP COORDINATES at (" + std::to_string(x) + ", " + std::to_string(y) + ")", &annotated);
    }
    session_.touch(x, y);
}

void Bot::swipe(int x1, int y1, int x2, int y2, int duration_ms) {
    checkShouldStop();
    if (debug()) {
        ScreenImage annotated = screenshot();
        drawCrosshair(annotated, x1, y1, kRed, 10);
        drawCrosshair(annotated, x2, y2, kRed, 10);
        log("SWIPE from (" + std::to_string(x1) + ", " + std::to_string(y1) + ") to (" +
            std::to_string(x2) + ", " + std::to_string(y2) + ") duration:" +
            std::to_string(duration_ms) + "ms", &annotated);
    }
    session_.touch(x1, y1, x2, y2, duration_ms);
}

ScreenImage Bot::screenshot() {
    ScreenImage img = session_.captureScreen();

    ScreenshotEvent evt;
    evt.device = session_.deviceName();
    evt.image = std::make_shared<const ScreenImage>(img);
    evt.sequence = ++screenshot_seq_;
    bus().publish(evt);
    return img;
}

void Bot::typeText(const std::string& text) {
    checkShouldStop();
    session_.sendText(text);
}

void Bot::pressEnter() {
    checkShouldStop();
    session_.pressEnter();
}

void Bot::pressBackspace(int count) {
    checkShouldStop();
    session_.pressBackspace(count);
}

std::array<uint8_t, 3> Bot::pixelColor(const ScreenImage& image, int x, int y) {
    if (x < 0 || y < 0 || x >= image.width || y >= image.height) {
        throw std::out_of_range("pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") outside " + std::to_string(image.width) + "x" +
                                std::to_string(image.height) + " image");
    }
    return image.pixelRgb(x, y);
}

// =============================================================================
// Needles
// =============================================================================

void Bot::setFindimgPath(const std::string& path) {
    findimg_path_ = path;
    needles_ = vision::NeedleCache::instance().load(path);
}

const vision::Needle& Bot::needle(const std::string& name) const {
    if (!needles_) {
        throw std::out_of_range("Needles not loaded - findimg_path was: " + findimg_path_);
    }
    auto it = needles_->find(name);
    if (it == needles_->end()) {
        throw std::out_of_range("Needle '" + name + "' not found in " + findimg_path_);
    }
    return it->second;
}

bool Bot::hasNeedle(const std::string& name) const {
    return needles_ && needles_->count(name) > 0;
}

bool Bot::findAndClick(const std::string& needle_name, const FindOptions& opts) {
    checkShouldStop();

    ScreenImage captured;
    const ScreenImage* shot = opts.screenshot;
    if (!shot) {
        captured = screenshot();
        shot = &captured;
    }

    const vision::Needle& n = needle(needle_name);
    auto match = matcher_.findBest(shot->toGray(), n.gray, opts.accuracy, opts.region);

    if (!match) {
        if (debug()) log("NO TAP " + needle_name, shot);
        return false;
    }

    const int final_x = match->x + opts.offset_x;
    const int final_y = match->y + opts.offset_y;

    ScreenImage annotated;
    if (debug()) {
        annotated = *shot;
        drawRect(annotated, match->x, match->y, match->width, match->height, kRed, 3);
        drawCrosshair(annotated, final_x, final_y, opts.tap ? kRed : kGreen, 25);
    }
    const ScreenImage* attach = debug() ? &annotated : nullptr;

    if (opts.tap) {
        log("TAP " + needle_name + " at (" + std::to_string(final_x) + ", " +
            std::to_string(final_y) + ") acc:" + percent(match->score) + "%", attach);
        session_.touch(final_x, final_y, -1, -1, opts.click_delay_ms, true);
    } else {
        log("FOUND " + needle_name + " acc:" + percent(match->score) + "%", attach);
    }
    return true;
}

std::vector<vision::MatchResult> Bot::findAll(const std::string& needle_name, float accuracy,
                                              const ScreenImage* screenshot_in,
                                              vision::Region region) {
    checkShouldStop();

    ScreenImage captured;
    const ScreenImage* shot = screenshot_in;
    if (!shot) {
        captured = screenshot();
        shot = &captured;
    }

    const vision::Needle& n = needle(needle_name);
    auto matches = matcher_.findAll(shot->toGray(), n.gray, accuracy, region);

    if (debug()) {
        ScreenImage annotated = *shot;
        for (const auto& m : matches) {
            drawRect(annotated, m.x, m.y, m.width, m.height, kGreen, 2);
            drawCrosshair(annotated, m.x, m.y, kGreen, 15);
        }
        log("FIND_ALL found " + std::to_string(matches.size()) + " instances of " + needle_name,
            &annotated);
    } else {
        TLOG_DEBUG("bot", "FIND_ALL found %zu instances of %s", matches.size(), needle_name.c_str());
    }
    return matches;
}

// =============================================================================
// Remote commands
// =============================================================================

void Bot::queueCommand(std::function<void()> action, const std::string& description) {
    queue_.queueCommand(std::move(action), description);
}

void Bot::requestSkip() {
    CancellationToken token = token_;
    queue_.queueCommand([token]() mutable { token.requestSkip(); }, "Skip iteration");
}

} // namespace tapdeck
