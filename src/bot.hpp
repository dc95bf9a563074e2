// =============================================================================
// Tapdeck - Bot
// =============================================================================
// What game actions see: one device session plus the instance's command
// queue, needle lookup and user-facing logging. Every public device call
// starts with checkShouldStop(), which is where remote commands get drained
// while the automation loop owns the queue.
// =============================================================================
#pragma once

#include "cancellation_token.hpp"
#include "command_queue.hpp"
#include "device_session.hpp"
#include "log_sink.hpp"
#include "needle_cache.hpp"
#include "template_matcher.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <chrono>
#include <string>
#include <vector>

namespace tapdeck {

struct FindOptions {
    int offset_x = 0;                       // added to the match's top-left
    int offset_y = 0;
    float accuracy = 0.9f;
    bool tap = true;                        // false: detect only
    const ScreenImage* screenshot = nullptr;  // reuse a capture instead of taking one
    int click_delay_ms = 10;                // touch duration
    vision::Region region;                  // restrict the search
};

class Bot {
public:
    static constexpr std::chrono::milliseconds kSleepTick{100};

    Bot(DeviceSession& session, CancellationToken token,
        std::shared_ptr<LogSink> sink = nullptr, const std::string& findimg_path = "");

    Bot(const Bot&) = delete;
    Bot& operator=(const Bot&) = delete;

    // Throws StopSignal(UserStop) once the token is cancelled, then drains
    // pending remote commands when the loop processes them inline.
    void checkShouldStop();

    // Sleeps in short ticks, running checkShouldStop() on each.
    void sleep(double seconds);

    void tap(int x, int y);
    void swipe(int x1, int y1, int x2, int y2, int duration_ms = DeviceSession::kDefaultSwipeMs);
    ScreenImage screenshot();
    void typeText(const std::string& text);
    void pressEnter();
    void pressBackspace(int count = 1);

    // Finds needle on screen; taps it unless opts.tap is false.
    bool findAndClick(const std::string& needle, const FindOptions& opts = FindOptions());

    std::vector<vision::MatchResult> findAll(const std::string& needle, float accuracy = 0.9f,
                                             const ScreenImage* screenshot = nullptr,
                                             vision::Region region = vision::Region());

    // (R, G, B); throws std::out_of_range outside the image.
    static std::array<uint8_t, 3> pixelColor(const ScreenImage& image, int x, int y);

    void queueCommand(std::function<void()> action, const std::string& description = "");
    CommandQueueInfo commandQueueInfo() const { return queue_.info(); }
    CommandQueue& commandQueue() { return queue_; }

    // Skip the rest of the current loop iteration. Travels through the
    // command queue like any other remote request.
    void requestSkip();

    void setFindimgPath(const std::string& path);
    // Throws std::out_of_range for unknown names.
    const vision::Needle& needle(const std::string& name) const;
    bool hasNeedle(const std::string& name) const;

    void log(const std::string& message, const ScreenImage* image = nullptr);

    // Debug mode attaches annotated screenshots to find/tap log entries.
    void setDebug(bool enabled) { debug_ = enabled; }
    bool debug() const { return debug_.load(); }

    DeviceSession& session() { return session_; }
    CancellationToken& token() { return token_; }
    const std::shared_ptr<LogSink>& sink() const { return sink_; }

private:
    DeviceSession& session_;
    CancellationToken token_;
    std::shared_ptr<LogSink> sink_;
    CommandQueue queue_;
    vision::TemplateMatcher matcher_;
    std::string findimg_path_;
    std::shared_ptr<const vision::NeedleSet> needles_;
    std::atomic<bool> debug_{false};
    std::atomic<uint64_t> screenshot_seq_{0};
};

} // namespace tapdeck
