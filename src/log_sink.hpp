// =============================================================================
// Tapdeck - User-facing log sink
// =============================================================================
// The automation core writes user-visible log entries through this interface
// only. Whether they end up in a terminal, a dashboard or a database is the
// sink's business.
// =============================================================================
#pragma once

#include "screen_image.hpp"

#include <memory>
#include <string>

namespace tapdeck {

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(const std::string& message, const ScreenImage* image = nullptr) = 0;
};

// Forwards to the process log (TLOG_INFO) under the given tag.
class ProcessLogSink : public LogSink {
public:
    explicit ProcessLogSink(std::string tag = "bot") : tag_(std::move(tag)) {}
    void log(const std::string& message, const ScreenImage* image = nullptr) override;

private:
    std::string tag_;
};

// Publishes LogEntryEvent on the global bus and mirrors to the process log.
class BusLogSink : public LogSink {
public:
    explicit BusLogSink(std::string device) : device_(std::move(device)) {}
    void log(const std::string& message, const ScreenImage* image = nullptr) override;

private:
    std::string device_;
};

} // namespace tapdeck
