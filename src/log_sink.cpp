#include "log_sink.hpp"
#include "event_bus.hpp"
#include "tapdeck_log.hpp"

namespace tapdeck {

void ProcessLogSink::log(const std::string& message, const ScreenImage* image) {
    if (image) {
        TLOG_INFO(tag_.c_str(), "%s [image %dx%d]", message.c_str(), image->width, image->height);
    } else {
        TLOG_INFO(tag_.c_str(), "%s", message.c_str());
    }
}

void BusLogSink::log(const std::string& message, const ScreenImage* image) {
    TLOG_INFO(device_.c_str(), "%s", message.c_str());

    LogEntryEvent evt;
    evt.device = device_;
    evt.message = message;
    if (image) evt.image = std::make_shared<const ScreenImage>(*image);
    bus().publish(evt);
}

} // namespace tapdeck
