// =============================================================================
// Tapdeck - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Decouples the automation core from whatever presents its state (terminal,
// dashboard, persistent log store).
// Usage:
//   auto sub = tapdeck::bus().subscribe<StatusEvent>([](const auto& e) { ... });
//   tapdeck::bus().publish(StatusEvent{...});
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <memory>
#include <string>
#include <cstdint>
#include <algorithm>
#include "tapdeck_log.hpp"
#include "screen_image.hpp"

namespace tapdeck {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// User-facing log entry, optionally with an annotated screenshot
struct LogEntryEvent : Event {
    std::string device;
    std::string message;
    std::shared_ptr<const ScreenImage> image;
};

enum class BotStatus { Running, Stopped, Error };

inline const char* botStatusStr(BotStatus s) {
    switch (s) {
        case BotStatus::Running: return "Running";
        case BotStatus::Stopped: return "Stopped";
        case BotStatus::Error:   return "Error";
    }
    return "?";
}

struct StatusEvent : Event {
    std::string device;
    BotStatus status = BotStatus::Stopped;
    std::string message;
};

// Live screenshot feed for remote monitoring
struct ScreenshotEvent : Event {
    std::string device;
    std::shared_ptr<const ScreenImage> image;
    uint64_t sequence = 0;
};

struct CommandQueuedEvent : Event {
    std::string device;
    std::string description;
    size_t queue_size = 0;
};

struct ShutdownEvent : Event {};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        return SubscriptionHandle([this, key, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    // Handlers run on the publishing thread, outside the bus lock.
    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it != handlers_.end()) {
                snapshot = it->second;
            }
        }

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                TLOG_ERROR("eventbus", "Handler %llu threw: %s",
                           (unsigned long long)entry.id, e.what());
            }
        }
    }

    template<typename T>
    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(T)));
        return it == handlers_.end() ? 0 : it->second.size();
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::function<void(const Event&)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
};

// Global event bus singleton
inline EventBus& bus() {
    static EventBus instance;
    return instance;
}

} // namespace tapdeck
