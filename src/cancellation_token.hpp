// =============================================================================
// Tapdeck - Cancellation Token
// =============================================================================
// Cooperative stop flag shared by a controller, its automation loop and the
// device session. Checked at action starts, reconnect attempts and sleep ticks.
// =============================================================================
#pragma once

#include <atomic>
#include <memory>

namespace tapdeck {

class CancellationToken {
public:
    void cancel() { state_->cancelled.store(true); }
    bool cancelled() const { return state_->cancelled.load(); }

    // Per-iteration skip request, consumed by the loop.
    void requestSkip() { state_->skip.store(true); }
    bool consumeSkip() { return state_->skip.exchange(false); }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> skip{false};
    };
    // Copies share one flag
    std::shared_ptr<State> state_ = std::make_shared<State>();
};

} // namespace tapdeck
