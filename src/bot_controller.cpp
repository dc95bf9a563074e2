#include "bot_controller.hpp"
#include "tapdeck_log.hpp"

namespace tapdeck {

static constexpr const char* TAG = "controller";

BotController::BotController(DeviceContext& ctx, std::shared_ptr<Transport> transport,
                             const ActionRegistry& registry, ControllerOptions options,
                             std::shared_ptr<LogSink> sink)
    : ctx_(ctx),
      transport_(std::move(transport)),
      registry_(registry),
      options_(std::move(options)),
      sink_(sink ? std::move(sink) : std::make_shared<BusLogSink>(options_.device_name)) {}

BotController::~BotController() {
    stop();
    if (thread_.joinable()) thread_.join();
}

bool BotController::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        TLOG_WARN(TAG, "%s: already running", options_.device_name.c_str());
        return false;
    }
    // Previous run has finished; reap its thread before reusing the slot.
    if (thread_.joinable()) thread_.join();

    token_ = CancellationToken();
    session_ = std::make_shared<DeviceSession>(ctx_, transport_, options_.identity,
                                               options_.device_name, sink_);
    bot_ = std::make_shared<Bot>(*session_, token_, sink_, options_.findimg_path);
    loop_ = std::make_shared<AutomationLoop>(*bot_, registry_, options_.loop,
                                             options_.device_name, options_.clock);
    last_error_.clear();
    running_ = true;

    thread_ = std::thread(&BotController::threadMain, this, session_, bot_, loop_);
    TLOG_INFO(TAG, "%s: started (serial %s)", options_.device_name.c_str(),
              options_.identity.c_str());
    return true;
}

void BotController::stop() {
    std::shared_ptr<DeviceSession> session;
    std::shared_ptr<Bot> bot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        token_.cancel();
        session = session_;
        bot = bot_;
    }
    TLOG_INFO(TAG, "%s: stop requested", options_.device_name.c_str());
    if (session) session->stop();
    if (bot) bot->commandQueue().stop();
}

bool BotController::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this] { return !running_.load(); });
}

BotStatus BotController::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string BotController::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool BotController::trigger(const std::string& command_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || !loop_) return false;
    return loop_->trigger(command_id);
}

bool BotController::queueCommand(std::function<void()> action, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || !bot_) return false;
    bot_->queueCommand(std::move(action), description);
    return true;
}

bool BotController::requestSkip() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || !bot_) return false;
    bot_->requestSkip();
    return true;
}

std::shared_ptr<DeviceSession> BotController::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void BotController::publish(BotStatus status, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
        if (status == BotStatus::Error) last_error_ = message;
    }
    StatusEvent evt;
    evt.device = options_.device_name;
    evt.status = status;
    evt.message = message;
    bus().publish(evt);
}

void BotController::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    done_cv_.notify_all();
}

// =============================================================================
// Background thread
// =============================================================================

void BotController::threadMain(std::shared_ptr<DeviceSession> session, std::shared_ptr<Bot> bot,
                               std::shared_ptr<AutomationLoop> loop) {
    publish(BotStatus::Running, "Connecting");

    try {
        session->connect();
    } catch (const StopSignal& e) {
        if (e.reason() == StopSignal::Reason::UserStop) {
            publish(BotStatus::Stopped, e.what());
        } else {
            publish(BotStatus::Error, e.what());
        }
        finish();
        return;
    } catch (const std::exception& e) {
        TLOG_ERROR(TAG, "%s: connect failed: %s", options_.device_name.c_str(), e.what());
        publish(BotStatus::Error, e.what());
        finish();
        return;
    }

    publish(BotStatus::Running, "Connected");
    try {
        loop->run();
    } catch (const std::exception& e) {
        TLOG_ERROR(TAG, "%s: loop aborted: %s", options_.device_name.c_str(), e.what());
        publish(BotStatus::Error, e.what());
        bot->commandQueue().stop();
        finish();
        return;
    }

    bot->commandQueue().stop();
    publish(BotStatus::Stopped, "Stopped");
    finish();
}

} // namespace tapdeck
