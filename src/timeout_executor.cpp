#include "timeout_executor.hpp"
#include "tapdeck_log.hpp"

namespace tapdeck {

TimeoutExecutor::TimeoutExecutor(int workers) {
    if (workers < 1) workers = 1;
    workers_.reserve(workers);
    for (int i = 0; i < workers; ++i) {
        workers_.emplace_back(&TimeoutExecutor::workerLoop, this);
    }
    TLOG_DEBUG("executor", "Started %d workers", workers);
}

TimeoutExecutor::~TimeoutExecutor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        if (!tasks_.empty()) {
            TLOG_WARN("executor", "Dropping %zu queued calls on shutdown", tasks_.size());
            tasks_.clear();
        }
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

size_t TimeoutExecutor::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TimeoutExecutor::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) throw DeviceError("timeout executor is shutting down");
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void TimeoutExecutor::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        // packaged_task stores the call's exception in its future
        task();
    }
}

} // namespace tapdeck
