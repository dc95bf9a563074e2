// =============================================================================
// Tapdeck - Timeout Executor
// =============================================================================
// Runs blocking device calls on a fixed worker pool and gives up waiting after
// a deadline. The transport has no cancellation primitive: an abandoned call
// keeps running on its worker and its result is discarded, so a command may
// still land on the device after TimeoutError was reported (at-least-once).
// =============================================================================
#pragma once

#include "errors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace tapdeck {

class TimeoutExecutor {
public:
    static constexpr int kDefaultWorkers = 4;

    explicit TimeoutExecutor(int workers = kDefaultWorkers);

    // Joins the workers. Calls still blocked inside the transport keep the
    // destructor waiting until they return.
    ~TimeoutExecutor();

    TimeoutExecutor(const TimeoutExecutor&) = delete;
    TimeoutExecutor& operator=(const TimeoutExecutor&) = delete;

    // Blocks up to deadline_s for call's result. Throws TimeoutError on expiry;
    // exceptions thrown by call propagate unchanged.
    template<typename F>
    auto run(F&& call, const std::string& operation, double deadline_s)
        -> std::invoke_result_t<std::decay_t<F>> {
        using R = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(call));
        std::future<R> result = task->get_future();
        submit([task]() { (*task)(); });

        auto deadline = std::chrono::duration<double>(deadline_s);
        if (result.wait_for(deadline) != std::future_status::ready) {
            abandoned_.fetch_add(1);
            throw TimeoutError(operation, deadline_s);
        }
        return result.get();
    }

    int workerCount() const { return (int)workers_.size(); }
    size_t pendingCount() const;
    uint64_t abandonedCount() const { return abandoned_.load(); }

private:
    void submit(std::function<void()> task);
    void workerLoop();

    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_ = false;
    std::atomic<uint64_t> abandoned_{0};
};

} // namespace tapdeck
