#pragma once
/**
 * @file periodic_task.hpp
 * @brief Fixed-interval worker thread with interruptible sleep and a stop generation.
 *
 * Lifecycle:
 *  - start() spawns one worker that sleeps `interval`, then runs the tick.
 *  - stop() bumps the generation, wakes the sleeper and joins. A tick already
 *    running completes; it can consult its CancelToken after any external call
 *    and discard results that would land in torn-down state.
 *  - stop() from inside a tick only signals; the owner's destructor joins.
 *  - Exceptions escaping a tick are logged; the loop keeps running.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace harbor::util {

/** @class CancelToken
 *  @brief Captures the task generation at tick start; stale() once stop() has run.
 */
class CancelToken {
public:
    /// Token that is never stale (synchronous callers).
    CancelToken() noexcept = default;

    CancelToken(const std::atomic<uint64_t>& generation, uint64_t captured) noexcept
        : generation_(&generation), captured_(captured) {}

    [[nodiscard]] bool stale() const noexcept {
        return generation_ && generation_->load(std::memory_order_acquire) != captured_;
    }

private:
    const std::atomic<uint64_t>* generation_{nullptr};
    uint64_t captured_{0};
};

class PeriodicTask final {
public:
    using Tick = std::function<void(const CancelToken&)>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick);
    ~PeriodicTask() noexcept;

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// Start the worker. No-op if already running.
    void start();

    /// Stop the worker and wait for an in-progress tick to finish.
    void stop() noexcept;

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] uint64_t generation() const noexcept { return generation_.load(std::memory_order_acquire); }
    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void loop(uint64_t generation);

    std::string name_;
    std::chrono::milliseconds interval_;
    Tick tick_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> generation_{0};
    std::atomic<uint64_t> ticks_{0};
    std::thread worker_;

    // For interruptible sleep during shutdown
    std::mutex lifecycle_mu_;
    mutable std::mutex sleep_mu_;
    std::condition_variable sleep_cv_;
};

} // namespace harbor::util
