/**
 * @file periodic_task.cpp
 * @brief Interval loop with condition-variable sleep, generation-based cancellation.
 */
#include "harbor/util/periodic_task.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace harbor::util {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick)
    : name_(std::move(name)), interval_(interval), tick_(std::move(tick)) {}

PeriodicTask::~PeriodicTask() noexcept {
    stop();
}

void PeriodicTask::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_.load(std::memory_order_acquire)) return;
    if (worker_.joinable()) worker_.join();  // previous run already signalled

    running_.store(true, std::memory_order_release);
    const uint64_t gen = generation_.load(std::memory_order_acquire);
    worker_ = std::thread(&PeriodicTask::loop, this, gen);
    spdlog::info("[PeriodicTask] {} started (interval: {}ms)", name_, interval_.count());
}

void PeriodicTask::stop() noexcept {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    const bool was_running = running_.exchange(false, std::memory_order_acq_rel);
    {
        std::lock_guard<std::mutex> sl(sleep_mu_);
        generation_.fetch_add(1, std::memory_order_acq_rel);
    }
    sleep_cv_.notify_all();  // Wake up sleeping thread immediately

    // From inside a tick the loop exits once the tick returns; the thread stays
    // joinable for the next stop(), start() or the destructor.
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
    if (was_running) {
        spdlog::info("[PeriodicTask] {} stopped after {} ticks", name_, ticks_.load(std::memory_order_relaxed));
    }
}

void PeriodicTask::loop(uint64_t generation) {
    const CancelToken token{generation_, generation};

    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(sleep_mu_);
            sleep_cv_.wait_for(lock, interval_, [&] {
                return !running_.load(std::memory_order_acquire) || token.stale();
            });
        }

        // Check if we were woken up due to shutdown
        if (!running_.load(std::memory_order_acquire) || token.stale()) {
            break;
        }

        try {
            tick_(token);
        } catch (const std::exception& e) {
            spdlog::error("[PeriodicTask] {} tick failed: {}", name_, e.what());
        }
        ticks_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace harbor::util
