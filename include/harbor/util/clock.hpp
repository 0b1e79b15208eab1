#pragma once
/**
 * @file clock.hpp
 * @brief Injectable wall clock used for breaker timeouts, alert cooldowns and retention.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace harbor::util {

using TimePoint = std::chrono::system_clock::time_point;

/** @class Clock
 *  @brief Source of "now" for every time-gated decision in the control plane.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const noexcept = 0;
};

/// Production clock backed by std::chrono::system_clock.
class SystemClock final : public Clock {
public:
    TimePoint now() const noexcept override { return std::chrono::system_clock::now(); }
};

/** @class ManualClock
 *  @brief Test clock that only moves when told to. Safe to read from any thread.
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint{std::chrono::hours(24 * 365 * 50)}) noexcept
        : ticks_(start.time_since_epoch().count()) {}

    TimePoint now() const noexcept override {
        return TimePoint{TimePoint::duration{ticks_.load(std::memory_order_acquire)}};
    }

    template <class Rep, class Period>
    void advance(std::chrono::duration<Rep, Period> d) noexcept {
        ticks_.fetch_add(std::chrono::duration_cast<TimePoint::duration>(d).count(),
                         std::memory_order_acq_rel);
    }

    void set(TimePoint t) noexcept {
        ticks_.store(t.time_since_epoch().count(), std::memory_order_release);
    }

private:
    std::atomic<TimePoint::rep> ticks_;
};

/// Shared process clock for callers that do not inject one.
std::shared_ptr<Clock> system_clock();

/// Milliseconds since the Unix epoch (log/payload formatting).
inline int64_t to_epoch_ms(TimePoint t) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

} // namespace harbor::util
