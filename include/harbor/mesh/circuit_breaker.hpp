#pragma once
/**
 * @file circuit_breaker.hpp
 * @brief Per-endpoint failure gate: closed → open → half-open → closed | open.
 *
 * State machine:
 *   Closed   --failure_count reaches threshold-->   Open (next_attempt = now + open_duration)
 *   Closed   --success-->                           Closed (failure_count = 0)
 *   Open     --admit() at/after next_attempt-->     HalfOpen (success_count = 0)
 *   HalfOpen --success_count reaches quota-->       Closed (both counters reset)
 *   HalfOpen --any failure-->                       Open (fresh next_attempt)
 *
 * Open → HalfOpen is lazy: it happens on the next admit(), never on a timer.
 */

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "harbor/mesh/route.hpp"
#include "harbor/util/clock.hpp"

namespace harbor::mesh {

enum class BreakerState : uint8_t { Closed, Open, HalfOpen };

std::string_view to_string(BreakerState s) noexcept;

/** @struct CircuitBreakerState
 *  @brief Value snapshot of one endpoint's breaker.
 */
struct CircuitBreakerState {
    std::string endpoint_id;
    BreakerState state{BreakerState::Closed};
    uint32_t failure_count{0};
    uint32_t success_count{0};     ///< Meaningful only while half-open
    util::TimePoint last_failure_time{};
    util::TimePoint next_attempt_time{};
};

/// Outcome of an admission check.
enum class Admission : uint8_t {
    Allowed,   ///< Closed or half-open: traffic flows
    Probing,   ///< Was open, retry time elapsed: now half-open
    Rejected   ///< Open and retry time not reached
};

/// State change caused by recording a result.
enum class Transition : uint8_t {
    None,
    Opened,    ///< Closed → Open
    Reopened,  ///< HalfOpen → Open
    Closed     ///< HalfOpen → Closed
};

/** @class CircuitBreaker
 *  @brief Single-endpoint state machine. Not synchronized; owned by CircuitBreakerTable.
 */
class CircuitBreaker {
public:
    CircuitBreaker(std::string endpoint_id, CircuitBreakerParams params) noexcept;

    Admission admit(util::TimePoint now) noexcept;
    Transition record_success() noexcept;
    Transition record_failure(util::TimePoint now) noexcept;

    /// Administrative override to Open (fresh retry time) or Closed (counters reset).
    void force(BreakerState state, util::TimePoint now) noexcept;

    /// Adopt `params`, keeping state and counters. An open breaker's retry time is
    /// re-derived from the moment it opened.
    void set_params(const CircuitBreakerParams& params) noexcept;

    [[nodiscard]] BreakerState state() const noexcept { return state_.state; }
    [[nodiscard]] const CircuitBreakerState& snapshot() const noexcept { return state_; }
    [[nodiscard]] const CircuitBreakerParams& params() const noexcept { return params_; }

private:
    void open(util::TimePoint now) noexcept;

    CircuitBreakerParams params_;
    CircuitBreakerState state_;
    util::TimePoint opened_at_{};
};

/** @class CircuitBreakerTable
 *  @brief Breakers keyed by endpoint id. Each mutation is a single locked step.
 */
class CircuitBreakerTable {
public:
    explicit CircuitBreakerTable(CircuitBreakerParams defaults) noexcept : defaults_(defaults) {}

    /// Admission for `endpoint_id` under the selecting route's `params`.
    /// Creates a closed breaker on first contact, otherwise re-parameterizes the existing one.
    Admission admit(std::string_view endpoint_id, const CircuitBreakerParams& params, util::TimePoint now);

    /// Record a result; creates a breaker with the default params if none exists.
    Transition record(std::string_view endpoint_id, bool success, util::TimePoint now);

    /// Force Open/Closed. Returns false when no breaker exists or state is HalfOpen.
    bool force(std::string_view endpoint_id, BreakerState state, util::TimePoint now);

    bool erase(std::string_view endpoint_id);

    [[nodiscard]] std::optional<CircuitBreakerState> get(std::string_view endpoint_id) const;
    [[nodiscard]] std::vector<CircuitBreakerState> snapshot() const;
    [[nodiscard]] const CircuitBreakerParams& defaults() const noexcept { return defaults_; }

private:
    CircuitBreaker& get_or_create(std::string_view endpoint_id, const CircuitBreakerParams& params);

    CircuitBreakerParams defaults_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, CircuitBreaker> breakers_;
};

} // namespace harbor::mesh
