/**
 * @file circuit_breaker.cpp
 * @brief Implementation of the breaker state machine and table.
 */
#include "harbor/mesh/circuit_breaker.hpp"

#include <algorithm>
#include <utility>

namespace harbor::mesh {

std::string_view to_string(BreakerState s) noexcept {
    switch (s) {
        case BreakerState::Closed:   return "closed";
        case BreakerState::Open:     return "open";
        case BreakerState::HalfOpen: return "half-open";
    }
    return "closed";
}

//------------------------------- CircuitBreaker -------------------------------

CircuitBreaker::CircuitBreaker(std::string endpoint_id, CircuitBreakerParams params) noexcept
    : params_(params) {
    state_.endpoint_id = std::move(endpoint_id);
}

void CircuitBreaker::open(util::TimePoint now) noexcept {
    state_.state = BreakerState::Open;
    opened_at_ = now;
    state_.next_attempt_time = now + params_.open_duration;
}

void CircuitBreaker::set_params(const CircuitBreakerParams& params) noexcept {
    if (params == params_) return;
    params_ = params;
    if (state_.state == BreakerState::Open) {
        state_.next_attempt_time = opened_at_ + params_.open_duration;
    }
}

Admission CircuitBreaker::admit(util::TimePoint now) noexcept {
    if (state_.state != BreakerState::Open) return Admission::Allowed;
    if (now < state_.next_attempt_time) return Admission::Rejected;

    state_.state = BreakerState::HalfOpen;
    state_.success_count = 0;
    return Admission::Probing;
}

Transition CircuitBreaker::record_success() noexcept {
    switch (state_.state) {
        case BreakerState::HalfOpen:
            ++state_.success_count;
            if (state_.success_count >= params_.half_open_quota) {
                state_.state = BreakerState::Closed;
                state_.failure_count = 0;
                state_.success_count = 0;
                return Transition::Closed;
            }
            return Transition::None;
        case BreakerState::Closed:
            state_.failure_count = 0;
            return Transition::None;
        case BreakerState::Open:
            // Late result from a request admitted before the breaker opened.
            return Transition::None;
    }
    return Transition::None;
}

Transition CircuitBreaker::record_failure(util::TimePoint now) noexcept {
    ++state_.failure_count;
    state_.last_failure_time = now;

    switch (state_.state) {
        case BreakerState::Closed:
            if (state_.failure_count >= params_.threshold) {
                open(now);
                return Transition::Opened;
            }
            return Transition::None;
        case BreakerState::HalfOpen:
            open(now);
            return Transition::Reopened;
        case BreakerState::Open:
            return Transition::None;
    }
    return Transition::None;
}

void CircuitBreaker::force(BreakerState state, util::TimePoint now) noexcept {
    if (state == BreakerState::Open) {
        open(now);
    } else if (state == BreakerState::Closed) {
        state_.state = BreakerState::Closed;
        state_.failure_count = 0;
        state_.success_count = 0;
    }
}

//------------------------------- CircuitBreakerTable --------------------------

CircuitBreaker& CircuitBreakerTable::get_or_create(std::string_view endpoint_id,
                                                   const CircuitBreakerParams& params) {
    auto it = breakers_.find(std::string(endpoint_id));
    if (it == breakers_.end()) {
        it = breakers_.emplace(std::string(endpoint_id),
                               CircuitBreaker{std::string(endpoint_id), params}).first;
    }
    return it->second;
}

Admission CircuitBreakerTable::admit(std::string_view endpoint_id,
                                     const CircuitBreakerParams& params,
                                     util::TimePoint now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& cb = get_or_create(endpoint_id, params);
    cb.set_params(params);
    return cb.admit(now);
}

Transition CircuitBreakerTable::record(std::string_view endpoint_id, bool success, util::TimePoint now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& cb = get_or_create(endpoint_id, defaults_);
    return success ? cb.record_success() : cb.record_failure(now);
}

bool CircuitBreakerTable::force(std::string_view endpoint_id, BreakerState state, util::TimePoint now) {
    if (state == BreakerState::HalfOpen) return false;
    std::lock_guard<std::mutex> lk(mu_);
    auto it = breakers_.find(std::string(endpoint_id));
    if (it == breakers_.end()) return false;
    it->second.force(state, now);
    return true;
}

bool CircuitBreakerTable::erase(std::string_view endpoint_id) {
    std::lock_guard<std::mutex> lk(mu_);
    return breakers_.erase(std::string(endpoint_id)) > 0;
}

std::optional<CircuitBreakerState> CircuitBreakerTable::get(std::string_view endpoint_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = breakers_.find(std::string(endpoint_id));
    if (it == breakers_.end()) return std::nullopt;
    return it->second.snapshot();
}

std::vector<CircuitBreakerState> CircuitBreakerTable::snapshot() const {
    std::vector<CircuitBreakerState> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        out.reserve(breakers_.size());
        for (const auto& kv : breakers_) out.push_back(kv.second.snapshot());
    }
    std::sort(out.begin(), out.end(),
              [](const CircuitBreakerState& a, const CircuitBreakerState& b) {
                  return a.endpoint_id < b.endpoint_id;
              });
    return out;
}

} // namespace harbor::mesh
