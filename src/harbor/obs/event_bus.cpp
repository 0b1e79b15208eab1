/**
 * @file event_bus.cpp
 * @brief Snapshotted fan-out with per-kind counters.
 */
#include "harbor/obs/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace harbor::obs {

std::string_view event_name(EventKind k) noexcept {
    switch (k) {
        case EventKind::ServiceRegistered:    return "serviceRegistered";
        case EventKind::ServiceDeregistered:  return "serviceDeregistered";
        case EventKind::RouteCreated:         return "routeCreated";
        case EventKind::RouteRemoved:         return "routeRemoved";
        case EventKind::TrafficPolicySet:     return "trafficPolicySet";
        case EventKind::HealthChanged:        return "healthChanged";
        case EventKind::CircuitBreakerOpened: return "circuitBreakerOpened";
        case EventKind::RequestRecorded:      return "requestRecorded";
        case EventKind::MetricsCollected:     return "metricsCollected";
        case EventKind::AlertCreated:         return "alertCreated";
        case EventKind::AlertAcknowledged:    return "alertAcknowledged";
        case EventKind::LimitsUpdated:        return "limitsUpdated";
    }
    return "unknown";
}

EventBus::Token EventBus::add(std::optional<EventKind> kind, Handler handler) {
    std::lock_guard<std::mutex> lk(mu_);
    const Token token = next_token_++;
    subs_.push_back(Subscription{token, kind, std::make_shared<Handler>(std::move(handler))});
    return token;
}

EventBus::Token EventBus::subscribe(EventKind kind, Handler handler) {
    return add(kind, std::move(handler));
}

EventBus::Token EventBus::subscribe_all(Handler handler) {
    return add(std::nullopt, std::move(handler));
}

bool EventBus::unsubscribe(Token token) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(subs_.begin(), subs_.end(),
                           [token](const Subscription& s) { return s.token == token; });
    if (it == subs_.end()) return false;
    subs_.erase(it);
    return true;
}

void EventBus::publish(const Event& event) {
    counters_[static_cast<std::size_t>(event.kind)].fetch_add(1, std::memory_order_relaxed);

    std::vector<std::shared_ptr<Handler>> targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        targets.reserve(subs_.size());
        for (const auto& s : subs_) {
            if (!s.kind || *s.kind == event.kind) targets.push_back(s.handler);
        }
    }

    for (const auto& h : targets) {
        try {
            (*h)(event);
        } catch (const std::exception& e) {
            spdlog::error("[EventBus] {} handler threw: {}", event.name(), e.what());
        }
    }
}

uint64_t EventBus::count(EventKind kind) const noexcept {
    return counters_[static_cast<std::size_t>(kind)].load(std::memory_order_relaxed);
}

std::array<uint64_t, kEventKindCount> EventBus::counters() const noexcept {
    std::array<uint64_t, kEventKindCount> out{};
    for (std::size_t i = 0; i < kEventKindCount; ++i) {
        out[i] = counters_[i].load(std::memory_order_relaxed);
    }
    return out;
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return subs_.size();
}

} // namespace harbor::obs
