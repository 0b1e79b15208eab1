/**
 * @file load_balancer.cpp
 * @brief Implementation for weighted and degraded endpoint selection.
 */
#include "harbor/mesh/load_balancer.hpp"

#include <utility>

namespace harbor::mesh {

LoadBalancer::LoadBalancer(std::shared_ptr<util::Random> rng) noexcept
    : rng_(std::move(rng)) {}

const ServiceEndpoint* LoadBalancer::select_weighted(Candidates healthy) const noexcept {
    double total = 0.0;
    for (const auto* ep : healthy) total += static_cast<double>(ep->weight);
    if (total <= 0.0) return nullptr;

    double remainder = rng_->uniform(total);
    const ServiceEndpoint* last_positive = nullptr;
    for (const auto* ep : healthy) {
        if (ep->weight == 0) continue; // never selectable
        last_positive = ep;
        remainder -= static_cast<double>(ep->weight);
        if (remainder <= 0.0) return ep;
    }
    return last_positive; // rounding guard
}

const ServiceEndpoint* LoadBalancer::select_random(Candidates healthy) const noexcept {
    if (healthy.empty()) return nullptr;
    return healthy[rng_->index(healthy.size())];
}

std::optional<ServiceEndpoint> LoadBalancer::select(const EndpointList& endpoints,
                                                    LbStrategy strategy) const {
    std::vector<const ServiceEndpoint*> healthy;
    healthy.reserve(endpoints.size());
    for (const auto& ep : endpoints) {
        if (ep.health == Health::Healthy) healthy.push_back(&ep);
    }
    if (healthy.empty()) return std::nullopt;

    const ServiceEndpoint* chosen = nullptr;
    switch (strategy) {
        case LbStrategy::Weighted:
            chosen = select_weighted(healthy);
            break;
        case LbStrategy::RoundRobin:
            chosen = select_random(healthy);
            break;
        case LbStrategy::LeastConnections:
        case LbStrategy::IpHash:
            // TODO: track active connections / client IP to implement these for real.
            chosen = healthy.front();
            break;
    }
    if (!chosen) return std::nullopt;
    return *chosen;
}

} // namespace harbor::mesh
