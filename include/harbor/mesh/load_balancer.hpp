#pragma once
/**
 * @file load_balancer.hpp
 * @brief Healthy-endpoint selection: weighted, round-robin approximation, and degraded strategies.
 *
 * Strategy semantics:
 *  - Weighted:         draw r in [0, totalWeight) and walk the list subtracting weights;
 *                      weight-0 endpoints are never chosen.
 *  - RoundRobin:       uniform random among healthy endpoints. This is a stateless
 *                      approximation of round robin, not a rotating cursor.
 *  - LeastConnections,
 *    IpHash:           first healthy endpoint in list order (no connection or
 *                      client-IP tracking in this core).
 */

#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "harbor/mesh/endpoint.hpp"
#include "harbor/mesh/route.hpp"
#include "harbor/util/random.hpp"

namespace harbor::mesh {

class LoadBalancer {
public:
    explicit LoadBalancer(std::shared_ptr<util::Random> rng) noexcept;

    /**
     * @brief Choose an endpoint among the healthy members of `endpoints`.
     * @return nullopt when no endpoint is healthy (or, for Weighted, none has weight > 0).
     */
    [[nodiscard]] std::optional<ServiceEndpoint> select(const EndpointList& endpoints,
                                                        LbStrategy strategy) const;

private:
    using Candidates = std::span<const ServiceEndpoint* const>;

    const ServiceEndpoint* select_weighted(Candidates healthy) const noexcept;
    const ServiceEndpoint* select_random(Candidates healthy) const noexcept;

    std::shared_ptr<util::Random> rng_;
};

} // namespace harbor::mesh
