#pragma once
/**
 * @file route.hpp
 * @brief Service routes, inbound request descriptor, and the route table.
 * @details All defaults are named in constants.hpp to avoid magic numbers.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "harbor/config/constants.hpp"

namespace harbor::mesh {

/**
 * @enum LbStrategy
 * @brief Endpoint selection strategy, chosen per route.
 */
enum class LbStrategy : uint8_t {
    RoundRobin,       ///< Stateless approximation: uniform random among healthy
    Weighted,         ///< Probability proportional to endpoint weight
    LeastConnections, ///< Degrades to first healthy (no connection tracking)
    IpHash            ///< Degrades to first healthy (no client IP tracking)
};

std::string_view to_string(LbStrategy s) noexcept;
std::optional<LbStrategy> parse_strategy(std::string_view s) noexcept;

/** @struct CircuitBreakerParams
 *  @brief Per-route breaker parameters applied to the endpoints it selects.
 */
struct CircuitBreakerParams {
    bool enabled{true};                                     ///< Gate routing on breaker state
    uint32_t threshold{config::constants::CB_FAILURE_THRESHOLD}; ///< Failures that open the breaker
    std::chrono::milliseconds open_duration{config::constants::CB_OPEN_DURATION_MS}; ///< Rejection window
    uint32_t half_open_quota{config::constants::CB_HALF_OPEN_QUOTA}; ///< Successes that close it

    bool operator==(const CircuitBreakerParams&) const = default;
};

/** @struct ServiceRoute
 *  @brief A path/method match owned by one service. Immutable once matched.
 */
struct ServiceRoute {
    std::string id;                       ///< Route identifier (table key)
    std::string name;                     ///< Human label
    std::string service_name;             ///< Owning service
    std::string path;                     ///< Exact path, or prefix ending in '*'
    std::vector<std::string> methods;     ///< Upper-case methods; "*" accepts any
    std::map<std::string, std::string> headers; ///< Declared headers (informational)
    std::optional<std::chrono::milliseconds> timeout; ///< Caller-enforced; unset = mesh default
    std::optional<uint32_t> retries;                  ///< Caller-enforced; unset = mesh default
    CircuitBreakerParams circuit_breaker{};
    LbStrategy strategy{LbStrategy::Weighted};
    bool health_check{true};              ///< Declared only; selection always requires Healthy

    bool operator==(const ServiceRoute&) const = default;
};

/** @struct RouteRequest
 *  @brief The parts of an inbound request the router looks at.
 */
struct RouteRequest {
    std::string path;
    std::string method;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query;
};

/// `pattern == path`, or `pattern` ends in '*' and `path` starts with the prefix before it.
bool path_matches(std::string_view pattern, std::string_view path) noexcept;

/// Route accepts `method` (case-insensitive) or declares the "*" wildcard.
bool method_matches(const ServiceRoute& route, std::string_view method);

/** @class RouteTable
 *  @brief Routes keyed by id, kept in creation order so the first match is stable.
 */
class RouteTable {
public:
    /// Insert or replace by id. Returns true when a route was replaced.
    bool upsert(ServiceRoute route);

    /// Remove by id. Returns the removed route, or nullopt if absent.
    std::optional<ServiceRoute> remove(std::string_view route_id);

    /// First route owned by `service_name` matching method and path.
    [[nodiscard]] std::optional<ServiceRoute> match(std::string_view service_name,
                                                    std::string_view path,
                                                    std::string_view method) const;

    [[nodiscard]] std::optional<ServiceRoute> get(std::string_view route_id) const;
    [[nodiscard]] std::vector<ServiceRoute> all() const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::vector<ServiceRoute> routes_;
};

} // namespace harbor::mesh
