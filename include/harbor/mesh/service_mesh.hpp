#pragma once
/**
 * @file service_mesh.hpp
 * @brief Registry + router facade: traffic policy → load balancer → circuit breaker.
 *
 * Routing outcomes that are expected in normal operation (no route, fault abort,
 * no healthy endpoint, open breaker) come back as a RouteResult, never as exceptions.
 * Notifications are published on the EventBus after internal state is updated and
 * with no internal lock held.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "harbor/mesh/circuit_breaker.hpp"
#include "harbor/mesh/endpoint.hpp"
#include "harbor/mesh/health_checker.hpp"
#include "harbor/mesh/load_balancer.hpp"
#include "harbor/mesh/mesh_config.hpp"
#include "harbor/mesh/request_metrics.hpp"
#include "harbor/mesh/route.hpp"
#include "harbor/mesh/service_registry.hpp"
#include "harbor/mesh/traffic_policy.hpp"
#include "harbor/obs/event_bus.hpp"
#include "harbor/util/clock.hpp"
#include "harbor/util/periodic_task.hpp"
#include "harbor/util/random.hpp"

namespace harbor::mesh {

enum class RouteError : uint8_t {
    None,
    NoRoute,             ///< No route owned by the service matches path and method
    FaultInjected,       ///< Abort fault fired
    NoHealthyEndpoints,  ///< Balancer had nothing to choose from
    CircuitOpen          ///< Selected endpoint's breaker rejects traffic
};

std::string_view to_string(RouteError e) noexcept;

/** @struct RouteResult
 *  @brief Where a request should go, or why it cannot go anywhere.
 */
struct RouteResult {
    std::optional<ServiceEndpoint> endpoint;
    std::optional<ServiceRoute> route;
    RouteError error{RouteError::None};
    std::string reason;                               ///< Human-readable, empty on success

    std::optional<std::string> redirected_service;    ///< Set when a policy rule redirected
    std::optional<std::string> mirror_target;         ///< Advisory; the caller mirrors
    std::optional<std::chrono::milliseconds> injected_delay; ///< Caller applies before forwarding

    [[nodiscard]] bool ok() const noexcept { return error == RouteError::None; }
};

struct ServiceDiscovery {
    std::string service_name;
    EndpointList endpoints;
};

class ServiceMesh final {
public:
    /// @throws std::invalid_argument if `probe` is null.
    ServiceMesh(MeshConfig config,
                std::shared_ptr<HealthProbe> probe,
                obs::EventBus& bus,
                std::shared_ptr<util::Clock> clock = util::system_clock());
    ~ServiceMesh() noexcept;

    ServiceMesh(const ServiceMesh&) = delete;
    ServiceMesh& operator=(const ServiceMesh&) = delete;

    // ---------------------------- Registration -------------------------------
    /// Upsert an endpoint by (service_name, id). Emits serviceRegistered on success.
    RegistryErr register_service(const ServiceEndpoint& endpoint);

    /// Remove an endpoint. Emits serviceDeregistered. Returns false if absent.
    bool deregister_service(std::string_view service_name, std::string_view endpoint_id);

    /// Insert or replace a route by id; unset timeout/retries take the mesh defaults.
    RegistryErr create_route(ServiceRoute route);

    bool remove_route(std::string_view route_id);

    /// Insert or replace the policy owned by `policy.service_name`.
    RegistryErr set_traffic_policy(TrafficPolicy policy);

    // ---------------------------- Data path ----------------------------------
    RouteResult route_request(std::string_view service_name, const RouteRequest& request);

    /// Feed a request outcome back into the breaker and the endpoint's metrics.
    void record_request_result(std::string_view endpoint_id, bool success, double latency_ms);

    // ---------------------------- Queries ------------------------------------
    /// One entry for `service_name` (empty list if unknown), or every service.
    [[nodiscard]] std::vector<ServiceDiscovery>
    discover_services(std::optional<std::string_view> service_name = std::nullopt) const;

    /// Metrics of the service's current endpoints, or of every endpoint ever recorded.
    [[nodiscard]] std::map<std::string, MetricsData>
    get_metrics(std::optional<std::string_view> service_name = std::nullopt) const;

    [[nodiscard]] std::vector<CircuitBreakerState> get_circuit_breaker_status() const;

    /// Administrative override. Only Open and Closed are accepted.
    bool set_circuit_breaker_state(std::string_view endpoint_id, BreakerState state);

    [[nodiscard]] std::vector<ServiceRoute> routes() const { return routes_.all(); }
    [[nodiscard]] std::optional<TrafficPolicy> traffic_policy(std::string_view service_name) const {
        return policies_.policy(service_name);
    }
    [[nodiscard]] const ServiceRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const MeshConfig& config() const noexcept { return config_; }

    // ---------------------------- Ticks --------------------------------------
    /// Health-check pass over every endpoint. Returns the number of health changes.
    std::size_t run_health_checks(const util::CancelToken& token = {});

    /// Emit the aggregate metricsCollected notification and return it.
    obs::MeshMetricsSummary publish_mesh_metrics();

    /// Start the health-check and mesh-metrics ticks.
    void start();

    /// Stop both ticks; a tick in progress completes and its late writes are dropped.
    void stop() noexcept;

private:
    MeshConfig config_;
    std::shared_ptr<util::Clock> clock_;
    obs::EventBus& bus_;
    std::shared_ptr<util::Random> rng_;

    ServiceRegistry registry_;
    RouteTable routes_;
    TrafficPolicyEngine policies_;
    LoadBalancer balancer_;
    CircuitBreakerTable breakers_;
    RequestMetricsStore metrics_;

    HealthChecker health_;
    util::PeriodicTask metrics_task_;
};

} // namespace harbor::mesh
