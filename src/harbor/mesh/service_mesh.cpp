/**
 * @file service_mesh.cpp
 * @brief Routing pipeline and mesh lifecycle.
 */
#include "harbor/mesh/service_mesh.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace harbor::mesh {

std::string_view to_string(RouteError e) noexcept {
    switch (e) {
        case RouteError::None:               return "none";
        case RouteError::NoRoute:            return "no_route";
        case RouteError::FaultInjected:      return "fault_injected";
        case RouteError::NoHealthyEndpoints: return "no_healthy_endpoints";
        case RouteError::CircuitOpen:        return "circuit_open";
    }
    return "none";
}

namespace {

RouteResult failure(RouteResult r, RouteError e, std::string reason) {
    r.endpoint.reset();
    r.error = e;
    r.reason = std::move(reason);
    return r;
}

} // namespace

ServiceMesh::ServiceMesh(MeshConfig config,
                         std::shared_ptr<HealthProbe> probe,
                         obs::EventBus& bus,
                         std::shared_ptr<util::Clock> clock)
    : config_(config),
      clock_(clock ? std::move(clock) : util::system_clock()),
      bus_(bus),
      rng_(std::make_shared<util::Random>(config.seed)),
      policies_(rng_),
      balancer_(rng_),
      breakers_(config.breaker),
      health_(registry_, std::move(probe), config.health_check_interval,
              [this](const ServiceEndpoint& ep, Health) {
                  bus_.publish(obs::EventKind::HealthChanged, clock_->now(), ep);
              }),
      metrics_task_("mesh-metrics", config.metrics_interval,
                    [this](const util::CancelToken& t) {
                        if (!t.stale()) publish_mesh_metrics();
                    }) {
    spdlog::info("[ServiceMesh] initialized (health check: {}ms, metrics: {}ms, breaker: {}/{}ms/{})",
                 config_.health_check_interval.count(), config_.metrics_interval.count(),
                 config_.breaker.threshold, config_.breaker.open_duration.count(),
                 config_.breaker.half_open_quota);
}

ServiceMesh::~ServiceMesh() noexcept {
    stop();
}

//------------------------------- Registration ---------------------------------

RegistryErr ServiceMesh::register_service(const ServiceEndpoint& endpoint) {
    const auto err = registry_.upsertEndpoint(endpoint);
    if (err != RegistryErr::Ok) {
        spdlog::warn("[ServiceMesh] rejected endpoint {} for {}: {}",
                     endpoint.id, endpoint.service_name, to_string(err));
        return err;
    }

    spdlog::info("[ServiceMesh] registered {} ({}) at {}", endpoint.id, endpoint.service_name,
                 endpoint.address());
    bus_.publish(obs::EventKind::ServiceRegistered, clock_->now(), endpoint);
    return RegistryErr::Ok;
}

bool ServiceMesh::deregister_service(std::string_view service_name, std::string_view endpoint_id) {
    auto removed = registry_.removeEndpoint(service_name, endpoint_id);
    if (!removed) return false;
    (void)breakers_.erase(endpoint_id);

    spdlog::info("[ServiceMesh] deregistered {} ({})", endpoint_id, service_name);
    bus_.publish(obs::EventKind::ServiceDeregistered, clock_->now(), std::move(*removed));
    return true;
}

RegistryErr ServiceMesh::create_route(ServiceRoute route) {
    if (route.id.empty() || route.service_name.empty() || route.path.empty()) {
        spdlog::warn("[ServiceMesh] rejected route '{}': id, service and path are required", route.id);
        return RegistryErr::Invalid;
    }
    const auto& cb = route.circuit_breaker;
    if (cb.threshold == 0 || cb.half_open_quota == 0 || cb.open_duration.count() <= 0) {
        spdlog::warn("[ServiceMesh] rejected route '{}': circuit breaker parameters must be positive",
                     route.id);
        return RegistryErr::Invalid;
    }
    if (!route.timeout) route.timeout = config_.default_timeout;
    if (!route.retries) route.retries = config_.default_retries;

    const bool replaced = routes_.upsert(route);
    spdlog::info("[ServiceMesh] route {} {} {} -> {}", route.id, replaced ? "replaced" : "created",
                 route.path, route.service_name);
    bus_.publish(obs::EventKind::RouteCreated, clock_->now(), std::move(route));
    return RegistryErr::Ok;
}

bool ServiceMesh::remove_route(std::string_view route_id) {
    auto removed = routes_.remove(route_id);
    if (!removed) return false;

    spdlog::info("[ServiceMesh] route {} removed", route_id);
    bus_.publish(obs::EventKind::RouteRemoved, clock_->now(), std::move(*removed));
    return true;
}

RegistryErr ServiceMesh::set_traffic_policy(TrafficPolicy policy) {
    if (policy.service_name.empty()) return RegistryErr::Invalid;

    spdlog::info("[ServiceMesh] traffic policy for {} set ({} rules)",
                 policy.service_name, policy.rules.size());
    policies_.set_policy(policy);
    bus_.publish(obs::EventKind::TrafficPolicySet, clock_->now(), std::move(policy));
    return RegistryErr::Ok;
}

//------------------------------- Data path ------------------------------------

RouteResult ServiceMesh::route_request(std::string_view service_name, const RouteRequest& request) {
    RouteResult result;

    // 1) Route match
    result.route = routes_.match(service_name, request.path, request.method);
    if (!result.route) {
        return failure(std::move(result), RouteError::NoRoute,
                       fmt::format("No route found for {} {}", request.method, request.path));
    }

    // 2) Traffic policy: first matching rule only
    std::string target(service_name);
    if (auto decision = policies_.evaluate(service_name, request); decision && decision->matched) {
        result.mirror_target = decision->mirror;
        result.injected_delay = decision->delay;
        if (decision->redirect) {
            target = *decision->redirect;
            result.redirected_service = target;
        }
        if (decision->abort_status) {
            return failure(std::move(result), RouteError::FaultInjected,
                           fmt::format("Simulated fault: HTTP {}", *decision->abort_status));
        }
    }

    // 3) Load balancer over healthy endpoints
    auto endpoint = balancer_.select(registry_.endpoints(target), result.route->strategy);
    if (!endpoint) {
        return failure(std::move(result), RouteError::NoHealthyEndpoints,
                       fmt::format("No healthy endpoints available for {}", target));
    }

    // 4) Circuit breaker gate (lazy open → half-open)
    if (result.route->circuit_breaker.enabled) {
        const auto admission = breakers_.admit(endpoint->id, result.route->circuit_breaker, clock_->now());
        if (admission == Admission::Rejected) {
            return failure(std::move(result), RouteError::CircuitOpen,
                           fmt::format("Circuit breaker open for {}", endpoint->id));
        }
        if (admission == Admission::Probing) {
            spdlog::info("[ServiceMesh] circuit breaker for {} is half-open", endpoint->id);
        }
    }

    result.endpoint = std::move(endpoint);
    return result;
}

void ServiceMesh::record_request_result(std::string_view endpoint_id, bool success, double latency_ms) {
    const auto now = clock_->now();
    const auto transition = breakers_.record(endpoint_id, success, now);
    metrics_.record(endpoint_id, success, latency_ms);

    switch (transition) {
        case Transition::Opened:
            spdlog::warn("[ServiceMesh] circuit breaker opened for {}", endpoint_id);
            bus_.publish(obs::EventKind::CircuitBreakerOpened, now,
                         obs::BreakerOpened{std::string(endpoint_id)});
            break;
        case Transition::Reopened:
            spdlog::warn("[ServiceMesh] circuit breaker for {} failed while half-open, reopened", endpoint_id);
            break;
        case Transition::Closed:
            spdlog::info("[ServiceMesh] circuit breaker for {} closed", endpoint_id);
            break;
        case Transition::None:
            break;
    }

    bus_.publish(obs::EventKind::RequestRecorded, now,
                 obs::RequestRecorded{std::string(endpoint_id), success, latency_ms});
}

//------------------------------- Queries --------------------------------------

std::vector<ServiceDiscovery>
ServiceMesh::discover_services(std::optional<std::string_view> service_name) const {
    std::vector<ServiceDiscovery> out;
    if (service_name) {
        out.push_back({std::string(*service_name), registry_.endpoints(*service_name)});
        return out;
    }

    const auto snap = registry_.snapshot();
    for (const auto& name : registry_.listServices()) {
        auto it = snap->find(name);
        out.push_back({name, it != snap->end() ? it->second : EndpointList{}});
    }
    return out;
}

std::map<std::string, MetricsData>
ServiceMesh::get_metrics(std::optional<std::string_view> service_name) const {
    if (!service_name) return metrics_.snapshot();

    std::vector<std::string> ids;
    for (const auto& ep : registry_.endpoints(*service_name)) ids.push_back(ep.id);
    return metrics_.select(ids);
}

std::vector<CircuitBreakerState> ServiceMesh::get_circuit_breaker_status() const {
    return breakers_.snapshot();
}

bool ServiceMesh::set_circuit_breaker_state(std::string_view endpoint_id, BreakerState state) {
    if (!breakers_.force(endpoint_id, state, clock_->now())) return false;
    spdlog::info("[ServiceMesh] circuit breaker for {} forced {}", endpoint_id, to_string(state));
    return true;
}

//------------------------------- Ticks ----------------------------------------

std::size_t ServiceMesh::run_health_checks(const util::CancelToken& token) {
    return health_.run_once(token);
}

obs::MeshMetricsSummary ServiceMesh::publish_mesh_metrics() {
    obs::MeshMetricsSummary summary{clock_->now(), metrics_.total_requests(),
                                    registry_.size(), registry_.endpointCount()};
    bus_.publish(obs::EventKind::MetricsCollected, summary.timestamp, summary);
    return summary;
}

void ServiceMesh::start() {
    health_.start();
    metrics_task_.start();
}

void ServiceMesh::stop() noexcept {
    const bool was_running = health_.running() || metrics_task_.running();
    health_.stop();
    metrics_task_.stop();
    if (was_running) spdlog::info("[ServiceMesh] stopped");
}

} // namespace harbor::mesh
