#pragma once
/**
 * @file health_checker.hpp
 * @brief Periodic endpoint probing that drives the registry's health flags.
 * @details The probe is pluggable (a real reachability check lives outside this core).
 *          Probes run with no lock held. A probe that throws counts as unhealthy.
 */

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>

#include "harbor/mesh/endpoint.hpp"
#include "harbor/mesh/service_registry.hpp"
#include "harbor/util/periodic_task.hpp"

namespace harbor::mesh {

/** @class HealthProbe
 *  @brief Answers: is this endpoint reachable right now?
 */
class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    /**
     * @brief Probe one endpoint. Must be bounded by the implementation's own timeout.
     * @return true when healthy. Throwing is treated as unhealthy.
     */
    virtual bool probe(const ServiceEndpoint& endpoint) = 0;
};

/// Adapts a callable to HealthProbe.
class FunctionProbe final : public HealthProbe {
public:
    using Fn = std::function<bool(const ServiceEndpoint&)>;
    explicit FunctionProbe(Fn fn) : fn_(std::move(fn)) {}
    bool probe(const ServiceEndpoint& endpoint) override { return fn_(endpoint); }

private:
    Fn fn_;
};

class HealthChecker final {
public:
    /// Called after a stored health value actually changed.
    using OnChange = std::function<void(const ServiceEndpoint& updated, Health previous)>;

    /// @throws std::invalid_argument if `probe` is null.
    HealthChecker(ServiceRegistry& registry,
                  std::shared_ptr<HealthProbe> probe,
                  std::chrono::milliseconds interval,
                  OnChange on_change);

    void start() { task_.start(); }
    void stop() noexcept { task_.stop(); }
    [[nodiscard]] bool running() const noexcept { return task_.running(); }

    /**
     * @brief Probe every registered endpoint once.
     * @param token Checked after each probe; results from a stopped checker are dropped.
     * @return Number of endpoints whose health changed.
     */
    std::size_t run_once(const util::CancelToken& token = {});

private:
    ServiceRegistry& registry_;
    std::shared_ptr<HealthProbe> probe_;
    OnChange on_change_;
    util::PeriodicTask task_;
};

} // namespace harbor::mesh
