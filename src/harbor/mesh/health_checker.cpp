/**
 * @file health_checker.cpp
 */
#include "harbor/mesh/health_checker.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace harbor::mesh {

HealthChecker::HealthChecker(ServiceRegistry& registry,
                             std::shared_ptr<HealthProbe> probe,
                             std::chrono::milliseconds interval,
                             OnChange on_change)
    : registry_(registry),
      probe_(std::move(probe)),
      on_change_(std::move(on_change)),
      task_("health-check", interval, [this](const util::CancelToken& t) { run_once(t); }) {
    if (!probe_) throw std::invalid_argument("HealthChecker requires a probe");
}

std::size_t HealthChecker::run_once(const util::CancelToken& token) {
    // Probe against a snapshot; endpoints registered mid-pass wait for the next tick.
    const auto snap = registry_.snapshot();
    std::size_t changed = 0;

    for (const auto& [service, endpoints] : *snap) {
        for (const auto& ep : endpoints) {
            bool healthy = false;
            try {
                healthy = probe_->probe(ep);
            } catch (const std::exception& e) {
                spdlog::error("[HealthChecker] probe failed for {} ({}): {}", ep.id, service, e.what());
            }

            if (token.stale()) return changed;

            const Health next = healthy ? Health::Healthy : Health::Unhealthy;
            const auto previous = registry_.setHealth(service, ep.id, next);
            if (!previous || *previous == next) continue; // deregistered, or unchanged

            ++changed;
            spdlog::info("[HealthChecker] {} ({}) {} -> {}", ep.id, service,
                         to_string(*previous), to_string(next));

            if (on_change_) {
                if (auto updated = registry_.find(service, ep.id)) on_change_(*updated, *previous);
            }
        }
    }
    return changed;
}

} // namespace harbor::mesh
