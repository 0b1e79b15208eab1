/**
 * @file main.cpp
 * @brief Replay driver: wires config, mesh and monitor over recorded runtime stats.
 *
 * **Bootstrap**
 * - Configure spdlog, load config (fail fast), build the event bus.
 * - Build a ServiceMesh (one endpoint per recorded container) and a ResourceMonitor
 *   backed by a ReplayRuntime.
 *
 * **Replay**
 * - One collection tick per recorded snapshot; the replay clock advances by the
 *   collection interval between ticks. Alerts are logged as they are raised.
 *
 * **Report**
 * - Utilization summary, mesh metrics and a forecast per container.
 */

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <string>
#include <variant>

#include <spdlog/spdlog.h>

#include "harbor/config/config_loader.hpp"
#include "harbor/config/constants.hpp"
#include "harbor/mesh/health_checker.hpp"
#include "harbor/mesh/service_mesh.hpp"
#include "harbor/monitor/replay_runtime.hpp"
#include "harbor/monitor/resource_monitor.hpp"
#include "harbor/obs/event_bus.hpp"
#include "harbor/util/clock.hpp"
#include "harbor/version.hpp"

namespace {

constexpr const char* kReplayService = "sandbox";
constexpr const char* kReplayHost = "127.0.0.1";
constexpr uint16_t kReplayBasePort = 8080;

} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (argc != 3) {
        spdlog::error("usage: {} <config.json> <replay.json>", argc > 0 ? argv[0] : "harbor_app");
        return EXIT_FAILURE;
    }

    auto cfg = harbor::config::Loader::load_from_file(argv[1]);
    if (!cfg) {
        spdlog::error("[harbor] configuration rejected: {} {}", cfg.error().key, cfg.error().message);
        return EXIT_FAILURE;
    }
    spdlog::set_level(spdlog::level::from_str(cfg->log_level));
    spdlog::info("[harbor] {} starting", harbor::version_string);

    auto replay = harbor::monitor::ReplayRuntime::from_file(argv[2]);
    if (!replay) {
        spdlog::error("[harbor] replay rejected: {}", replay.error());
        return EXIT_FAILURE;
    }
    std::shared_ptr<harbor::monitor::ReplayRuntime> runtime = std::move(*replay);

    harbor::obs::EventBus bus;
    auto clock = std::make_shared<harbor::util::ManualClock>(harbor::util::system_clock()->now());

    bus.subscribe(harbor::obs::EventKind::AlertCreated, [](const harbor::obs::Event& e) {
        const auto* alert = std::get_if<harbor::monitor::ResourceAlert>(&e.payload);
        if (alert == nullptr) return;
        spdlog::info("[harbor] alert {} on {}: {}", alert->id, alert->container_id, alert->message);
    });

    // Every replayed container answers probes while it still has snapshots left.
    auto probe = std::make_shared<harbor::mesh::FunctionProbe>(
        [runtime](const harbor::mesh::ServiceEndpoint& ep) { return runtime->remaining(ep.id) > 0; });

    harbor::mesh::ServiceMesh mesh(cfg->mesh, probe, bus, clock);
    harbor::monitor::ResourceMonitor monitor(cfg->monitor, runtime, bus, clock);

    const auto ids = runtime->container_ids();
    uint16_t port = kReplayBasePort;
    std::size_t ticks = 0;
    for (const auto& id : ids) {
        harbor::mesh::ServiceEndpoint ep;
        ep.id = id;
        ep.service_name = kReplayService;
        ep.host = kReplayHost;
        ep.port = port++;
        if (auto err = mesh.register_service(ep); err != harbor::mesh::RegistryErr::Ok) {
            spdlog::error("[harbor] cannot register {}: {}", id, harbor::mesh::to_string(err));
            return EXIT_FAILURE;
        }
        monitor.add_container(id);
        ticks = std::max(ticks, runtime->remaining(id));
    }

    harbor::mesh::ServiceRoute route;
    route.id = "sandbox-default";
    route.name = "sandbox";
    route.service_name = kReplayService;
    route.path = "/*";
    route.methods = {"*"};
    if (auto err = mesh.create_route(route); err != harbor::mesh::RegistryErr::Ok) {
        spdlog::error("[harbor] cannot create route: {}", harbor::mesh::to_string(err));
        return EXIT_FAILURE;
    }

    const harbor::mesh::RouteRequest probe_request{"/exec", "POST", {}, {}};
    for (std::size_t i = 0; i < ticks; ++i) {
        mesh.run_health_checks();
        auto routed = mesh.route_request(kReplayService, probe_request);
        if (routed.ok()) {
            mesh.record_request_result(routed.endpoint->id, true, 0.0);
        } else {
            spdlog::debug("[harbor] tick {}: {}", i, routed.reason);
        }
        monitor.collect_once();
        clock->advance(cfg->monitor.collection_interval);
    }

    const auto summary = monitor.get_utilization_summary();
    spdlog::info("[harbor] containers: {}, avg cpu: {:.1f}%, avg memory: {:.0f} B, total memory: {} B",
                 summary.total_containers, summary.average_cpu_usage, summary.average_memory_usage,
                 summary.total_memory_used);
    spdlog::info("[harbor] active alerts: {} (critical: {})", summary.active_alerts, summary.critical_alerts);

    const auto mesh_summary = mesh.publish_mesh_metrics();
    spdlog::info("[harbor] mesh: {} requests over {} services / {} endpoints", mesh_summary.total_requests,
                 mesh_summary.total_services, mesh_summary.total_endpoints);

    for (const auto& id : ids) {
        const auto f = monitor.predict_resource_usage(id, harbor::config::constants::FORECAST_DEFAULT_MINUTES);
        spdlog::info("[harbor] {} forecast: cpu {:.1f}% (r2 {:.2f}), memory {:.1f}% (r2 {:.2f})", id,
                     f.cpu.predicted, f.cpu.confidence, f.memory.predicted, f.memory.confidence);
        for (const auto& msg : f.alerts) spdlog::info("[harbor]   {}", msg);
    }

    mesh.stop();
    monitor.stop();
    return EXIT_SUCCESS;
}
