#pragma once
/**
 * @file resource_monitor.hpp
 * @brief Per-container sampling, threshold alerting, retention and forecasting.
 *
 * Collection tick (collect_once):
 *   1. Copy the active container ids.
 *   2. For each id, with no lock held: fetch a stats snapshot, parse it.
 *   3. Append to the container's bounded history, evaluate thresholds,
 *      raise deduplicated alerts, publish alertCreated / metricsCollected.
 * A failed fetch or parse is logged and skipped; other containers are unaffected.
 *
 * Removing a container stops sampling but keeps its history and alerts until the
 * retention sweep ages them out.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "harbor/config/constants.hpp"
#include "harbor/monitor/alert_evaluator.hpp"
#include "harbor/monitor/container_runtime.hpp"
#include "harbor/monitor/metrics_history.hpp"
#include "harbor/monitor/monitor_config.hpp"
#include "harbor/monitor/resource_types.hpp"
#include "harbor/monitor/trend_forecaster.hpp"
#include "harbor/obs/event_bus.hpp"
#include "harbor/util/clock.hpp"
#include "harbor/util/periodic_task.hpp"

namespace harbor::monitor {

struct UtilizationSummary {
    std::size_t total_containers{0};
    double average_cpu_usage{0.0};      ///< Percent, over containers with a sample
    double average_memory_usage{0.0};   ///< Bytes, over containers with a sample
    uint64_t total_memory_used{0};      ///< Bytes
    std::size_t active_alerts{0};       ///< Unacknowledged
    std::size_t critical_alerts{0};     ///< Unacknowledged and critical
};

struct TrendPoint {
    util::TimePoint timestamp{};
    double value{0.0};
};

struct NetworkTrendPoint {
    util::TimePoint timestamp{};
    uint64_t rx{0};
    uint64_t tx{0};
};

struct ResourceTrends {
    std::vector<TrendPoint> cpu;
    std::vector<TrendPoint> memory;
    std::vector<NetworkTrendPoint> network;
};

struct SweepResult {
    std::size_t samples_removed{0};
    std::size_t alerts_removed{0};
};

class ResourceMonitor final {
public:
    /// @throws std::invalid_argument if `runtime` is null.
    ResourceMonitor(MonitorConfig config,
                    std::shared_ptr<ContainerRuntime> runtime,
                    obs::EventBus& bus,
                    std::shared_ptr<util::Clock> clock = util::system_clock());
    ~ResourceMonitor() noexcept;

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    // ---------------------------- Lifecycle hooks ----------------------------
    void add_container(std::string_view container_id);
    void remove_container(std::string_view container_id);

    /// Write limits through to the runtime. On failure nothing is recorded.
    bool set_resource_limits(std::string_view container_id, const ResourceLimit& limit);

    // ---------------------------- Queries ------------------------------------
    [[nodiscard]] std::optional<ResourceLimit> get_limits(std::string_view container_id) const;
    [[nodiscard]] std::vector<ResourceMetrics> get_metrics(std::string_view container_id) const;
    [[nodiscard]] std::vector<ResourceAlert> get_alerts(std::string_view container_id) const;
    [[nodiscard]] std::vector<ResourceAlert> get_all_alerts() const;
    bool acknowledge_alert(std::string_view alert_id);

    [[nodiscard]] UtilizationSummary get_utilization_summary() const;

    /// Series for samples newer than now - window (default: config().trends_window).
    [[nodiscard]] ResourceTrends get_resource_trends(
        std::string_view container_id,
        std::optional<std::chrono::milliseconds> window = std::nullopt) const;

    [[nodiscard]] Forecast predict_resource_usage(
        std::string_view container_id,
        double forecast_minutes = config::constants::FORECAST_DEFAULT_MINUTES) const;

    [[nodiscard]] std::vector<std::string> active_containers() const;
    [[nodiscard]] const MonitorConfig& config() const noexcept { return config_; }

    // ---------------------------- Ticks --------------------------------------
    /// Sample every active container once. Returns the number of samples stored.
    std::size_t collect_once(const util::CancelToken& token = {});

    /// Delete samples and alerts older than the retention window.
    SweepResult sweep_retention();

    void start();
    void stop() noexcept;

private:
    /// Fetch+parse one container; nullopt when skipped.
    std::optional<ResourceMetrics> sample(const std::string& container_id);

    /// Store, evaluate and publish one sample. Returns false if the container went away.
    bool ingest(ResourceMetrics sample, const util::CancelToken& token);

    MonitorConfig config_;
    std::shared_ptr<ContainerRuntime> runtime_;
    obs::EventBus& bus_;
    std::shared_ptr<util::Clock> clock_;

    mutable std::mutex mu_;   ///< Guards active_, history_, limits_
    std::set<std::string, std::less<>> active_;
    std::map<std::string, MetricsHistory<ResourceMetrics>, std::less<>> history_;
    std::map<std::string, ResourceLimit, std::less<>> limits_;

    AlertStore alerts_;

    util::PeriodicTask collect_task_;
    util::PeriodicTask sweep_task_;
};

} // namespace harbor::monitor
