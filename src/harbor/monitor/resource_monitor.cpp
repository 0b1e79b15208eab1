/**
 * @file resource_monitor.cpp
 * @brief Collection tick, alert fan-out, retention and read-side queries.
 */
#include "harbor/monitor/resource_monitor.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "harbor/monitor/stats_parser.hpp"

namespace harbor::monitor {

ResourceMonitor::ResourceMonitor(MonitorConfig config,
                                 std::shared_ptr<ContainerRuntime> runtime,
                                 obs::EventBus& bus,
                                 std::shared_ptr<util::Clock> clock)
    : config_(std::move(config)),
      runtime_(std::move(runtime)),
      bus_(bus),
      clock_(clock ? std::move(clock) : util::system_clock()),
      alerts_(config_.alert_cooldown),
      collect_task_("metrics-collect", config_.collection_interval,
                    [this](const util::CancelToken& t) { collect_once(t); }),
      sweep_task_("retention-sweep", config_.sweep_interval,
                  [this](const util::CancelToken& t) {
                      if (!t.stale()) sweep_retention();
                  }) {
    if (!runtime_) throw std::invalid_argument("ResourceMonitor requires a container runtime");
    spdlog::info("[ResourceMonitor] initialized (interval: {}ms, history: {}, retention: {}ms, cooldown: {}ms)",
                 config_.collection_interval.count(), config_.history_capacity,
                 config_.metrics_retention.count(), config_.alert_cooldown.count());
}

ResourceMonitor::~ResourceMonitor() noexcept {
    stop();
}

//------------------------------- Lifecycle hooks ------------------------------

void ResourceMonitor::add_container(std::string_view container_id) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (history_.find(container_id) == history_.end()) {
            auto ring = MetricsHistory<ResourceMetrics>::with_capacity(config_.history_capacity);
            if (!ring) {
                spdlog::error("[ResourceMonitor] cannot track {}: history capacity {} rejected",
                              container_id, config_.history_capacity);
                return;
            }
            history_.emplace(std::string(container_id), std::move(*ring));
        }
        active_.emplace(container_id);
    }
    spdlog::info("[ResourceMonitor] container {} added to monitoring", container_id);
}

void ResourceMonitor::remove_container(std::string_view container_id) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = active_.find(container_id);
        if (it == active_.end()) return;
        active_.erase(it);
    }
    spdlog::info("[ResourceMonitor] container {} removed from monitoring", container_id);
}

bool ResourceMonitor::set_resource_limits(std::string_view container_id, const ResourceLimit& limit) {
    const auto update = to_runtime_update(limit);
    harbor_detail::expected<void, std::string> applied;
    try {
        applied = runtime_->update_limits(container_id, update);
    } catch (const std::exception& e) {
        applied = harbor_detail::unexpected<std::string>(e.what());
    }
    if (!applied) {
        spdlog::error("[ResourceMonitor] failed to set limits for {}: {}", container_id, applied.error());
        return false;
    }

    ResourceLimit stored = limit;
    stored.container_id = std::string(container_id);
    {
        std::lock_guard<std::mutex> lk(mu_);
        limits_.insert_or_assign(stored.container_id, stored);
    }

    spdlog::info("[ResourceMonitor] limits updated for {} (cpu quota: {}/{}, memory: {}, pids: {})",
                 container_id, update.cpu_quota, update.cpu_period, update.memory, update.pids_limit);
    bus_.publish(obs::EventKind::LimitsUpdated, clock_->now(),
                 obs::LimitsUpdated{stored.container_id, stored});
    return true;
}

//------------------------------- Collection -----------------------------------

std::optional<ResourceMetrics> ResourceMonitor::sample(const std::string& container_id) {
    harbor_detail::expected<nlohmann::json, std::string> raw;
    try {
        raw = runtime_->fetch_stats(container_id);
    } catch (const std::exception& e) {
        raw = harbor_detail::unexpected<std::string>(e.what());
    }
    if (!raw) {
        // Expected when a container disappears between tick and fetch.
        spdlog::debug("[MetricsCollector] sample skipped for {}: {}", container_id, raw.error());
        return std::nullopt;
    }

    auto parsed = parse_stats(*raw, container_id, clock_->now());
    if (!parsed) {
        spdlog::debug("[MetricsCollector] sample skipped for {}: {} ({})", container_id,
                      parsed.error().message, parsed.error().field);
        return std::nullopt;
    }
    return std::move(*parsed);
}

bool ResourceMonitor::ingest(ResourceMetrics s, const util::CancelToken& token) {
    std::optional<ResourceLimit> limit;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (token.stale() || active_.find(s.container_id) == active_.end()) return false;
        auto it = history_.find(s.container_id);
        if (it == history_.end()) return false;
        it->second.push(s);
        if (auto l = limits_.find(s.container_id); l != limits_.end()) limit = l->second;
    }

    for (const auto& candidate : evaluate_thresholds(s, config_.thresholds, limit)) {
        auto alert = alerts_.raise(s.container_id, candidate, s.timestamp);
        if (!alert) continue;
        spdlog::warn("[AlertEvaluator] {} {} alert for {}: {}", to_string(alert->severity),
                     to_string(alert->type), alert->container_id, alert->message);
        bus_.publish(obs::EventKind::AlertCreated, alert->timestamp, std::move(*alert));
    }

    const auto ts = s.timestamp;
    bus_.publish(obs::EventKind::MetricsCollected, ts, std::move(s));
    return true;
}

std::size_t ResourceMonitor::collect_once(const util::CancelToken& token) {
    const auto ids = active_containers();
    std::size_t stored = 0;
    for (const auto& id : ids) {
        if (token.stale()) break;
        auto s = sample(id);
        if (!s) continue;
        if (ingest(std::move(*s), token)) ++stored;
    }
    return stored;
}

SweepResult ResourceMonitor::sweep_retention() {
    const auto cutoff = clock_->now() - config_.metrics_retention;
    SweepResult r;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, ring] : history_) {
            r.samples_removed += ring.drop_front_while(
                [&](const ResourceMetrics& m) { return m.timestamp < cutoff; });
        }
    }
    r.alerts_removed = alerts_.sweep(cutoff);
    if (r.samples_removed > 0 || r.alerts_removed > 0) {
        spdlog::debug("[ResourceMonitor] retention sweep removed {} samples, {} alerts",
                      r.samples_removed, r.alerts_removed);
    }
    return r;
}

void ResourceMonitor::start() {
    collect_task_.start();
    sweep_task_.start();
}

void ResourceMonitor::stop() noexcept {
    const bool was_running = collect_task_.running() || sweep_task_.running();
    collect_task_.stop();
    sweep_task_.stop();
    if (was_running) spdlog::info("[ResourceMonitor] stopped");
}

//------------------------------- Queries --------------------------------------

std::optional<ResourceLimit> ResourceMonitor::get_limits(std::string_view container_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = limits_.find(container_id);
    if (it == limits_.end()) return std::nullopt;
    return it->second;
}

std::vector<ResourceMetrics> ResourceMonitor::get_metrics(std::string_view container_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = history_.find(container_id);
    if (it == history_.end()) return {};
    return it->second.to_vector();
}

std::vector<ResourceAlert> ResourceMonitor::get_alerts(std::string_view container_id) const {
    return alerts_.for_container(container_id);
}

std::vector<ResourceAlert> ResourceMonitor::get_all_alerts() const {
    return alerts_.unacknowledged();
}

bool ResourceMonitor::acknowledge_alert(std::string_view alert_id) {
    auto alert = alerts_.acknowledge(alert_id);
    if (!alert) return false;
    spdlog::info("[ResourceMonitor] alert {} acknowledged", alert_id);
    bus_.publish(obs::EventKind::AlertAcknowledged, clock_->now(), std::move(*alert));
    return true;
}

UtilizationSummary ResourceMonitor::get_utilization_summary() const {
    UtilizationSummary sum;
    double total_cpu = 0.0;
    std::size_t with_samples = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        sum.total_containers = active_.size();
        for (const auto& id : active_) {
            auto it = history_.find(id);
            if (it == history_.end()) continue;
            const auto* latest = it->second.latest();
            if (!latest) continue;
            total_cpu += latest->cpu.usage;
            sum.total_memory_used += latest->memory.usage;
            ++with_samples;
        }
    }
    if (with_samples > 0) {
        sum.average_cpu_usage = total_cpu / static_cast<double>(with_samples);
        sum.average_memory_usage = static_cast<double>(sum.total_memory_used) / static_cast<double>(with_samples);
    }

    for (const auto& a : alerts_.unacknowledged()) {
        ++sum.active_alerts;
        if (a.severity == Severity::Critical) ++sum.critical_alerts;
    }
    return sum;
}

ResourceTrends ResourceMonitor::get_resource_trends(std::string_view container_id,
                                                    std::optional<std::chrono::milliseconds> window) const {
    const auto cutoff = clock_->now() - window.value_or(config_.trends_window);
    ResourceTrends out;
    for (const auto& m : get_metrics(container_id)) {
        if (m.timestamp < cutoff) continue;
        out.cpu.push_back({m.timestamp, m.cpu.usage});
        out.memory.push_back({m.timestamp, m.memory.percentage});
        out.network.push_back({m.timestamp, m.network.rx_bytes, m.network.tx_bytes});
    }
    return out;
}

Forecast ResourceMonitor::predict_resource_usage(std::string_view container_id, double forecast_minutes) const {
    const auto history = get_metrics(container_id);
    const ForecastParams params{config_.forecast_min_samples, config_.forecast_window,
                                config_.collection_interval};
    return forecast_usage(history, forecast_minutes, params, config_.thresholds);
}

std::vector<std::string> ResourceMonitor::active_containers() const {
    std::lock_guard<std::mutex> lk(mu_);
    return {active_.begin(), active_.end()};
}

} // namespace harbor::monitor
