#pragma once
/**
 * @file monitor_config.hpp
 * @brief Tunables for the resource monitor. Defaults come from constants.hpp.
 */

#include <chrono>
#include <cstddef>

#include "harbor/config/constants.hpp"
#include "harbor/monitor/resource_types.hpp"

namespace harbor::monitor {

struct MonitorConfig {
    std::chrono::milliseconds collection_interval{config::constants::MONITOR_COLLECTION_INTERVAL_MS};
    std::size_t history_capacity{config::constants::MONITOR_HISTORY_CAPACITY};
    std::chrono::milliseconds metrics_retention{config::constants::MONITOR_METRICS_RETENTION_MS};
    std::chrono::milliseconds alert_cooldown{config::constants::MONITOR_ALERT_COOLDOWN_MS};
    std::chrono::milliseconds sweep_interval{config::constants::MONITOR_SWEEP_INTERVAL_MS};
    std::chrono::milliseconds trends_window{config::constants::MONITOR_TRENDS_WINDOW_MS};
    std::size_t forecast_min_samples{config::constants::FORECAST_MIN_SAMPLES};
    std::size_t forecast_window{config::constants::FORECAST_WINDOW_SAMPLES};
    ThresholdConfig thresholds{};
};

} // namespace harbor::monitor
