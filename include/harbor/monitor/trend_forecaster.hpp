#pragma once
/**
 * @file trend_forecaster.hpp
 * @brief Ordinary least squares over recent samples to project cpu% and memory%.
 *
 * x is the sample index (0 = oldest of the window), y the metric value. The projection
 * is anchored at the newest sample:
 *   predicted = intercept + slope * ((n - 1) + horizon_ms / sampling_interval_ms)
 * clamped to [0,100]. Confidence is R² clamped to [0,1] (0 when y is constant).
 * The index axis tolerates gaps from eviction; only sample order matters.
 */

#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "harbor/config/constants.hpp"
#include "harbor/monitor/resource_types.hpp"

namespace harbor::monitor {

struct LinearFit {
    double intercept{0.0};
    double slope{0.0};
    double r_squared{0.0};   ///< Clamped to [0,1]
    std::size_t n{0};
};

/// Least-squares line through (i, ys[i]). Fewer than two points yields slope 0.
LinearFit fit_linear(std::span<const double> ys) noexcept;

struct MetricForecast {
    double predicted{0.0};
    double confidence{0.0};
};

struct Forecast {
    MetricForecast cpu{};
    MetricForecast memory{};
    std::vector<std::string> alerts;   ///< Advisory messages
};

struct ForecastParams {
    std::size_t min_samples{config::constants::FORECAST_MIN_SAMPLES};
    std::size_t window{config::constants::FORECAST_WINDOW_SAMPLES};
    std::chrono::milliseconds sampling_interval{config::constants::MONITOR_COLLECTION_INTERVAL_MS};
};

/**
 * @brief Project cpu and memory usage `horizon_minutes` ahead.
 * @param history Samples oldest first; only the last `params.window` are fitted.
 * @return Zero confidence plus an explanatory message when history is too short.
 */
Forecast forecast_usage(std::span<const ResourceMetrics> history,
                        double horizon_minutes,
                        const ForecastParams& params,
                        const ThresholdConfig& thresholds);

} // namespace harbor::monitor
