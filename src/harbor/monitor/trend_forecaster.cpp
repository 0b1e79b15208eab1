/**
 * @file trend_forecaster.cpp
 */
#include "harbor/monitor/trend_forecaster.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>

namespace harbor::monitor {

LinearFit fit_linear(std::span<const double> ys) noexcept {
    LinearFit fit;
    fit.n = ys.size();
    if (ys.empty()) return fit;
    if (ys.size() < 2) {
        fit.intercept = ys.front();
        return fit;
    }

    const double n = static_cast<double>(ys.size());
    const double mean_x = (n - 1.0) / 2.0;
    double mean_y = 0.0;
    for (double y : ys) mean_y += y;
    mean_y /= n;

    double num = 0.0;
    double den = 0.0;
    for (std::size_t i = 0; i < ys.size(); ++i) {
        const double dx = static_cast<double>(i) - mean_x;
        num += dx * (ys[i] - mean_y);
        den += dx * dx;
    }
    fit.slope = den == 0.0 ? 0.0 : num / den;
    fit.intercept = mean_y - fit.slope * mean_x;

    double tss = 0.0;
    double rss = 0.0;
    for (std::size_t i = 0; i < ys.size(); ++i) {
        const double fitted = fit.intercept + fit.slope * static_cast<double>(i);
        tss += (ys[i] - mean_y) * (ys[i] - mean_y);
        rss += (ys[i] - fitted) * (ys[i] - fitted);
    }
    fit.r_squared = tss == 0.0 ? 0.0 : std::clamp(1.0 - rss / tss, 0.0, 1.0);
    return fit;
}

namespace {

MetricForecast project(const LinearFit& fit, double steps_ahead) {
    const double anchor = static_cast<double>(fit.n) - 1.0;
    const double predicted = fit.intercept + fit.slope * (anchor + steps_ahead);
    return {std::clamp(predicted, 0.0, 100.0), fit.r_squared};
}

} // namespace

Forecast forecast_usage(std::span<const ResourceMetrics> history,
                        double horizon_minutes,
                        const ForecastParams& params,
                        const ThresholdConfig& thresholds) {
    Forecast out;
    if (history.size() < params.min_samples || history.empty()) {
        out.alerts.emplace_back("Insufficient data for prediction");
        return out;
    }

    const auto window = std::min(params.window, history.size());
    const auto recent = history.subspan(history.size() - window);

    std::vector<double> cpu;
    std::vector<double> mem;
    cpu.reserve(window);
    mem.reserve(window);
    for (const auto& s : recent) {
        cpu.push_back(s.cpu.usage);
        mem.push_back(s.memory.percentage);
    }

    const double interval_ms = static_cast<double>(params.sampling_interval.count());
    const double steps = interval_ms > 0.0 ? horizon_minutes * 60.0 * 1000.0 / interval_ms : 0.0;

    out.cpu = project(fit_linear(cpu), steps);
    out.memory = project(fit_linear(mem), steps);

    if (out.cpu.predicted > thresholds.cpu.warning) {
        out.alerts.push_back(fmt::format("CPU usage may exceed {}% in {} minutes",
                                         thresholds.cpu.warning, horizon_minutes));
    }
    if (out.memory.predicted > thresholds.memory.warning) {
        out.alerts.push_back(fmt::format("Memory usage may exceed {}% in {} minutes",
                                         thresholds.memory.warning, horizon_minutes));
    }
    return out;
}

} // namespace harbor::monitor
