/**
 * @file test_forecaster.cpp
 * @brief Tests for the least-squares fit and the cpu/memory projection.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <vector>

#include "harbor/monitor/trend_forecaster.hpp"

using namespace std::chrono_literals;
using harbor::monitor::fit_linear;
using harbor::monitor::forecast_usage;
using harbor::monitor::ForecastParams;
using harbor::monitor::ResourceMetrics;
using harbor::monitor::ThresholdConfig;

static std::vector<ResourceMetrics> series(std::size_t n, double cpu0, double cpu_step,
                                           double mem0, double mem_step) {
  std::vector<ResourceMetrics> out(n);
  for (std::size_t i = 0; i < n; ++i) {
    out[i].cpu.usage = cpu0 + cpu_step * static_cast<double>(i);
    out[i].memory.percentage = mem0 + mem_step * static_cast<double>(i);
  }
  return out;
}

// --------------------------- fit_linear -------------------------------------

/**
 * @test Fit_Exact_Line
 */
TEST(TrendForecaster, Fit_Exact_Line) {
  const std::vector<double> ys{1.0, 3.0, 5.0, 7.0};
  auto fit = fit_linear(ys);
  EXPECT_EQ(fit.n, 4u);
  EXPECT_NEAR(fit.slope, 2.0, 1e-12);
  EXPECT_NEAR(fit.intercept, 1.0, 1e-12);
  EXPECT_NEAR(fit.r_squared, 1.0, 1e-12);
}

/**
 * @test Fit_Constant_Has_Zero_Confidence
 */
TEST(TrendForecaster, Fit_Constant_Has_Zero_Confidence) {
  const std::vector<double> ys(8, 42.0);
  auto fit = fit_linear(ys);
  EXPECT_DOUBLE_EQ(fit.slope, 0.0);
  EXPECT_DOUBLE_EQ(fit.intercept, 42.0);
  EXPECT_DOUBLE_EQ(fit.r_squared, 0.0);
}

/**
 * @test Fit_Degenerate_Inputs
 */
TEST(TrendForecaster, Fit_Degenerate_Inputs) {
  EXPECT_EQ(fit_linear({}).n, 0u);
  const std::vector<double> one{5.0};
  auto fit = fit_linear(one);
  EXPECT_DOUBLE_EQ(fit.intercept, 5.0);
  EXPECT_DOUBLE_EQ(fit.slope, 0.0);
}

// --------------------------- forecast_usage ---------------------------------

/**
 * @test Forecast_Insufficient_Data
 * @brief 3 samples → zero confidence and an explanatory message.
 */
TEST(TrendForecaster, Forecast_Insufficient_Data) {
  auto h = series(3, 10.0, 1.0, 10.0, 1.0);
  auto f = forecast_usage(h, 30.0, ForecastParams{}, ThresholdConfig{});
  EXPECT_DOUBLE_EQ(f.cpu.confidence, 0.0);
  EXPECT_DOUBLE_EQ(f.memory.confidence, 0.0);
  EXPECT_DOUBLE_EQ(f.cpu.predicted, 0.0);
  ASSERT_EQ(f.alerts.size(), 1u);
  EXPECT_EQ(f.alerts[0], "Insufficient data for prediction");
}

/**
 * @test Forecast_Flat_Series
 */
TEST(TrendForecaster, Forecast_Flat_Series) {
  auto h = series(12, 30.0, 0.0, 40.0, 0.0);
  auto f = forecast_usage(h, 30.0, ForecastParams{}, ThresholdConfig{});
  EXPECT_NEAR(f.cpu.predicted, 30.0, 1e-9);
  EXPECT_NEAR(f.memory.predicted, 40.0, 1e-9);
  EXPECT_DOUBLE_EQ(f.cpu.confidence, 0.0);
  EXPECT_TRUE(f.alerts.empty());
}

/**
 * @test Forecast_Anchored_At_Newest_Sample
 * @brief slope 0.1/sample, 5 s interval, 1 min horizon → 12 steps past the last sample.
 */
TEST(TrendForecaster, Forecast_Anchored_At_Newest_Sample) {
  auto h = series(10, 20.0, 0.1, 50.0, 0.0);
  ForecastParams p;
  p.sampling_interval = 5s;
  auto f = forecast_usage(h, 1.0, p, ThresholdConfig{});
  // last = 20.9; + 12 * 0.1
  EXPECT_NEAR(f.cpu.predicted, 22.1, 1e-9);
  EXPECT_NEAR(f.cpu.confidence, 1.0, 1e-9);
}

/**
 * @test Forecast_Uses_Recent_Window
 * @brief Only the last `window` samples are fitted.
 */
TEST(TrendForecaster, Forecast_Uses_Recent_Window) {
  auto h = series(30, 90.0, 0.0, 10.0, 0.0);
  for (std::size_t i = 10; i < 30; ++i) h[i].cpu.usage = 20.0;   // last 20 flat at 20%
  auto f = forecast_usage(h, 30.0, ForecastParams{}, ThresholdConfig{});
  EXPECT_NEAR(f.cpu.predicted, 20.0, 1e-9);
}

/**
 * @test Forecast_Rising_Trend_Advises_And_Clamps
 */
TEST(TrendForecaster, Forecast_Rising_Trend_Advises_And_Clamps) {
  auto h = series(20, 40.0, 2.0, 60.0, 1.0);
  auto f = forecast_usage(h, 30.0, ForecastParams{}, ThresholdConfig{});
  EXPECT_DOUBLE_EQ(f.cpu.predicted, 100.0);
  EXPECT_DOUBLE_EQ(f.memory.predicted, 100.0);
  ASSERT_EQ(f.alerts.size(), 2u);
  EXPECT_EQ(f.alerts[0], "CPU usage may exceed 70% in 30 minutes");
  EXPECT_EQ(f.alerts[1], "Memory usage may exceed 80% in 30 minutes");
}

/**
 * @test Forecast_Falling_Trend_Clamped_At_Zero
 */
TEST(TrendForecaster, Forecast_Falling_Trend_Clamped_At_Zero) {
  auto h = series(20, 50.0, -2.0, 50.0, -2.0);
  auto f = forecast_usage(h, 30.0, ForecastParams{}, ThresholdConfig{});
  EXPECT_DOUBLE_EQ(f.cpu.predicted, 0.0);
  EXPECT_DOUBLE_EQ(f.memory.predicted, 0.0);
  EXPECT_TRUE(f.alerts.empty());
}
