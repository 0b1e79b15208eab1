#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for mesh and monitor components.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace harbor::config::constants {

// =====================
// Service Mesh Cadence
// Units: milliseconds
// =====================
inline constexpr uint32_t MESH_HEALTH_CHECK_INTERVAL_MS = 30000; ///< Endpoint probe cadence
inline constexpr uint32_t MESH_METRICS_INTERVAL_MS      = 10000; ///< Aggregate metricsCollected cadence
inline constexpr uint32_t ROUTE_DEFAULT_TIMEOUT_MS      = 30000; ///< Stored per route, enforced by callers
inline constexpr uint32_t ROUTE_DEFAULT_RETRIES         = 3;     ///< Stored per route, enforced by callers

// =====================
// Circuit Breaker Defaults
// =====================
inline constexpr uint32_t CB_FAILURE_THRESHOLD  = 5;     ///< Consecutive failures that open the breaker
inline constexpr uint32_t CB_OPEN_DURATION_MS   = 60000; ///< Time an open breaker rejects traffic
inline constexpr uint32_t CB_HALF_OPEN_QUOTA    = 3;     ///< Half-open successes required to close

// =====================
// Load Balancer / Fault Injection
// =====================
inline constexpr uint32_t ENDPOINT_DEFAULT_WEIGHT = 100;                ///< Relative selection weight
inline constexpr uint64_t MESH_RNG_SEED_DEFAULT   = 0x4A12B0C5EEDULL;  ///< Deterministic seed for selection draws
inline constexpr uint16_t FAULT_DEFAULT_ABORT_STATUS = 503;            ///< Simulated abort status

// =====================
// Latency accretion (coarse percentiles)
// =====================
inline constexpr double LATENCY_P50_BLEND = 0.5; ///< p50 <- p50 + (latency - p50) * blend

// =====================
// Resource Monitor Cadence / Retention
// =====================
inline constexpr uint32_t MONITOR_COLLECTION_INTERVAL_MS = 5000;     ///< Stats sampling cadence
inline constexpr std::size_t MONITOR_HISTORY_CAPACITY    = 720;      ///< ~1 hour at 5 s
inline constexpr uint32_t MONITOR_METRICS_RETENTION_MS   = 3600000;  ///< 1 hour
inline constexpr uint32_t MONITOR_ALERT_COOLDOWN_MS      = 300000;   ///< 5 minutes
inline constexpr uint32_t MONITOR_SWEEP_INTERVAL_MS      = 300000;   ///< Retention sweep cadence
inline constexpr uint32_t MONITOR_TRENDS_WINDOW_MS       = 3600000;  ///< Default getResourceTrends window

// =====================
// Forecasting
// =====================
inline constexpr std::size_t FORECAST_MIN_SAMPLES      = 10;   ///< Below this, confidence is 0
inline constexpr std::size_t FORECAST_WINDOW_SAMPLES   = 20;   ///< Most recent samples fitted
inline constexpr double      FORECAST_DEFAULT_MINUTES  = 30.0; ///< Default horizon

// =====================
// Threshold Defaults (warning / critical)
// Units: percent for cpu/memory; bytes per second for network/disk; count for processes
// =====================
inline constexpr double CPU_WARNING_PCT        = 70.0;
inline constexpr double CPU_CRITICAL_PCT       = 90.0;
inline constexpr double MEMORY_WARNING_PCT     = 80.0;
inline constexpr double MEMORY_CRITICAL_PCT    = 95.0;
inline constexpr double NETWORK_WARNING_BPS    = 100.0 * 1024 * 1024; ///< 100 MiB/s
inline constexpr double NETWORK_CRITICAL_BPS   = 200.0 * 1024 * 1024; ///< 200 MiB/s
inline constexpr double DISK_WARNING_BPS       = 50.0 * 1024 * 1024;  ///< 50 MiB/s
inline constexpr double DISK_CRITICAL_BPS      = 100.0 * 1024 * 1024; ///< 100 MiB/s
inline constexpr double PROCESSES_WARNING      = 100.0;
inline constexpr double PROCESSES_CRITICAL     = 200.0;
inline constexpr double PROCESS_LIMIT_WARN_RATIO = 0.9; ///< Warn when running > ratio * limit.max

// =====================
// Runtime limit translation
// =====================
inline constexpr int64_t  RUNTIME_CPU_PERIOD_US          = 100000; ///< CFS period paired with the quota
inline constexpr double   RUNTIME_CPU_QUOTA_PER_PERCENT  = 1000.0; ///< quota = percentage * this

} // namespace harbor::config::constants
