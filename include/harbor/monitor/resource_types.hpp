#pragma once
/**
 * @file resource_types.hpp
 * @brief Container resource samples, declared limits, alerts and thresholds.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "harbor/config/constants.hpp"
#include "harbor/util/clock.hpp"

namespace harbor::monitor {

enum class MetricType : uint8_t { Cpu, Memory, Network, Disk, Processes };
enum class Severity : uint8_t { Warning, Critical };

std::string_view to_string(MetricType t) noexcept;
std::string_view to_string(Severity s) noexcept;

// ---------------------------------------------------------------------------
// Samples
// ---------------------------------------------------------------------------

struct CpuMetrics {
    double usage{0.0};        ///< Percent, clamped to [0,100]
    uint64_t throttled{0};    ///< Cumulative throttled time (ns)
    uint64_t system{0};       ///< Kernel-mode usage (ns)
    uint64_t user{0};         ///< User-mode usage (ns)
};

struct MemoryMetrics {
    uint64_t usage{0};        ///< Bytes
    uint64_t limit{0};        ///< Bytes
    double percentage{0.0};   ///< usage / limit * 100, 0 when limit is 0
    uint64_t cache{0};
    uint64_t rss{0};
    uint64_t swap{0};
};

/// Cumulative counters summed over all interfaces.
struct NetworkMetrics {
    uint64_t rx_bytes{0};
    uint64_t tx_bytes{0};
    uint64_t rx_packets{0};
    uint64_t tx_packets{0};
    uint64_t rx_errors{0};
    uint64_t tx_errors{0};
};

/// Cumulative block-IO counters summed over devices.
struct DiskMetrics {
    uint64_t read_bytes{0};
    uint64_t write_bytes{0};
    uint64_t read_ops{0};
    uint64_t write_ops{0};
};

/// Only `running` is derivable from runtime stats; the rest stay 0.
struct ProcessMetrics {
    uint64_t running{0};
    uint64_t sleeping{0};
    uint64_t stopped{0};
    uint64_t zombie{0};
};

/** @struct ResourceMetrics
 *  @brief One immutable sample per container per collection tick.
 */
struct ResourceMetrics {
    std::string container_id;
    util::TimePoint timestamp{};
    CpuMetrics cpu{};
    MemoryMetrics memory{};
    NetworkMetrics network{};
    DiskMetrics disk{};
    ProcessMetrics processes{};
};

// ---------------------------------------------------------------------------
// Declared limits
// ---------------------------------------------------------------------------

struct CpuLimit {
    double cores{0.0};
    double percentage{0.0};     ///< Max CPU percent
};

struct MemoryLimit {
    uint64_t limit{0};          ///< Bytes
    uint64_t swap{0};           ///< Bytes
    uint64_t reservation{0};    ///< Bytes
};

struct NetworkLimit {
    uint64_t bandwidth{0};      ///< Bytes/s (declared only)
    uint64_t connections{0};    ///< Declared only
};

struct DiskLimit {
    uint64_t read_rate{0};      ///< Bytes/s
    uint64_t write_rate{0};     ///< Bytes/s
    uint64_t space{0};          ///< Bytes (declared only)
};

struct ProcessLimit {
    uint64_t max{0};            ///< Max process count; 0 = unset
};

/** @struct ResourceLimit
 *  @brief Declared ceiling, written through to the container runtime.
 *         Read back for reporting; not re-validated against actual usage.
 */
struct ResourceLimit {
    std::string container_id;
    CpuLimit cpu{};
    MemoryLimit memory{};
    NetworkLimit network{};
    DiskLimit disk{};
    ProcessLimit processes{};
};

// ---------------------------------------------------------------------------
// Alerts
// ---------------------------------------------------------------------------

struct ResourceAlert {
    std::string id;
    std::string container_id;
    MetricType type{MetricType::Cpu};
    Severity severity{Severity::Warning};
    double threshold{0.0};
    double current_value{0.0};
    std::string message;
    util::TimePoint timestamp{};
    bool acknowledged{false};
};

struct Thresholds {
    double warning{0.0};
    double critical{0.0};
};

/** @struct ThresholdConfig
 *  @brief Static warning/critical pairs, shared process-wide.
 *  @note Only cpu, memory and the limit-relative process check are evaluated.
 */
struct ThresholdConfig {
    Thresholds cpu{config::constants::CPU_WARNING_PCT, config::constants::CPU_CRITICAL_PCT};
    Thresholds memory{config::constants::MEMORY_WARNING_PCT, config::constants::MEMORY_CRITICAL_PCT};
    Thresholds network{config::constants::NETWORK_WARNING_BPS, config::constants::NETWORK_CRITICAL_BPS};
    Thresholds disk{config::constants::DISK_WARNING_BPS, config::constants::DISK_CRITICAL_BPS};
    Thresholds processes{config::constants::PROCESSES_WARNING, config::constants::PROCESSES_CRITICAL};
    double process_limit_ratio{config::constants::PROCESS_LIMIT_WARN_RATIO};
};

} // namespace harbor::monitor
