#pragma once
/**
 * @file request_metrics.hpp
 * @brief Per-endpoint request counters with coarse running latency percentiles.
 * @details Counters only grow. p50 is an exponential blend toward each new latency;
 *          p95/p99 are running maxima. These are not exact percentiles.
 */

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace harbor::mesh {

struct LatencyStats {
    double p50{0.0};
    double p95{0.0};
    double p99{0.0};
};

struct RequestCounters {
    uint64_t total{0};
    uint64_t success{0};
    uint64_t error{0};
    LatencyStats latency{};
};

/// Not tracked by this core; reported as zero.
struct ConnectionCounters {
    uint64_t active{0};
    uint64_t total{0};
};

/// Not tracked by this core; reported as zero.
struct BreakerCounters {
    uint64_t open{0};
    uint64_t half_open{0};
};

/** @struct MetricsData
 *  @brief Aggregate for one endpoint.
 */
struct MetricsData {
    RequestCounters requests{};
    ConnectionCounters connections{};
    BreakerCounters circuit_breakers{};
};

/** @class RequestMetricsStore
 *  @brief Endpoint id → MetricsData, guarded by a mutex held for one update.
 */
class RequestMetricsStore {
public:
    void record(std::string_view endpoint_id, bool success, double latency_ms);

    [[nodiscard]] std::optional<MetricsData> get(std::string_view endpoint_id) const;

    /// Copy of the entries whose id appears in `endpoint_ids`.
    [[nodiscard]] std::map<std::string, MetricsData> select(const std::vector<std::string>& endpoint_ids) const;

    [[nodiscard]] std::map<std::string, MetricsData> snapshot() const;

    /// Sum of requests.total over all endpoints.
    [[nodiscard]] uint64_t total_requests() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, MetricsData> data_;
};

} // namespace harbor::mesh
