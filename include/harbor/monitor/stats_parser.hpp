#pragma once
/**
 * @file stats_parser.hpp
 * @brief Runtime statistics snapshot (JSON) → normalized ResourceMetrics sample.
 *
 * Input contract (all fields optional, missing counts as 0):
 *   cpu_stats.cpu_usage.{total_usage,usage_in_kernelmode,usage_in_usermode}
 *   cpu_stats.system_cpu_usage, cpu_stats.throttling_data.throttled_time
 *   precpu_stats.* (same shape, previous sample)
 *   memory_stats.{usage,limit}, memory_stats.stats.{cache,rss,swap}
 *   networks.<iface>.{rx_bytes,tx_bytes,rx_packets,tx_packets,rx_errors,tx_errors}
 *   blkio_stats.{io_service_bytes_recursive,io_serviced_recursive}[] {op,value}
 *   pids_stats.current
 *
 * A present field holding a non-numeric (or negative) value is an error.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "harbor/compat/expected.hpp"
#include "harbor/monitor/resource_types.hpp"
#include "harbor/util/clock.hpp"

namespace harbor::monitor {

enum class StatsErrorCode : uint8_t {
    NotAnObject,   ///< Root is not a JSON object
    InvalidField   ///< A present counter is not a non-negative number
};

struct StatsError {
    StatsErrorCode code{StatsErrorCode::InvalidField};
    std::string field;    ///< Dotted path of the offending field
    std::string message;
};

/**
 * @brief Derive one sample from a runtime snapshot.
 *
 * cpu.usage = clamp((Δtotal_usage / Δsystem_cpu_usage) * 100, 0, 100), Δ against
 * precpu_stats; 0 when Δsystem ≤ 0. Network and disk counters are cumulative sums.
 */
harbor_detail::expected<ResourceMetrics, StatsError>
parse_stats(const nlohmann::json& stats, std::string_view container_id, util::TimePoint timestamp);

} // namespace harbor::monitor
