#pragma once
/**
 * @file container_runtime.hpp
 * @brief Pluggable container runtime: stats snapshots in, limit updates out.
 * @details Implementations bound every call with their own timeout. Both calls may
 *          fail (container gone, runtime rejected the update); failures are values.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "harbor/compat/expected.hpp"
#include "harbor/monitor/resource_types.hpp"

namespace harbor::monitor {

/** @struct RuntimeLimitUpdate
 *  @brief A ResourceLimit in the runtime's own units.
 */
struct RuntimeLimitUpdate {
    uint64_t memory{0};               ///< Bytes
    uint64_t memory_swap{0};          ///< Bytes
    uint64_t memory_reservation{0};   ///< Bytes
    int64_t cpu_quota{0};             ///< µs per period
    int64_t cpu_period{0};            ///< µs
    uint64_t pids_limit{0};
    uint64_t blkio_read_bps{0};
    uint64_t blkio_write_bps{0};

    bool operator==(const RuntimeLimitUpdate&) const = default;
};

/// cpu_quota = floor(cpu.percentage * 1000), cpu_period = 100000; the rest copied through.
RuntimeLimitUpdate to_runtime_update(const ResourceLimit& limit) noexcept;

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /// One stats snapshot for `container_id` (see stats_parser.hpp for the shape).
    virtual harbor_detail::expected<nlohmann::json, std::string>
    fetch_stats(std::string_view container_id) = 0;

    /// Apply limits to a running container.
    virtual harbor_detail::expected<void, std::string>
    update_limits(std::string_view container_id, const RuntimeLimitUpdate& update) = 0;
};

} // namespace harbor::monitor
