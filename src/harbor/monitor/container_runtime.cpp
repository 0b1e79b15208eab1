/**
 * @file container_runtime.cpp
 */
#include "harbor/monitor/container_runtime.hpp"

#include <cmath>

#include "harbor/config/constants.hpp"

namespace harbor::monitor {

using namespace harbor::config::constants;

RuntimeLimitUpdate to_runtime_update(const ResourceLimit& limit) noexcept {
    RuntimeLimitUpdate u;
    u.memory             = limit.memory.limit;
    u.memory_swap        = limit.memory.swap;
    u.memory_reservation = limit.memory.reservation;
    u.cpu_quota          = static_cast<int64_t>(std::floor(limit.cpu.percentage * RUNTIME_CPU_QUOTA_PER_PERCENT));
    u.cpu_period         = RUNTIME_CPU_PERIOD_US;
    u.pids_limit         = limit.processes.max;
    u.blkio_read_bps     = limit.disk.read_rate;
    u.blkio_write_bps    = limit.disk.write_rate;
    return u;
}

} // namespace harbor::monitor
