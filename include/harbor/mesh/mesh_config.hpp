#pragma once
/**
 * @file mesh_config.hpp
 * @brief Tunables for the service mesh. Defaults come from constants.hpp.
 */

#include <chrono>
#include <cstdint>

#include "harbor/config/constants.hpp"
#include "harbor/mesh/route.hpp"

namespace harbor::mesh {

struct MeshConfig {
    std::chrono::milliseconds health_check_interval{config::constants::MESH_HEALTH_CHECK_INTERVAL_MS};
    std::chrono::milliseconds metrics_interval{config::constants::MESH_METRICS_INTERVAL_MS};
    std::chrono::milliseconds default_timeout{config::constants::ROUTE_DEFAULT_TIMEOUT_MS};
    uint32_t default_retries{config::constants::ROUTE_DEFAULT_RETRIES};
    CircuitBreakerParams breaker{};   ///< Used when a result is recorded before any routing
    uint64_t seed{config::constants::MESH_RNG_SEED_DEFAULT};
};

} // namespace harbor::mesh
