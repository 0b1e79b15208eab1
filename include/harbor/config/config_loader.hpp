#pragma once
/**
 * @file config_loader.hpp
 * @brief JSON loader for the control plane configuration.
 * @details Every key is optional and falls back to the named default in
 *          constants.hpp. A present key of the wrong type, or a value that breaks
 *          an invariant, is reported as a ConfigError naming the dotted key.
 *
 * Layout:
 * @code
 * {
 *   "log_level": "info",
 *   "mesh": {
 *     "health_check_interval_ms": 30000, "metrics_interval_ms": 10000,
 *     "default_timeout_ms": 30000, "default_retries": 3, "seed": 42,
 *     "circuit_breaker": { "enabled": true, "failure_threshold": 5,
 *                          "open_duration_ms": 60000, "half_open_quota": 3 }
 *   },
 *   "monitor": {
 *     "collection_interval_ms": 5000, "history_capacity": 720,
 *     "metrics_retention_ms": 3600000, "alert_cooldown_ms": 300000,
 *     "sweep_interval_ms": 300000, "trends_window_ms": 3600000,
 *     "forecast_min_samples": 10, "forecast_window": 20
 *   },
 *   "thresholds": {
 *     "cpu": { "warning": 70, "critical": 90 }, "memory": { ... },
 *     "network": { ... }, "disk": { ... }, "processes": { ... },
 *     "process_limit_ratio": 0.9
 *   }
 * }
 * @endcode
 */

#include <string>
#include <string_view>

#include "harbor/compat/expected.hpp"
#include "harbor/mesh/mesh_config.hpp"
#include "harbor/monitor/monitor_config.hpp"

namespace harbor::config {

    /** @struct ControlPlaneConfig
     *  @brief Aggregate of sub-configs required by the control plane.
     */
    struct ControlPlaneConfig {
        mesh::MeshConfig       mesh;              ///< Health/metrics ticks, route defaults, breaker
        monitor::MonitorConfig monitor;           ///< Collection, retention, alerting, thresholds
        std::string            log_level{"info"}; ///< spdlog level name
    };

    /** @struct ConfigError
     *  @brief First offending key and what is wrong with it.
     */
    struct ConfigError {
        std::string key;      ///< Dotted path, empty for document-level errors
        std::string message;
    };

    using LoadResult = harbor_detail::expected<ControlPlaneConfig, ConfigError>;

    /** @class Loader
     *  @brief Source of control plane configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Configuration built purely from named constants.
        static ControlPlaneConfig defaults();

        /**
         * @brief Read and parse a JSON file.
         * @return Populated config, or the first error (unreadable file, bad JSON, bad key).
         */
        static LoadResult load_from_file(const std::string& path);

        /// Parse a JSON document already in memory.
        static LoadResult load_from_string(std::string_view text);
    };

} // namespace harbor::config
