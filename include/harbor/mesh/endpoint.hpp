/**
 * @file endpoint.hpp
 * @brief Service endpoint model shared across registry, balancer and health checker.
 *
 * Defines the health state and the `ServiceEndpoint` descriptor. Centralizing this
 * type keeps comparisons consistent across modules.
 */
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "harbor/config/constants.hpp"

namespace harbor::mesh {

/**
 * @brief Health state reported for an endpoint.
 *
 * @note Semantics:
 *  - Unknown:   Registered but not yet probed. Ineligible for selection.
 *  - Healthy:   Eligible for selection.
 *  - Unhealthy: Ineligible for selection.
 */
enum class Health : std::uint8_t {
  Unknown = 0,
  Healthy = 1,
  Unhealthy = 2
};

/// Transport spoken by the endpoint.
enum class Protocol : std::uint8_t {
  Http = 0,
  Https,
  Tcp,
  Udp
};

/**
 * @brief One network-addressable instance backing a named service.
 *
 * Equality is defaulted so registry snapshots compare element-wise.
 *
 * @note Uniqueness of `id` is per `service_name` and enforced by the registry.
 */
struct ServiceEndpoint final {
  /// Endpoint identifier, unique within its service (e.g. container id).
  std::string id;

  /// Owning service name.
  std::string service_name;

  /// Host name or IP literal.
  std::string host;

  /// TCP/UDP port.
  std::uint16_t port{0};

  Protocol protocol{Protocol::Http};

  /// Mutated only by the health checker after registration.
  Health health{Health::Unknown};

  /// Relative selection weight for the weighted strategy. 0 = never selected.
  std::uint32_t weight{config::constants::ENDPOINT_DEFAULT_WEIGHT};

  /// Free-form labels.
  std::map<std::string, std::string> metadata;
  std::vector<std::string> tags;

  /// "host:port"
  [[nodiscard]] std::string address() const;

  bool operator==(const ServiceEndpoint&) const = default;
};

/**
 * @brief Convenience alias for a service's endpoint list (registration order).
 */
using EndpointList = std::vector<ServiceEndpoint>;

std::string_view to_string(Health h) noexcept;
std::string_view to_string(Protocol p) noexcept;

} // namespace harbor::mesh
