#pragma once
// Harbor: ServiceRegistry
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Readers take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Writers serialize on a mutex, copy the whole map, mutate, and swap with RELEASE.
//   • Readers never block writers and never observe a partially-updated endpoint.
//   • Reclamation is handled by shared_ptr refcounts.
// Runtime policy: no exceptions on the mutation path, bounded memory (capacity limits).


#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "harbor/mesh/endpoint.hpp"

namespace harbor::mesh {

// -----------------------------------------------------------------------------
// Error codes returned by registry operations.
// -----------------------------------------------------------------------------
/// Result codes for registry mutations.
enum class RegistryErr {
    Ok,         ///< Operation succeeded.
    NotFound,   ///< Service or endpoint not registered.
    Invalid,    ///< Input validation failed (IDs, names, host).
    Capacity    ///< Operation rejected due to configured capacity limits.
};

std::string_view to_string(RegistryErr e) noexcept;

// -----------------------------------------------------------------------------
// Hard limits for bounded memory usage.
// -----------------------------------------------------------------------------
/// Compile-time capacity and field limits.
struct Limits {
    static constexpr std::size_t MaxServices             = 1024; ///< Max number of services.
    static constexpr std::size_t MaxEndpointsPerService  = 256;  ///< Max endpoints per service.
    static constexpr std::size_t MaxIdLen                = 128;  ///< Max length for service / endpoint ids.
    static constexpr std::size_t MaxHostLen              = 253;  ///< Max length for host names.
};

// -----------------------------------------------------------------------------
// ServiceRegistry class
// -----------------------------------------------------------------------------
///
/// Maintains a mapping: service name → endpoints (registration order).
/// - Upsert keyed by (service name, endpoint id); a new name creates the service.
/// - Removing the last endpoint forgets the service name.
/// - Health is mutated through setHealth() only (health checker).
///
/// Thread-safety:
///   - Reads are lock-free snapshots.
///   - Writes are serialized on an internal mutex, may allocate.
///   - Readers may see slightly stale data, but always consistent.
//
class ServiceRegistry final {
public:
    // --------------------------- Keying model --------------------------------
    // Transparent hash/equal functors enable heterogeneous lookup with string_view.
    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    using Map = std::unordered_map<std::string, EndpointList, SKeyHash, SKeyEq>;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Return a consistent snapshot of the entire registry map.
    std::shared_ptr<const Map> snapshot() const noexcept;

    /// Return a COPY of the endpoints for a service (empty if unknown).
    [[nodiscard]] EndpointList endpoints(std::string_view service_name) const;

    /// Lookup a single endpoint.
    [[nodiscard]] std::optional<ServiceEndpoint> find(std::string_view service_name,
                                                      std::string_view endpoint_id) const;

    // --------------------------- Read utilities ------------------------------
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t endpointCount() const noexcept;
    [[nodiscard]] std::vector<std::string> listServices() const;

    /// Monotonic version counter. Increments on every successful mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Insert or replace an endpoint by id within `endpoint.service_name`.
    RegistryErr upsertEndpoint(const ServiceEndpoint& endpoint);

    /// Remove an endpoint. Returns the removed endpoint, or nullopt if absent.
    std::optional<ServiceEndpoint> removeEndpoint(std::string_view service_name,
                                                  std::string_view endpoint_id);

    /// Set an endpoint's health. Returns the previous health, or nullopt if absent.
    /// Publishes a new snapshot only when the value changes.
    std::optional<Health> setHealth(std::string_view service_name,
                                    std::string_view endpoint_id,
                                    Health health);

private:
    // Current snapshot of registry map (shared_ptr for RCU semantics).
    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};
    std::mutex write_mu_;

    // Validation helpers
    static bool validateId(std::string_view id, std::size_t maxLen) noexcept;
    static bool validateEndpoint(const ServiceEndpoint& ep) noexcept;

    /// Publish a new map (caller holds write_mu_).
    void publish(std::shared_ptr<Map> next) noexcept;
};

} // namespace harbor::mesh
