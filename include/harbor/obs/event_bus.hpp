#pragma once
/**
 * @file event_bus.hpp
 * @brief In-process notification bus for mesh and monitor events, plus per-kind counters.
 * @details Subscribers never get called under the bus lock: publish() copies the matching
 *          handlers first, so a handler may subscribe or unsubscribe re-entrantly.
 *          A throwing handler is logged and skipped; delivery continues.
 */

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "harbor/mesh/endpoint.hpp"
#include "harbor/mesh/route.hpp"
#include "harbor/mesh/traffic_policy.hpp"
#include "harbor/monitor/resource_types.hpp"
#include "harbor/util/clock.hpp"

namespace harbor::obs {

/**
 * @enum EventKind
 * @brief Notifications external consumers subscribe to. Names are a stable contract.
 */
enum class EventKind : uint8_t {
    ServiceRegistered,
    ServiceDeregistered,
    RouteCreated,
    RouteRemoved,
    TrafficPolicySet,
    HealthChanged,
    CircuitBreakerOpened,
    RequestRecorded,
    MetricsCollected,
    AlertCreated,
    AlertAcknowledged,
    LimitsUpdated
};

inline constexpr std::size_t kEventKindCount = 12;

/// Wire name, e.g. "circuitBreakerOpened".
std::string_view event_name(EventKind k) noexcept;

// ---------------------------------------------------------------------------
// Payloads
// ---------------------------------------------------------------------------

struct BreakerOpened {
    std::string endpoint_id;
};

struct RequestRecorded {
    std::string endpoint_id;
    bool success{false};
    double latency_ms{0.0};
};

/// Aggregate emitted by the mesh metrics tick under "metricsCollected".
struct MeshMetricsSummary {
    util::TimePoint timestamp{};
    uint64_t total_requests{0};
    std::size_t total_services{0};
    std::size_t total_endpoints{0};
};

struct LimitsUpdated {
    std::string container_id;
    monitor::ResourceLimit limits;
};

using Payload = std::variant<std::monostate,
                             mesh::ServiceEndpoint,
                             mesh::ServiceRoute,
                             mesh::TrafficPolicy,
                             BreakerOpened,
                             RequestRecorded,
                             MeshMetricsSummary,
                             monitor::ResourceMetrics,
                             monitor::ResourceAlert,
                             LimitsUpdated>;

/** @struct Event
 *  @brief One notification as delivered to subscribers.
 */
struct Event {
    EventKind kind{EventKind::MetricsCollected};
    util::TimePoint timestamp{};
    Payload payload{};

    [[nodiscard]] std::string_view name() const noexcept { return event_name(kind); }
};

// ---------------------------------------------------------------------------
// Bus
// ---------------------------------------------------------------------------

class EventBus final {
public:
    using Handler = std::function<void(const Event&)>;
    using Token = uint64_t;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Deliver events of `kind` to `handler`. Returns a token for unsubscribe().
    Token subscribe(EventKind kind, Handler handler);

    /// Deliver every event to `handler`.
    Token subscribe_all(Handler handler);

    /// Returns false when the token is unknown.
    bool unsubscribe(Token token);

    void publish(const Event& event);

    void publish(EventKind kind, util::TimePoint ts, Payload payload) {
        publish(Event{kind, ts, std::move(payload)});
    }

    /// Number of events of `kind` published so far.
    [[nodiscard]] uint64_t count(EventKind kind) const noexcept;

    [[nodiscard]] std::array<uint64_t, kEventKindCount> counters() const noexcept;

    [[nodiscard]] std::size_t subscriber_count() const;

private:
    struct Subscription {
        Token token;
        std::optional<EventKind> kind;  ///< nullopt = all kinds
        std::shared_ptr<Handler> handler;
    };

    Token add(std::optional<EventKind> kind, Handler handler);

    mutable std::mutex mu_;
    std::vector<Subscription> subs_;
    Token next_token_{1};
    std::array<std::atomic<uint64_t>, kEventKindCount> counters_{};
};

} // namespace harbor::obs
