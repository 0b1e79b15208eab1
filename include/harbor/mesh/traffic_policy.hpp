#pragma once
/**
 * @file traffic_policy.hpp
 * @brief Ordered per-service rules for redirection, fault injection and mirroring.
 * @details First matching rule wins; later rules are not evaluated. Matching is strict
 *          equality over declared header/query pairs. Fault kinds draw independently.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "harbor/config/constants.hpp"
#include "harbor/mesh/route.hpp"
#include "harbor/util/random.hpp"

namespace harbor::mesh {

/** @struct RuleMatch
 *  @brief Declared key/value pairs; every one must be present and equal in the request.
 */
struct RuleMatch {
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query_params;

    bool operator==(const RuleMatch&) const = default;
};

/// Where matching traffic goes. A service other than the policy owner is a redirect.
struct RuleDestination {
    std::string service;
    std::string subset;
    std::optional<uint32_t> weight;

    bool operator==(const RuleDestination&) const = default;
};

struct DelayFault {
    double percentage{0.0};                ///< 0..100
    std::chrono::milliseconds fixed_delay{0};

    bool operator==(const DelayFault&) const = default;
};

struct AbortFault {
    double percentage{0.0};                ///< 0..100
    uint16_t http_status{config::constants::FAULT_DEFAULT_ABORT_STATUS};

    bool operator==(const AbortFault&) const = default;
};

struct FaultInjection {
    std::optional<DelayFault> delay;
    std::optional<AbortFault> abort;

    bool operator==(const FaultInjection&) const = default;
};

/// Advisory shadow target; executing the mirror is the caller's job.
struct MirrorTarget {
    std::string service;
    double percentage{100.0};

    bool operator==(const MirrorTarget&) const = default;
};

struct TrafficRule {
    RuleMatch match;
    RuleDestination destination;
    std::optional<FaultInjection> fault;
    std::optional<MirrorTarget> mirror;

    bool operator==(const TrafficRule&) const = default;
};

/** @struct TrafficPolicy
 *  @brief Rules owned by one service name, evaluated in order.
 */
struct TrafficPolicy {
    std::string service_name;
    std::vector<TrafficRule> rules;

    bool operator==(const TrafficPolicy&) const = default;
};

/** @struct PolicyDecision
 *  @brief Effect of the first matching rule on one request.
 */
struct PolicyDecision {
    bool matched{false};
    std::size_t rule_index{0};
    std::optional<std::string> redirect;                ///< Destination service override
    std::optional<uint16_t> abort_status;               ///< Simulated abort fired
    std::optional<std::chrono::milliseconds> delay;     ///< Delay fault fired
    std::optional<std::string> mirror;                  ///< Advisory mirror target
};

/** @class TrafficPolicyEngine
 *  @brief Holds policies per service and evaluates them against requests.
 */
class TrafficPolicyEngine {
public:
    explicit TrafficPolicyEngine(std::shared_ptr<util::Random> rng) noexcept;

    /// Insert or replace the policy for `policy.service_name`.
    void set_policy(TrafficPolicy policy);

    /// Remove a service's policy. Returns true if one existed.
    bool remove_policy(std::string_view service_name);

    [[nodiscard]] std::optional<TrafficPolicy> policy(std::string_view service_name) const;
    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Evaluate the policy owned by `service_name`, if any.
     * @return nullopt when the service has no policy; otherwise the decision
     *         (with matched=false when no rule applied).
     */
    std::optional<PolicyDecision> evaluate(std::string_view service_name,
                                           const RouteRequest& request) const;

    /// Evaluate a given policy: first matching rule only.
    PolicyDecision evaluate(const TrafficPolicy& policy, const RouteRequest& request) const;

    /// Strict-equality match of declared headers and query params.
    static bool matches(const RuleMatch& match, const RouteRequest& request);

private:
    std::shared_ptr<util::Random> rng_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, TrafficPolicy> policies_;
};

} // namespace harbor::mesh
