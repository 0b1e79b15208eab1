/**
 * @file traffic_policy.cpp
 * @brief Rule matching and independent fault trials.
 */
#include "harbor/mesh/traffic_policy.hpp"

#include <utility>

namespace harbor::mesh {

namespace {

bool contains_all(const std::map<std::string, std::string>& declared,
                  const std::map<std::string, std::string>& actual) {
    for (const auto& [key, value] : declared) {
        auto it = actual.find(key);
        if (it == actual.end() || it->second != value) return false;
    }
    return true;
}

} // namespace

TrafficPolicyEngine::TrafficPolicyEngine(std::shared_ptr<util::Random> rng) noexcept
    : rng_(std::move(rng)) {}

void TrafficPolicyEngine::set_policy(TrafficPolicy policy) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = policy.service_name;
    policies_.insert_or_assign(std::move(key), std::move(policy));
}

bool TrafficPolicyEngine::remove_policy(std::string_view service_name) {
    std::lock_guard<std::mutex> lk(mu_);
    return policies_.erase(std::string(service_name)) > 0;
}

std::optional<TrafficPolicy> TrafficPolicyEngine::policy(std::string_view service_name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = policies_.find(std::string(service_name));
    if (it == policies_.end()) return std::nullopt;
    return it->second;
}

std::size_t TrafficPolicyEngine::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return policies_.size();
}

bool TrafficPolicyEngine::matches(const RuleMatch& match, const RouteRequest& request) {
    return contains_all(match.headers, request.headers) &&
           contains_all(match.query_params, request.query);
}

std::optional<PolicyDecision> TrafficPolicyEngine::evaluate(std::string_view service_name,
                                                            const RouteRequest& request) const {
    auto p = policy(service_name); // copy out; evaluation runs without the lock
    if (!p) return std::nullopt;
    return evaluate(*p, request);
}

PolicyDecision TrafficPolicyEngine::evaluate(const TrafficPolicy& policy,
                                             const RouteRequest& request) const {
    PolicyDecision d;
    for (std::size_t i = 0; i < policy.rules.size(); ++i) {
        const auto& rule = policy.rules[i];
        if (!matches(rule.match, request)) continue;

        d.matched = true;
        d.rule_index = i;

        // One independent trial per configured fault kind.
        if (rule.fault) {
            if (rule.fault->delay && rng_->chance_percent(rule.fault->delay->percentage)) {
                d.delay = rule.fault->delay->fixed_delay;
            }
            if (rule.fault->abort && rng_->chance_percent(rule.fault->abort->percentage)) {
                d.abort_status = rule.fault->abort->http_status;
            }
        }

        if (!rule.destination.service.empty() &&
            rule.destination.service != policy.service_name) {
            d.redirect = rule.destination.service;
        }

        if (rule.mirror && !rule.mirror->service.empty()) {
            d.mirror = rule.mirror->service;
        }
        break; // first match wins
    }
    return d;
}

} // namespace harbor::mesh
