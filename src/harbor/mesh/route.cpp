/**
 * @file route.cpp
 * @brief Path/method matching and the ordered route table.
 */
#include "harbor/mesh/route.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace harbor::mesh {

std::string_view to_string(LbStrategy s) noexcept {
    switch (s) {
        case LbStrategy::RoundRobin:       return "round_robin";
        case LbStrategy::Weighted:         return "weighted";
        case LbStrategy::LeastConnections: return "least_connections";
        case LbStrategy::IpHash:           return "ip_hash";
    }
    return "weighted";
}

std::optional<LbStrategy> parse_strategy(std::string_view s) noexcept {
    if (s == "round_robin")       return LbStrategy::RoundRobin;
    if (s == "weighted")          return LbStrategy::Weighted;
    if (s == "least_connections") return LbStrategy::LeastConnections;
    if (s == "ip_hash")           return LbStrategy::IpHash;
    return std::nullopt;
}

bool path_matches(std::string_view pattern, std::string_view path) noexcept {
    if (pattern == path) return true;
    if (!pattern.empty() && pattern.back() == '*') {
        const auto prefix = pattern.substr(0, pattern.size() - 1);
        return path.substr(0, prefix.size()) == prefix;
    }
    return false;
}

bool method_matches(const ServiceRoute& route, std::string_view method) {
    std::string upper(method);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::any_of(route.methods.begin(), route.methods.end(),
                       [&](const std::string& m) { return m == upper || m == "*"; });
}

//------------------------------- RouteTable -----------------------------------

bool RouteTable::upsert(ServiceRoute route) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(routes_.begin(), routes_.end(),
                           [&](const ServiceRoute& r) { return r.id == route.id; });
    if (it != routes_.end()) {
        *it = std::move(route);
        return true;
    }
    routes_.push_back(std::move(route));
    return false;
}

std::optional<ServiceRoute> RouteTable::remove(std::string_view route_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(routes_.begin(), routes_.end(),
                           [&](const ServiceRoute& r) { return r.id == route_id; });
    if (it == routes_.end()) return std::nullopt;
    ServiceRoute removed = std::move(*it);
    routes_.erase(it);
    return removed;
}

std::optional<ServiceRoute> RouteTable::match(std::string_view service_name,
                                              std::string_view path,
                                              std::string_view method) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& r : routes_) {
        if (r.service_name != service_name) continue;
        if (method_matches(r, method) && path_matches(r.path, path)) return r;
    }
    return std::nullopt;
}

std::optional<ServiceRoute> RouteTable::get(std::string_view route_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& r : routes_) {
        if (r.id == route_id) return r;
    }
    return std::nullopt;
}

std::vector<ServiceRoute> RouteTable::all() const {
    std::lock_guard<std::mutex> lk(mu_);
    return routes_;
}

std::size_t RouteTable::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return routes_.size();
}

} // namespace harbor::mesh
