/**
 * @file request_metrics.cpp
 */
#include "harbor/mesh/request_metrics.hpp"

#include <algorithm>

#include "harbor/config/constants.hpp"

namespace harbor::mesh {

void RequestMetricsStore::record(std::string_view endpoint_id, bool success, double latency_ms) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& m = data_[std::string(endpoint_id)];

    ++m.requests.total;
    if (success) {
        ++m.requests.success;
    } else {
        ++m.requests.error;
    }

    auto& lat = m.requests.latency;
    constexpr double blend = config::constants::LATENCY_P50_BLEND;
    lat.p50 = lat.p50 * (1.0 - blend) + latency_ms * blend;
    lat.p95 = std::max(lat.p95, latency_ms);
    lat.p99 = std::max(lat.p99, latency_ms);
}

std::optional<MetricsData> RequestMetricsStore::get(std::string_view endpoint_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = data_.find(std::string(endpoint_id));
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, MetricsData>
RequestMetricsStore::select(const std::vector<std::string>& endpoint_ids) const {
    std::map<std::string, MetricsData> out;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& id : endpoint_ids) {
        auto it = data_.find(id);
        if (it != data_.end()) out.emplace(id, it->second);
    }
    return out;
}

std::map<std::string, MetricsData> RequestMetricsStore::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return {data_.begin(), data_.end()};
}

uint64_t RequestMetricsStore::total_requests() const {
    std::lock_guard<std::mutex> lk(mu_);
    uint64_t sum = 0;
    for (const auto& kv : data_) sum += kv.second.requests.total;
    return sum;
}

} // namespace harbor::mesh
