/**
 * @file replay_runtime.cpp
 */
#include "harbor/monitor/replay_runtime.hpp"

#include <fstream>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace harbor::monitor {

using Json = nlohmann::json;

harbor_detail::expected<std::unique_ptr<ReplayRuntime>, std::string>
ReplayRuntime::from_json(const Json& doc) {
    if (!doc.is_object()) {
        return harbor_detail::unexpected<std::string>("replay document must be a JSON object");
    }
    auto containers = doc.find("containers");
    if (containers == doc.end() || !containers->is_object()) {
        return harbor_detail::unexpected<std::string>("replay document needs a 'containers' object");
    }

    auto rt = std::make_unique<ReplayRuntime>();
    for (const auto& [id, samples] : containers->items()) {
        if (!samples.is_array()) {
            return harbor_detail::unexpected<std::string>(
                fmt::format("containers.{} must be an array of snapshots", id));
        }
        auto& queue = rt->snapshots_[id];
        for (const auto& s : samples) queue.push_back(s);
    }
    return rt;
}

harbor_detail::expected<std::unique_ptr<ReplayRuntime>, std::string>
ReplayRuntime::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return harbor_detail::unexpected<std::string>(fmt::format("cannot open replay file {}", path));
    }
    auto doc = Json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return harbor_detail::unexpected<std::string>(fmt::format("replay file {} is not valid JSON", path));
    }
    return from_json(doc);
}

void ReplayRuntime::push(std::string_view container_id, Json snapshot) {
    std::lock_guard<std::mutex> lk(mu_);
    snapshots_[std::string(container_id)].push_back(std::move(snapshot));
}

void ReplayRuntime::reject_updates(std::string_view container_id) {
    std::lock_guard<std::mutex> lk(mu_);
    rejected_.emplace(container_id);
}

harbor_detail::expected<Json, std::string>
ReplayRuntime::fetch_stats(std::string_view container_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = snapshots_.find(container_id);
    if (it == snapshots_.end()) {
        return harbor_detail::unexpected<std::string>(fmt::format("no such container: {}", container_id));
    }
    if (it->second.empty()) {
        return harbor_detail::unexpected<std::string>(fmt::format("no more snapshots for {}", container_id));
    }
    Json next = std::move(it->second.front());
    it->second.pop_front();
    return next;
}

harbor_detail::expected<void, std::string>
ReplayRuntime::update_limits(std::string_view container_id, const RuntimeLimitUpdate& update) {
    std::lock_guard<std::mutex> lk(mu_);
    if (rejected_.find(container_id) != rejected_.end()) {
        return harbor_detail::unexpected<std::string>(fmt::format("update rejected for {}", container_id));
    }
    applied_.insert_or_assign(std::string(container_id), update);
    return {};
}

std::vector<std::string> ReplayRuntime::container_ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(snapshots_.size());
    for (const auto& kv : snapshots_) out.push_back(kv.first);
    return out;
}

std::size_t ReplayRuntime::remaining(std::string_view container_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = snapshots_.find(container_id);
    return it == snapshots_.end() ? 0 : it->second.size();
}

std::optional<RuntimeLimitUpdate> ReplayRuntime::applied(std::string_view container_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = applied_.find(container_id);
    if (it == applied_.end()) return std::nullopt;
    return it->second;
}

} // namespace harbor::monitor
