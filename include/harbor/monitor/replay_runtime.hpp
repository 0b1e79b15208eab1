#pragma once
/**
 * @file replay_runtime.hpp
 * @brief ContainerRuntime that serves pre-recorded stats snapshots in order.
 * @details Input shape: {"containers": {"<id>": [<snapshot>, ...]}}. Each fetch
 *          consumes one snapshot; an exhausted or unknown container fails like a
 *          vanished one. Limit updates are recorded, optionally rejected per id.
 */

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "harbor/compat/expected.hpp"
#include "harbor/monitor/container_runtime.hpp"

namespace harbor::monitor {

class ReplayRuntime final : public ContainerRuntime {
public:
    ReplayRuntime() = default;

    /// Build from a parsed replay document.
    static harbor_detail::expected<std::unique_ptr<ReplayRuntime>, std::string>
    from_json(const nlohmann::json& doc);

    /// Read and parse a replay file.
    static harbor_detail::expected<std::unique_ptr<ReplayRuntime>, std::string>
    from_file(const std::string& path);

    /// Queue one more snapshot for `container_id`.
    void push(std::string_view container_id, nlohmann::json snapshot);

    /// Make update_limits() fail for `container_id`.
    void reject_updates(std::string_view container_id);

    harbor_detail::expected<nlohmann::json, std::string>
    fetch_stats(std::string_view container_id) override;

    harbor_detail::expected<void, std::string>
    update_limits(std::string_view container_id, const RuntimeLimitUpdate& update) override;

    [[nodiscard]] std::vector<std::string> container_ids() const;
    [[nodiscard]] std::size_t remaining(std::string_view container_id) const;
    [[nodiscard]] std::optional<RuntimeLimitUpdate> applied(std::string_view container_id) const;

private:
    mutable std::mutex mu_;
    std::map<std::string, std::deque<nlohmann::json>, std::less<>> snapshots_;
    std::map<std::string, RuntimeLimitUpdate, std::less<>> applied_;
    std::set<std::string, std::less<>> rejected_;
};

} // namespace harbor::monitor
