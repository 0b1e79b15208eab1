#pragma once
/**
 * @file alert_evaluator.hpp
 * @brief Static threshold checks on each sample, and the cooldown-deduplicated alert store.
 *
 * Evaluation (strict '>' comparisons, critical checked before warning):
 *  - cpu.usage          vs thresholds.cpu
 *  - memory.percentage  vs thresholds.memory
 *  - processes.running  > ratio * limit.processes.max  → warning (only with a declared max)
 *
 * Dedup: a candidate is dropped when the same container already has an unacknowledged
 * alert of the same type and severity created less than `cooldown` ago.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "harbor/monitor/resource_types.hpp"
#include "harbor/util/clock.hpp"

namespace harbor::monitor {

/// A threshold crossing before dedup and id assignment.
struct AlertCandidate {
    MetricType type{MetricType::Cpu};
    Severity severity{Severity::Warning};
    double threshold{0.0};
    double current_value{0.0};
    std::string message;
};

/// Threshold crossings of one sample, in evaluation order (cpu, memory, processes).
std::vector<AlertCandidate> evaluate_thresholds(const ResourceMetrics& sample,
                                                const ThresholdConfig& thresholds,
                                                const std::optional<ResourceLimit>& limit);

/** @class AlertStore
 *  @brief Alerts per container, guarded by one mutex held for each operation.
 */
class AlertStore {
public:
    explicit AlertStore(std::chrono::milliseconds cooldown) noexcept : cooldown_(cooldown) {}

    /**
     * @brief Store a new alert unless a matching one is still cooling down.
     * @return The created alert, or nullopt when suppressed.
     */
    std::optional<ResourceAlert> raise(std::string_view container_id,
                                       const AlertCandidate& candidate,
                                       util::TimePoint now);

    /// Mark acknowledged (kept until aged out). Returns the updated alert.
    std::optional<ResourceAlert> acknowledge(std::string_view alert_id);

    /// Every alert of one container, oldest first, acknowledged included.
    [[nodiscard]] std::vector<ResourceAlert> for_container(std::string_view container_id) const;

    /// Unacknowledged alerts across containers, newest first.
    [[nodiscard]] std::vector<ResourceAlert> unacknowledged() const;

    /// Delete alerts with timestamp < cutoff. Returns how many were deleted.
    std::size_t sweep(util::TimePoint cutoff);

    [[nodiscard]] std::size_t size() const;

private:
    std::chrono::milliseconds cooldown_;
    mutable std::mutex mu_;
    std::map<std::string, std::vector<ResourceAlert>, std::less<>> alerts_;
};

} // namespace harbor::monitor
