/**
 * @file alert_evaluator.cpp
 */
#include "harbor/monitor/alert_evaluator.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>

#include <spdlog/fmt/fmt.h>

namespace harbor::monitor {

namespace {

// Shared by every store so ids stay unique within the process.
std::atomic<uint64_t> g_alert_seq{1};

void check_percent(std::vector<AlertCandidate>& out, MetricType type, const char* label,
                   double value, const Thresholds& t) {
    if (value > t.critical) {
        out.push_back({type, Severity::Critical, t.critical, value,
                       fmt::format("Critical {} usage: {:.1f}%", label, value)});
    } else if (value > t.warning) {
        out.push_back({type, Severity::Warning, t.warning, value,
                       fmt::format("High {} usage: {:.1f}%", label, value)});
    }
}

} // namespace

std::vector<AlertCandidate> evaluate_thresholds(const ResourceMetrics& sample,
                                                const ThresholdConfig& thresholds,
                                                const std::optional<ResourceLimit>& limit) {
    std::vector<AlertCandidate> out;
    check_percent(out, MetricType::Cpu, "CPU", sample.cpu.usage, thresholds.cpu);
    check_percent(out, MetricType::Memory, "memory", sample.memory.percentage, thresholds.memory);

    if (limit && limit->processes.max > 0) {
        const auto max = static_cast<double>(limit->processes.max);
        const auto running = static_cast<double>(sample.processes.running);
        if (running > max * thresholds.process_limit_ratio) {
            out.push_back({MetricType::Processes, Severity::Warning, max, running,
                           fmt::format("High process count: {}", sample.processes.running)});
        }
    }
    return out;
}

//------------------------------- AlertStore -----------------------------------

std::optional<ResourceAlert> AlertStore::raise(std::string_view container_id,
                                               const AlertCandidate& candidate,
                                               util::TimePoint now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& list = alerts_[std::string(container_id)];

    const bool cooling = std::any_of(list.begin(), list.end(), [&](const ResourceAlert& a) {
        return !a.acknowledged && a.type == candidate.type && a.severity == candidate.severity &&
               now - a.timestamp < cooldown_;
    });
    if (cooling) return std::nullopt;

    ResourceAlert alert;
    alert.id = fmt::format("alert-{}-{}", container_id,
                           g_alert_seq.fetch_add(1, std::memory_order_relaxed));
    alert.container_id = std::string(container_id);
    alert.type = candidate.type;
    alert.severity = candidate.severity;
    alert.threshold = candidate.threshold;
    alert.current_value = candidate.current_value;
    alert.message = candidate.message;
    alert.timestamp = now;
    list.push_back(alert);
    return alert;
}

std::optional<ResourceAlert> AlertStore::acknowledge(std::string_view alert_id) {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& [container, list] : alerts_) {
        for (auto& a : list) {
            if (a.id == alert_id) {
                a.acknowledged = true;
                return a;
            }
        }
    }
    return std::nullopt;
}

std::vector<ResourceAlert> AlertStore::for_container(std::string_view container_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = alerts_.find(container_id);
    if (it == alerts_.end()) return {};
    return it->second;
}

std::vector<ResourceAlert> AlertStore::unacknowledged() const {
    std::vector<ResourceAlert> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [container, list] : alerts_) {
            for (const auto& a : list) {
                if (!a.acknowledged) out.push_back(a);
            }
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ResourceAlert& a, const ResourceAlert& b) {
        return a.timestamp > b.timestamp;
    });
    return out;
}

std::size_t AlertStore::sweep(util::TimePoint cutoff) {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t removed = 0;
    for (auto& [container, list] : alerts_) {
        const auto before = list.size();
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const ResourceAlert& a) { return a.timestamp < cutoff; }),
                   list.end());
        removed += before - list.size();
    }
    return removed;
}

std::size_t AlertStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t n = 0;
    for (const auto& kv : alerts_) n += kv.second.size();
    return n;
}

} // namespace harbor::monitor
