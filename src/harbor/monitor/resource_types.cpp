/**
 * @file resource_types.cpp
 */
#include "harbor/monitor/resource_types.hpp"

namespace harbor::monitor {

std::string_view to_string(MetricType t) noexcept {
    switch (t) {
        case MetricType::Cpu:       return "cpu";
        case MetricType::Memory:    return "memory";
        case MetricType::Network:   return "network";
        case MetricType::Disk:      return "disk";
        case MetricType::Processes: return "processes";
    }
    return "cpu";
}

std::string_view to_string(Severity s) noexcept {
    return s == Severity::Critical ? "critical" : "warning";
}

} // namespace harbor::monitor
