/**
 * @file stats_parser.cpp
 * @brief Field readers and delta/sum derivations for runtime stats snapshots.
 */
#include "harbor/monitor/stats_parser.hpp"

#include <algorithm>
#include <initializer_list>
#include <utility>

namespace harbor::monitor {

using Json = nlohmann::json;

namespace {

using U64 = harbor_detail::expected<uint64_t, StatsError>;

StatsError invalid(std::string field, std::string message) {
    return StatsError{StatsErrorCode::InvalidField, std::move(field), std::move(message)};
}

std::string dotted(std::string_view prefix, std::initializer_list<const char*> path) {
    std::string out(prefix);
    for (const char* p : path) {
        if (!out.empty()) out.push_back('.');
        out.append(p);
    }
    return out;
}

/// Numeric leaf → u64. null counts as 0.
U64 to_u64(const Json& v, const std::string& field) {
    if (v.is_null()) return uint64_t{0};
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer()) {
        const auto value = v.get<int64_t>();
        if (value < 0) return harbor_detail::unexpected<StatsError>(invalid(field, "must be non-negative"));
        return static_cast<uint64_t>(value);
    }
    if (v.is_number_float()) {
        const auto value = v.get<double>();
        if (value < 0.0) return harbor_detail::unexpected<StatsError>(invalid(field, "must be non-negative"));
        // 2^64; NaN fails the comparison too
        if (!(value < 18446744073709551616.0)) {
            return harbor_detail::unexpected<StatsError>(invalid(field, "out of range"));
        }
        return static_cast<uint64_t>(value);
    }
    return harbor_detail::unexpected<StatsError>(invalid(field, "must be a number"));
}

/// Walk `path` from `root`; a missing key or non-object hop yields 0.
/// `prefix` only names the field in errors.
U64 read_u64(const Json& root, std::initializer_list<const char*> path, std::string_view prefix = {}) {
    const Json* node = &root;
    for (const char* key : path) {
        if (!node->is_object()) return uint64_t{0};
        auto it = node->find(key);
        if (it == node->end()) return uint64_t{0};
        node = &*it;
    }
    return to_u64(*node, dotted(prefix, path));
}

/// Sum {op,value} entries by "Read"/"Write" tag.
harbor_detail::expected<std::pair<uint64_t, uint64_t>, StatsError>
sum_blkio(const Json& stats, const char* list_key) {
    std::pair<uint64_t, uint64_t> rw{0, 0};
    auto blkio = stats.find("blkio_stats");
    if (blkio == stats.end() || !blkio->is_object()) return rw;
    auto list = blkio->find(list_key);
    if (list == blkio->end() || !list->is_array()) return rw;

    const std::string field = std::string("blkio_stats.") + list_key;
    for (const auto& entry : *list) {
        if (!entry.is_object()) continue;
        auto op = entry.find("op");
        if (op == entry.end() || !op->is_string()) continue;
        const auto& tag = op->get_ref<const std::string&>();
        if (tag != "Read" && tag != "Write") continue;

        auto raw = entry.find("value");
        if (raw == entry.end()) continue;
        auto value = to_u64(*raw, field + ".value");
        if (!value) return harbor_detail::unexpected<StatsError>(value.error());

        (tag == "Read" ? rw.first : rw.second) += *value;
    }
    return rw;
}

} // namespace

harbor_detail::expected<ResourceMetrics, StatsError>
parse_stats(const Json& stats, std::string_view container_id, util::TimePoint timestamp) {
    if (!stats.is_object()) {
        return harbor_detail::unexpected<StatsError>(
            StatsError{StatsErrorCode::NotAnObject, "", "stats snapshot must be a JSON object"});
    }

    ResourceMetrics m;
    m.container_id = std::string(container_id);
    m.timestamp = timestamp;

    // The first failing read is reported and the sample is discarded.
    StatsError error;
    bool failed = false;
    auto take = [&](U64 r) -> uint64_t {
        if (!r) {
            if (!failed) error = r.error();
            failed = true;
            return 0;
        }
        return *r;
    };

    // --- CPU ---
    const auto total     = take(read_u64(stats, {"cpu_stats", "cpu_usage", "total_usage"}));
    const auto pre_total = take(read_u64(stats, {"precpu_stats", "cpu_usage", "total_usage"}));
    const auto system    = take(read_u64(stats, {"cpu_stats", "system_cpu_usage"}));
    const auto pre_sys   = take(read_u64(stats, {"precpu_stats", "system_cpu_usage"}));

    const double cpu_delta = static_cast<double>(total) - static_cast<double>(pre_total);
    const double sys_delta = static_cast<double>(system) - static_cast<double>(pre_sys);
    const double usage = sys_delta > 0.0 ? (cpu_delta / sys_delta) * 100.0 : 0.0;
    m.cpu.usage     = std::clamp(usage, 0.0, 100.0);
    m.cpu.throttled = take(read_u64(stats, {"cpu_stats", "throttling_data", "throttled_time"}));
    m.cpu.system    = take(read_u64(stats, {"cpu_stats", "cpu_usage", "usage_in_kernelmode"}));
    m.cpu.user      = take(read_u64(stats, {"cpu_stats", "cpu_usage", "usage_in_usermode"}));

    // --- Memory ---
    m.memory.usage = take(read_u64(stats, {"memory_stats", "usage"}));
    m.memory.limit = take(read_u64(stats, {"memory_stats", "limit"}));
    m.memory.percentage = m.memory.limit > 0
        ? static_cast<double>(m.memory.usage) / static_cast<double>(m.memory.limit) * 100.0
        : 0.0;
    m.memory.cache = take(read_u64(stats, {"memory_stats", "stats", "cache"}));
    m.memory.rss   = take(read_u64(stats, {"memory_stats", "stats", "rss"}));
    m.memory.swap  = take(read_u64(stats, {"memory_stats", "stats", "swap"}));

    // --- Network: summed over interfaces ---
    if (auto nets = stats.find("networks"); nets != stats.end() && nets->is_object()) {
        for (const auto& [iface, counters] : nets->items()) {
            if (!counters.is_object()) continue;
            const std::string prefix = "networks." + iface;
            m.network.rx_bytes   += take(read_u64(counters, {"rx_bytes"}, prefix));
            m.network.tx_bytes   += take(read_u64(counters, {"tx_bytes"}, prefix));
            m.network.rx_packets += take(read_u64(counters, {"rx_packets"}, prefix));
            m.network.tx_packets += take(read_u64(counters, {"tx_packets"}, prefix));
            m.network.rx_errors  += take(read_u64(counters, {"rx_errors"}, prefix));
            m.network.tx_errors  += take(read_u64(counters, {"tx_errors"}, prefix));
        }
    }

    // --- Disk: Read/Write split ---
    if (auto bytes = sum_blkio(stats, "io_service_bytes_recursive")) {
        m.disk.read_bytes  = bytes->first;
        m.disk.write_bytes = bytes->second;
    } else if (!failed) {
        error = bytes.error();
        failed = true;
    }
    if (auto ops = sum_blkio(stats, "io_serviced_recursive")) {
        m.disk.read_ops  = ops->first;
        m.disk.write_ops = ops->second;
    } else if (!failed) {
        error = ops.error();
        failed = true;
    }

    // --- Processes: only the pid count is available ---
    m.processes.running = take(read_u64(stats, {"pids_stats", "current"}));

    if (failed) return harbor_detail::unexpected<StatsError>(std::move(error));
    return m;
}

} // namespace harbor::monitor
