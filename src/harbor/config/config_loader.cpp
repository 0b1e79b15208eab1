/**
 * @file config_loader.cpp
 * @brief nlohmann::json backed loader; defaults come from constants.hpp.
 */
#include "harbor/config/config_loader.hpp"

#include <array>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace harbor::config {

using Json = nlohmann::json;

namespace {

constexpr std::array<std::string_view, 8> kLogLevels{
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};

/// Collects the first error; later reads become no-ops.
struct Ctx {
    std::optional<ConfigError> error;

    void fail(std::string key, std::string message) {
        if (!error) error = ConfigError{std::move(key), std::move(message)};
    }
    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

std::string join(std::string_view prefix, std::string_view key) {
    if (prefix.empty()) return std::string(key);
    std::string out(prefix);
    out.push_back('.');
    out.append(key);
    return out;
}

/// Optional sub-object. nullptr when absent or not an object (the latter is an error).
const Json* section(Ctx& ctx, const Json* parent, const char* key, std::string_view prefix) {
    if (!ctx.ok() || parent == nullptr) return nullptr;
    auto it = parent->find(key);
    if (it == parent->end()) return nullptr;
    if (!it->is_object()) {
        ctx.fail(join(prefix, key), "must be an object");
        return nullptr;
    }
    return &*it;
}

const Json* leaf(Ctx& ctx, const Json* obj, const char* key) {
    if (!ctx.ok() || obj == nullptr) return nullptr;
    auto it = obj->find(key);
    return it == obj->end() ? nullptr : &*it;
}

/// Non-negative integer; floats and strings are rejected.
std::optional<uint64_t> unsigned_value(Ctx& ctx, const Json& v, const std::string& key) {
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer()) {
        ctx.fail(key, "must be non-negative");
        return std::nullopt;
    }
    ctx.fail(key, "must be an integer");
    return std::nullopt;
}

void read_ms(Ctx& ctx, const Json* obj, const char* key, std::string_view prefix,
             std::chrono::milliseconds& out, bool allow_zero = false) {
    const Json* v = leaf(ctx, obj, key);
    if (v == nullptr) return;
    const auto path = join(prefix, key);
    auto raw = unsigned_value(ctx, *v, path);
    if (!raw) return;
    if (*raw == 0 && !allow_zero) {
        ctx.fail(path, "must be greater than 0");
        return;
    }
    if (*raw > static_cast<uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
        ctx.fail(path, "out of range");
        return;
    }
    out = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(*raw)};
}

template <typename T>
void read_count(Ctx& ctx, const Json* obj, const char* key, std::string_view prefix,
                T& out, bool allow_zero = false) {
    const Json* v = leaf(ctx, obj, key);
    if (v == nullptr) return;
    const auto path = join(prefix, key);
    auto raw = unsigned_value(ctx, *v, path);
    if (!raw) return;
    if (*raw == 0 && !allow_zero) {
        ctx.fail(path, "must be greater than 0");
        return;
    }
    if (*raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        ctx.fail(path, "out of range");
        return;
    }
    out = static_cast<T>(*raw);
}

void read_double(Ctx& ctx, const Json* obj, const char* key, std::string_view prefix, double& out) {
    const Json* v = leaf(ctx, obj, key);
    if (v == nullptr) return;
    if (!v->is_number()) {
        ctx.fail(join(prefix, key), "must be a number");
        return;
    }
    out = v->get<double>();
}

void read_bool(Ctx& ctx, const Json* obj, const char* key, std::string_view prefix, bool& out) {
    const Json* v = leaf(ctx, obj, key);
    if (v == nullptr) return;
    if (!v->is_boolean()) {
        ctx.fail(join(prefix, key), "must be a boolean");
        return;
    }
    out = v->get<bool>();
}

void read_string(Ctx& ctx, const Json* obj, const char* key, std::string_view prefix, std::string& out) {
    const Json* v = leaf(ctx, obj, key);
    if (v == nullptr) return;
    if (!v->is_string()) {
        ctx.fail(join(prefix, key), "must be a string");
        return;
    }
    out = v->get<std::string>();
}

//------------------------------- Sections -------------------------------------

void parse_mesh(Ctx& ctx, const Json& root, mesh::MeshConfig& m) {
    const Json* s = section(ctx, &root, "mesh", "");
    read_ms(ctx, s, "health_check_interval_ms", "mesh", m.health_check_interval);
    read_ms(ctx, s, "metrics_interval_ms", "mesh", m.metrics_interval);
    read_ms(ctx, s, "default_timeout_ms", "mesh", m.default_timeout);
    read_count(ctx, s, "default_retries", "mesh", m.default_retries, /*allow_zero=*/true);
    read_count(ctx, s, "seed", "mesh", m.seed, /*allow_zero=*/true);

    const Json* cb = section(ctx, s, "circuit_breaker", "mesh");
    read_bool(ctx, cb, "enabled", "mesh.circuit_breaker", m.breaker.enabled);
    read_count(ctx, cb, "failure_threshold", "mesh.circuit_breaker", m.breaker.threshold);
    read_ms(ctx, cb, "open_duration_ms", "mesh.circuit_breaker", m.breaker.open_duration);
    read_count(ctx, cb, "half_open_quota", "mesh.circuit_breaker", m.breaker.half_open_quota);
}

void parse_monitor(Ctx& ctx, const Json& root, monitor::MonitorConfig& m) {
    const Json* s = section(ctx, &root, "monitor", "");
    read_ms(ctx, s, "collection_interval_ms", "monitor", m.collection_interval);
    read_count(ctx, s, "history_capacity", "monitor", m.history_capacity);
    read_ms(ctx, s, "metrics_retention_ms", "monitor", m.metrics_retention);
    read_ms(ctx, s, "alert_cooldown_ms", "monitor", m.alert_cooldown, /*allow_zero=*/true);
    read_ms(ctx, s, "sweep_interval_ms", "monitor", m.sweep_interval);
    read_ms(ctx, s, "trends_window_ms", "monitor", m.trends_window);
    read_count(ctx, s, "forecast_min_samples", "monitor", m.forecast_min_samples);
    read_count(ctx, s, "forecast_window", "monitor", m.forecast_window);
    if (ctx.ok() && m.forecast_window < 2) {
        ctx.fail("monitor.forecast_window", "must be at least 2");
    }
}

void parse_pair(Ctx& ctx, const Json* parent, const char* key, monitor::Thresholds& t) {
    const Json* s = section(ctx, parent, key, "thresholds");
    if (s == nullptr) return;
    const auto prefix = join("thresholds", key);
    read_double(ctx, s, "warning", prefix, t.warning);
    read_double(ctx, s, "critical", prefix, t.critical);
    if (!ctx.ok()) return;
    if (t.warning <= 0.0) {
        ctx.fail(join(prefix, "warning"), "must be greater than 0");
    } else if (t.warning >= t.critical) {
        ctx.fail(prefix, "warning must be below critical");
    }
}

void parse_thresholds(Ctx& ctx, const Json& root, monitor::ThresholdConfig& t) {
    const Json* s = section(ctx, &root, "thresholds", "");
    parse_pair(ctx, s, "cpu", t.cpu);
    parse_pair(ctx, s, "memory", t.memory);
    parse_pair(ctx, s, "network", t.network);
    parse_pair(ctx, s, "disk", t.disk);
    parse_pair(ctx, s, "processes", t.processes);
    read_double(ctx, s, "process_limit_ratio", "thresholds", t.process_limit_ratio);
    if (ctx.ok() && (t.process_limit_ratio <= 0.0 || t.process_limit_ratio > 1.0)) {
        ctx.fail("thresholds.process_limit_ratio", "must be in (0, 1]");
    }
}

} // namespace

ControlPlaneConfig Loader::defaults() {
    return ControlPlaneConfig{};
}

LoadResult Loader::load_from_string(std::string_view text) {
    const Json root = Json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded()) {
        return harbor_detail::unexpected<ConfigError>(ConfigError{"", "invalid JSON"});
    }
    if (!root.is_object()) {
        return harbor_detail::unexpected<ConfigError>(ConfigError{"", "top level must be an object"});
    }

    ControlPlaneConfig cfg = defaults();
    Ctx ctx;
    read_string(ctx, &root, "log_level", "", cfg.log_level);
    if (ctx.ok() &&
        std::find(kLogLevels.begin(), kLogLevels.end(), cfg.log_level) == kLogLevels.end()) {
        ctx.fail("log_level", "unknown level '" + cfg.log_level + "'");
    }
    parse_mesh(ctx, root, cfg.mesh);
    parse_monitor(ctx, root, cfg.monitor);
    parse_thresholds(ctx, root, cfg.monitor.thresholds);

    if (ctx.error) {
        return harbor_detail::unexpected<ConfigError>(std::move(*ctx.error));
    }
    return cfg;
}

LoadResult Loader::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return harbor_detail::unexpected<ConfigError>(ConfigError{"", "cannot open " + path});
    }
    std::ostringstream buf;
    buf << in.rdbuf();

    auto cfg = load_from_string(buf.str());
    if (!cfg) {
        spdlog::error("[ConfigLoader] {}: {}{}{}", path, cfg.error().key,
                      cfg.error().key.empty() ? "" : ": ", cfg.error().message);
        return cfg;
    }
    spdlog::info("[ConfigLoader] loaded {} (log level: {})", path, cfg->log_level);
    return cfg;
}

} // namespace harbor::config
