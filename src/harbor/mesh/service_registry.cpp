// ServiceRegistry: RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: lock write_mu_, copy current map, mutate, atomic_store (RELEASE).
// The shared_ptr reference count provides the grace period: old snapshots remain
// alive until the last reader drops its ref.

#include "harbor/mesh/service_registry.hpp"

#include <algorithm>
#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <string_view>

namespace harbor::mesh {

std::string_view to_string(RegistryErr e) noexcept {
    switch (e) {
        case RegistryErr::Ok:       return "ok";
        case RegistryErr::NotFound: return "not_found";
        case RegistryErr::Invalid:  return "invalid";
        case RegistryErr::Capacity: return "capacity";
    }
    return "invalid";
}

//------------------------------- Validation -----------------------------------

bool ServiceRegistry::validateId(std::string_view id, std::size_t maxLen) noexcept {
    if (id.empty() || id.size() > maxLen) return false;
    // Allow [A-Za-z0-9_.:-] (container names, DNS-ish service names)
    for (char c : id) {
        const bool ok = (c == '_' || c == '-' || c == '.' || c == ':' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

bool ServiceRegistry::validateEndpoint(const ServiceEndpoint& ep) noexcept {
    if (!validateId(ep.id, Limits::MaxIdLen)) return false;
    if (!validateId(ep.service_name, Limits::MaxIdLen)) return false;
    if (ep.host.empty() || ep.host.size() > Limits::MaxHostLen) return false;
    return true;
}

//------------------------------- Public API -----------------------------------

std::shared_ptr<const ServiceRegistry::Map>
ServiceRegistry::snapshot() const noexcept {
    // RCU read: acquire ensures any reader observing the pointer also observes
    // the fully constructed map published with RELEASE in writer path.
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

EndpointList ServiceRegistry::endpoints(std::string_view service_name) const {
    auto snap = snapshot();
    if (!snap) return {};
    auto it = snap->find(service_name);
    if (it == snap->end()) return {};
    return it->second; // copy
}

std::optional<ServiceEndpoint> ServiceRegistry::find(std::string_view service_name,
                                                     std::string_view endpoint_id) const {
    auto snap = snapshot();
    if (!snap) return std::nullopt;
    auto it = snap->find(service_name);
    if (it == snap->end()) return std::nullopt;
    for (const auto& ep : it->second) {
        if (ep.id == endpoint_id) return ep;
    }
    return std::nullopt;
}

std::size_t ServiceRegistry::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

std::size_t ServiceRegistry::endpointCount() const noexcept {
    auto snap = snapshot();
    if (!snap) return 0;
    std::size_t n = 0;
    for (const auto& kv : *snap) n += kv.second.size();
    return n;
}

std::vector<std::string> ServiceRegistry::listServices() const {
    std::vector<std::string> out;
    auto snap = snapshot();
    if (!snap) return out;
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

//------------------------------- Mutations ------------------------------------

void ServiceRegistry::publish(std::shared_ptr<Map> next) noexcept {
    // RCU update: publish new snapshot. RELEASE pairs with reader ACQUIRE so that
    // all prior writes to *next (the new map) are visible to readers that load it.
    std::shared_ptr<const Map> cnext = std::move(next); // convert Map -> const Map
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

RegistryErr ServiceRegistry::upsertEndpoint(const ServiceEndpoint& endpoint) {
    if (!validateEndpoint(endpoint)) return RegistryErr::Invalid;

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    auto next = std::make_shared<Map>(*snap); // copy-on-write

    auto it = next->find(std::string_view{endpoint.service_name});
    if (it == next->end()) {
        if (next->size() >= Limits::MaxServices) return RegistryErr::Capacity;
        it = next->emplace(endpoint.service_name, EndpointList{}).first;
    }

    auto& list = it->second;
    auto existing = std::find_if(list.begin(), list.end(),
                                 [&](const ServiceEndpoint& e) { return e.id == endpoint.id; });
    if (existing != list.end()) {
        *existing = endpoint; // whole-object replacement
    } else {
        if (list.size() >= Limits::MaxEndpointsPerService) return RegistryErr::Capacity;
        list.push_back(endpoint);
    }

    publish(std::move(next));
    return RegistryErr::Ok;
}

std::optional<ServiceEndpoint> ServiceRegistry::removeEndpoint(std::string_view service_name,
                                                               std::string_view endpoint_id) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    auto sit = snap->find(service_name);
    if (sit == snap->end()) return std::nullopt;

    const auto& current = sit->second;
    auto pos = std::find_if(current.begin(), current.end(),
                            [&](const ServiceEndpoint& e) { return e.id == endpoint_id; });
    if (pos == current.end()) return std::nullopt;
    ServiceEndpoint removed = *pos;

    auto next = std::make_shared<Map>(*snap);
    auto nit = next->find(service_name);
    auto& list = nit->second;
    list.erase(list.begin() + (pos - current.begin()));
    if (list.empty()) next->erase(nit); // forget the service name

    publish(std::move(next));
    return removed;
}

std::optional<Health> ServiceRegistry::setHealth(std::string_view service_name,
                                                 std::string_view endpoint_id,
                                                 Health health) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    auto sit = snap->find(service_name);
    if (sit == snap->end()) return std::nullopt;

    const auto& current = sit->second;
    auto pos = std::find_if(current.begin(), current.end(),
                            [&](const ServiceEndpoint& e) { return e.id == endpoint_id; });
    if (pos == current.end()) return std::nullopt;

    const Health previous = pos->health;
    if (previous == health) return previous;

    auto next = std::make_shared<Map>(*snap);
    auto& list = next->find(service_name)->second;
    list[static_cast<std::size_t>(pos - current.begin())].health = health;

    publish(std::move(next));
    return previous;
}

} // namespace harbor::mesh
