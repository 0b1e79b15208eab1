#include "harbor/mesh/endpoint.hpp"

namespace harbor::mesh {

std::string ServiceEndpoint::address() const {
    return host + ":" + std::to_string(port);
}

std::string_view to_string(Health h) noexcept {
    switch (h) {
        case Health::Unknown:   return "unknown";
        case Health::Healthy:   return "healthy";
        case Health::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

std::string_view to_string(Protocol p) noexcept {
    switch (p) {
        case Protocol::Http:  return "http";
        case Protocol::Https: return "https";
        case Protocol::Tcp:   return "tcp";
        case Protocol::Udp:   return "udp";
    }
    return "http";
}

} // namespace harbor::mesh
