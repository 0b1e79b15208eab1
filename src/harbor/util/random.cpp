/**
 * @file random.cpp
 * @brief splitmix64-backed uniform draws.
 */
#include "harbor/util/random.hpp"

#include <algorithm>

namespace harbor::util {

uint64_t Random::mix(uint64_t x) noexcept {
    // Named constants (splitmix64 avalanching)
    constexpr uint64_t M1 = 0xbf58476d1ce4e5b9ULL;  // mix multiplier 1
    constexpr uint64_t M2 = 0x94d049bb133111ebULL;  // mix multiplier 2

    x ^= (x >> 30); x *= M1;
    x ^= (x >> 27); x *= M2;
    x ^= (x >> 31);
    return x;
}

uint64_t Random::next() noexcept {
    constexpr uint64_t PHI = 0x9e3779b97f4a7c15ULL;  // golden ratio increment
    const uint64_t s = state_.fetch_add(PHI, std::memory_order_relaxed) + PHI;
    return mix(s);
}

double Random::uniform() noexcept {
    // Top 53 bits -> [0,1) with full double precision.
    return static_cast<double>(next() >> 11) * 0x1.0p-53;
}

std::size_t Random::index(std::size_t n) noexcept {
    if (n == 0) return 0;
    return static_cast<std::size_t>(uniform() * static_cast<double>(n)) % n;
}

bool Random::chance_percent(double percentage) noexcept {
    const double p = std::clamp(percentage, 0.0, 100.0) / 100.0;
    return uniform() < p;
}

} // namespace harbor::util
