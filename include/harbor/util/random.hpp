#pragma once
/**
 * @file random.hpp
 * @brief Seeded, lock-free uniform generator for endpoint selection and fault trials.
 * @details splitmix64 over an atomic counter: every draw is one fetch_add, so concurrent
 *          routing calls never share a torn state. Seeds come from config for reproducibility.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace harbor::util {

class Random final {
public:
    explicit Random(uint64_t seed) noexcept : state_(seed) {}

    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    /// Next raw 64-bit value.
    uint64_t next() noexcept;

    /// Uniform double in [0, 1).
    double uniform() noexcept;

    /// Uniform double in [0, upper).
    double uniform(double upper) noexcept { return uniform() * upper; }

    /// Uniform index in [0, n); returns 0 when n == 0.
    std::size_t index(std::size_t n) noexcept;

    /// Bernoulli trial with probability percentage/100 (clamped to [0,100]).
    bool chance_percent(double percentage) noexcept;

private:
    /// 64-bit avalanche finalizer (splitmix64).
    static uint64_t mix(uint64_t x) noexcept;

    std::atomic<uint64_t> state_;
};

} // namespace harbor::util
