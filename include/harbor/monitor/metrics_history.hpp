/**
 * @file metrics_history.hpp
 * @brief Fixed-capacity, time-ordered ring of samples for one container.
 *
 * Design goals:
 *  - One allocation at setup via factory; push never allocates.
 *  - Oldest sample evicted on insert past capacity.
 *  - Index 0 is the oldest retained sample, size()-1 the newest.
 *  - Age-based retention drops from the front only (insertion order is time order).
 *
 * Not synchronized: the owner guards it (ResourceMonitor holds one mutex per store).
 *
 * @tparam T Sample type.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <vector>

#include "harbor/compat/expected.hpp"

namespace harbor::monitor {

enum class HistoryError : std::uint8_t {
  CapacityZero = 1,          ///< Capacity must not be zero
  ElementNotNothrowMovable   ///< T must be nothrow-movable
};

template <class T>
class MetricsHistory final {
public:
  using value_type = T;

  /**
   * @brief Factory: validates capacity and reserves storage once.
   * @return expected<MetricsHistory, HistoryError>
   */
  static harbor_detail::expected<MetricsHistory, HistoryError>
  with_capacity(std::size_t capacity) {
    if (capacity == 0) {
      return harbor_detail::unexpected<HistoryError>(HistoryError::CapacityZero);
    }
    if (!std::is_nothrow_move_constructible_v<T>) {
      return harbor_detail::unexpected<HistoryError>(HistoryError::ElementNotNothrowMovable);
    }
    MetricsHistory h;
    h.buf_.reserve(capacity);
    h.capacity_ = capacity;
    return h;
  }

  MetricsHistory(MetricsHistory&&) noexcept = default;
  MetricsHistory& operator=(MetricsHistory&&) noexcept = default;
  MetricsHistory(const MetricsHistory&) = default;
  MetricsHistory& operator=(const MetricsHistory&) = default;

  /**
   * @brief Append a sample, evicting the oldest when full.
   * @return true if a sample was evicted.
   */
  bool push(T v) {
    if (buf_.size() < capacity_) {
      buf_.push_back(std::move(v));
      return false;
    }
    buf_[head_] = std::move(v);
    head_ = (head_ + 1) % capacity_;
    return true;
  }

  /// Oldest-first access; `i < size()`.
  [[nodiscard]] const T& operator[](std::size_t i) const noexcept {
    return buf_[(head_ + i) % buf_.size()];
  }

  /// Newest sample; nullptr when empty.
  [[nodiscard]] const T* latest() const noexcept {
    return buf_.empty() ? nullptr : &(*this)[buf_.size() - 1];
  }

  /// Copy of up to `n` newest samples, oldest first.
  [[nodiscard]] std::vector<T> last(std::size_t n) const {
    const std::size_t count = n < buf_.size() ? n : buf_.size();
    std::vector<T> out;
    out.reserve(count);
    for (std::size_t i = buf_.size() - count; i < buf_.size(); ++i) out.push_back((*this)[i]);
    return out;
  }

  [[nodiscard]] std::vector<T> to_vector() const { return last(buf_.size()); }

  /**
   * @brief Drop samples from the oldest end while `pred(sample)` holds.
   * @return Number of samples dropped.
   */
  template <class Pred>
  std::size_t drop_front_while(Pred pred) {
    std::size_t n = 0;
    while (n < buf_.size() && pred((*this)[n])) ++n;
    if (n == 0) return 0;

    std::vector<T> kept;
    kept.reserve(capacity_);
    for (std::size_t i = n; i < buf_.size(); ++i) kept.push_back(std::move(buf_[(head_ + i) % buf_.size()]));
    buf_ = std::move(kept);
    head_ = 0;
    return n;
  }

  void clear() noexcept {
    buf_.clear();
    head_ = 0;
  }

  [[nodiscard]] std::size_t size() const noexcept { return buf_.size(); }
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] bool empty() const noexcept { return buf_.empty(); }

private:
  MetricsHistory() = default;

  std::vector<T> buf_;
  std::size_t head_{0};      ///< Index of the oldest sample once the ring is full
  std::size_t capacity_{0};
};

} // namespace harbor::monitor
