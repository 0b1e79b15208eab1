/**
* @file expected.hpp
 * @brief Compatibility alias for std::expected (C++23) and tl::expected.
 *
 * Fallible setup-time operations (config loading, stats parsing, runtime
 * calls) return harbor_detail::expected so the rest of the codebase does not
 * depend on a specific implementation.
 *
 * - Standard library with a complete <expected>: std::expected.
 * - Otherwise: <tl/expected.hpp>, the header-only backport by TartanLlama
 *   (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace harbor_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace harbor_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
