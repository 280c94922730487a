#pragma once
/*
===============================================================================
Core: Numeric helpers
FILE: cpp/engine/core/numeric.hpp

  - Finite checks that also accept optional field measurements.
  - clamp() usable in constexpr tables (std::clamp takes references).
  - lerp_step() produces the evenly spaced sample grids of every curve.
===============================================================================
*/

#include <cmath>
#include <limits>
#include <optional>
#include <type_traits>

namespace arbor {

// Safety factor of an unloaded stem.
inline constexpr double kInf = std::numeric_limits<double>::infinity();

inline bool is_finite(double x) noexcept { return std::isfinite(x); }

// Absent measurements are not finite.
inline bool is_finite(const std::optional<double>& x) noexcept {
  return x.has_value() && std::isfinite(*x);
}

template <typename T>
constexpr T clamp(T v, T lo, T hi) noexcept {
  static_assert(std::is_arithmetic_v<T>, "clamp: arithmetic types only");
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

inline double positive_or(double x, double fallback) noexcept {
  return (std::isfinite(x) && x > 0.0) ? x : fallback;
}

// Sample i of n evenly spaced points on [a, b]; n <= 1 gives a.
inline double lerp_step(double a, double b, int i, int n) noexcept {
  if (n <= 1) return a;
  const double t = static_cast<double>(i) / static_cast<double>(n - 1);
  return a + (b - a) * t;
}

}  // namespace arbor
