#pragma once
/*
================================================================================
Analysis: Margin Ratings
FILE: cpp/engine/analysis/ratings.hpp

Purpose:
  - Map numeric results onto the rating bands used in assessment reports.
      * SafetyFactorRating:  SF >= 1.5 Adequate, >= 1.0 Reduced, else
                             Unacceptable. +inf rates Adequate.
      * WindMarginRating:    V_fail / V_design >= 1.5 Moderate, >= 1.1
                             Narrow, else Little. Absent V_fail -> Unresolved.
      * ResidualWallRating:  wall fraction >= 0.4 Tolerable, >= 0.3
                             Marginal, else Unacceptable.
  - Mitigation improvement: relative SF gain of a pruning scenario, in %.
================================================================================
*/

#include <cstdint>
#include <optional>

namespace arbor {

enum class SafetyFactorRating : std::uint8_t { Adequate = 0, Reduced = 1, Unacceptable = 2 };

enum class WindMarginRating : std::uint8_t { Moderate = 0, Narrow = 1, Little = 2, Unresolved = 3 };

enum class ResidualWallRating : std::uint8_t { Tolerable = 0, Marginal = 1, Unacceptable = 2 };

inline constexpr double kAdequateSafetyFactor = 1.5;
inline constexpr double kModerateWindMargin = 1.5;
inline constexpr double kNarrowWindMargin = 1.1;
inline constexpr double kTolerableResidualWall = 0.4;
inline constexpr double kMarginalResidualWall = 0.3;

SafetyFactorRating rate_safety_factor(double sf) noexcept;

WindMarginRating rate_wind_margin(double design_wind_speed_m_s,
                                  const std::optional<double>& wind_to_failure_m_s) noexcept;

// fraction in [0, 1]; NaN rates Unacceptable.
ResidualWallRating rate_residual_wall(double fraction) noexcept;

// (SF_after - SF_before) / SF_before * 100. Absent when either SF is
// non-finite or SF_before <= 0.
std::optional<double> mitigation_improvement_pct(double sf_before, double sf_after) noexcept;

// Report labels, e.g. "Adequate structural margin".
const char* to_string(SafetyFactorRating r) noexcept;
const char* to_string(WindMarginRating r) noexcept;
const char* to_string(ResidualWallRating r) noexcept;

}  // namespace arbor
