#include "engine/analysis/ratings.hpp"

#include <cmath>

#include "engine/core/numeric.hpp"

namespace arbor {

SafetyFactorRating rate_safety_factor(double sf) noexcept {
  if (std::isnan(sf)) return SafetyFactorRating::Unacceptable;
  if (sf >= kAdequateSafetyFactor) return SafetyFactorRating::Adequate;
  if (sf >= 1.0) return SafetyFactorRating::Reduced;
  return SafetyFactorRating::Unacceptable;
}

WindMarginRating rate_wind_margin(double design_wind_speed_m_s,
                                  const std::optional<double>& wind_to_failure_m_s) noexcept {
  if (!is_finite(wind_to_failure_m_s)) return WindMarginRating::Unresolved;
  if (!(is_finite(design_wind_speed_m_s) && design_wind_speed_m_s > 0.0)) return WindMarginRating::Unresolved;

  const double ratio = *wind_to_failure_m_s / design_wind_speed_m_s;
  if (ratio >= kModerateWindMargin) return WindMarginRating::Moderate;
  if (ratio >= kNarrowWindMargin) return WindMarginRating::Narrow;
  return WindMarginRating::Little;
}

ResidualWallRating rate_residual_wall(double fraction) noexcept {
  if (fraction >= kTolerableResidualWall) return ResidualWallRating::Tolerable;
  if (fraction >= kMarginalResidualWall) return ResidualWallRating::Marginal;
  return ResidualWallRating::Unacceptable;
}

std::optional<double> mitigation_improvement_pct(double sf_before, double sf_after) noexcept {
  if (!is_finite(sf_before) || !is_finite(sf_after) || sf_before <= 0.0) return std::nullopt;
  return (sf_after - sf_before) / sf_before * 100.0;
}

const char* to_string(SafetyFactorRating r) noexcept {
  switch (r) {
    case SafetyFactorRating::Adequate:     return "Adequate structural margin";
    case SafetyFactorRating::Reduced:      return "Reduced structural margin";
    case SafetyFactorRating::Unacceptable: return "Unacceptable increase in failure likelihood";
  }
  return "Unacceptable increase in failure likelihood";
}

const char* to_string(WindMarginRating r) noexcept {
  switch (r) {
    case WindMarginRating::Moderate:   return "Moderate margin to failure";
    case WindMarginRating::Narrow:     return "Narrow margin to failure";
    case WindMarginRating::Little:     return "Little margin to failure";
    case WindMarginRating::Unresolved: return "Margin not resolved";
  }
  return "Margin not resolved";
}

const char* to_string(ResidualWallRating r) noexcept {
  switch (r) {
    case ResidualWallRating::Tolerable:    return "Tolerable structural condition";
    case ResidualWallRating::Marginal:     return "Marginal structural condition";
    case ResidualWallRating::Unacceptable: return "Unacceptable increase in risk";
  }
  return "Unacceptable increase in risk";
}

}  // namespace arbor
