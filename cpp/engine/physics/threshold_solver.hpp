#pragma once
/*
================================================================================
Physics: Threshold Solver (SF = 1 crossings)
FILE: cpp/engine/physics/threshold_solver.hpp

Purpose:
  - Wind-to-failure: closed form V_fail = V_design * sqrt(SF_design), valid
    because stress scales with V^2 and nothing else depends on wind.
  - Critical residual wall %: bisection over [10, 100] % of DBH retained as
    sound wall. SF rises monotonically with residual wall, so SF > 1 narrows
    toward thinner walls and SF < 1 toward thicker ones.
  - Decay tolerance curve: the bisection repeated at sampled wind speeds.
  - Failure threshold table: the bisection at fixed key winds (25 ... 69 m/s)
    with the tighter ThresholdTableSettings budget, one row per wind that has
    a threshold in range.

Failure semantics:
  - Nothing here throws. An unreachable or undefined threshold is
    std::nullopt ("no threshold in range"), never a default number.
  - A non-finite SF mid-search is treated as the SF > 1 branch.
  - A bisection result is accepted only when |SF - 1| < sf_tolerance and it
    lies strictly inside the bracket.
================================================================================
*/

#include <optional>
#include <vector>

#include "engine/catalog/species_catalog.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/tree.hpp"

namespace arbor {

// Closed form from an existing design-wind result.
std::optional<double> wind_to_failure(const CalculationResult& reference, double design_wind_speed_m_s) noexcept;

// Evaluates the scenario at its design wind (k_defect included) then applies
// the closed form.
std::optional<double> wind_to_failure(const SpeciesProfile& species,
                                      const TreeGeometry& geometry,
                                      const LoadScenario& scenario,
                                      const EngineSettings& settings = EngineSettings::defaults()) noexcept;

// Same tree with its cavity replaced by one leaving residual_wall_pct of DBH
// as sound wall. 100 % (or more) gives a solid stem.
TreeGeometry with_residual_wall(const TreeGeometry& geometry, double residual_wall_pct) noexcept;

// Current residual wall as a fraction in [0, 1]; solid stem = 1. The cavity
// is capped at cavity_cap_ratio * DBH first.
double residual_wall_fraction(const TreeGeometry& geometry,
                              const LoadModelSettings& load = EngineSettings::defaults().load) noexcept;

// Wall thickness (cm) for a residual-wall percentage: DBH * pct/100 / 2.
double wall_thickness_cm(double dbh_cm, double residual_wall_pct) noexcept;

// Residual wall % at which SF ~ 1 for the scenario's wind speed. The
// geometry's own cavity is ignored.
std::optional<double> critical_residual_wall_pct(const SpeciesProfile& species,
                                                 const TreeGeometry& geometry,
                                                 const LoadScenario& scenario,
                                                 const EngineSettings& settings = EngineSettings::defaults()) noexcept;

struct FailureThresholdRow {
  double wind_speed_m_s = 0.0;
  double critical_residual_wall_pct = 0.0;
  double critical_wall_thickness_cm = 0.0;
  double decay_tolerance_pct = 0.0;  // 100 - critical %
  bool current_wall_below_critical = false;
};

// Rows in key-wind order; winds with no threshold in range are omitted.
// The current wall is the geometry's own (capped) cavity.
std::vector<FailureThresholdRow> failure_threshold_table(const SpeciesProfile& species,
                                                         const TreeGeometry& geometry,
                                                         const LoadScenario& scenario,
                                                         const EngineSettings& settings = EngineSettings::defaults());

// Critical residual wall % (y) vs wind speed (x). Wind samples run from
// decay_wind_min_m_s to clamp(decay_wind_max_ratio * V, lo, hi), extended to
// failure_margin * V_fail when that is larger. Winds with no threshold in
// range are omitted.
Curve decay_tolerance_curve(const SpeciesProfile& species,
                            const TreeGeometry& geometry,
                            const LoadScenario& scenario,
                            const EngineSettings& settings = EngineSettings::defaults());

}  // namespace arbor
