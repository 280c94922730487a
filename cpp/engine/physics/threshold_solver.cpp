#include "engine/physics/threshold_solver.hpp"

#include <cmath>

#include "engine/core/numeric.hpp"
#include "engine/physics/section_load.hpp"

namespace arbor {

std::optional<double> wind_to_failure(const CalculationResult& reference, double design_wind_speed_m_s) noexcept {
  const double sf = reference.safety_factor;
  if (!is_finite(sf) || sf <= 0.0) return std::nullopt;
  if (!is_finite(design_wind_speed_m_s) || design_wind_speed_m_s <= 0.0) return std::nullopt;
  return design_wind_speed_m_s * std::sqrt(sf);
}

std::optional<double> wind_to_failure(const SpeciesProfile& species,
                                      const TreeGeometry& geometry,
                                      const LoadScenario& scenario,
                                      const EngineSettings& settings) noexcept {
  if (!is_evaluable(species, geometry, scenario)) return std::nullopt;
  return wind_to_failure(evaluate(species, geometry, scenario, settings), scenario.design_wind_speed_m_s);
}

TreeGeometry with_residual_wall(const TreeGeometry& geometry, double residual_wall_pct) noexcept {
  TreeGeometry g = geometry;
  const double cavity_cm = geometry.dbh_cm * (1.0 - residual_wall_pct / 100.0);
  if (cavity_cm > 0.0) g.cavity_inner_diameter_cm = cavity_cm;
  else g.cavity_inner_diameter_cm.reset();
  return g;
}

double residual_wall_fraction(const TreeGeometry& geometry, const LoadModelSettings& load) noexcept {
  if (!(is_finite(geometry.dbh_cm) && geometry.dbh_cm > 0.0)) return 1.0;
  const double inner_cm = resolve_inner_diameter_m(geometry.dbh_cm, geometry.cavity_inner_diameter_cm, load) * 100.0;
  if (inner_cm <= 0.0) return 1.0;
  return clamp((geometry.dbh_cm - inner_cm) / geometry.dbh_cm, 0.0, 1.0);
}

double wall_thickness_cm(double dbh_cm, double residual_wall_pct) noexcept {
  return dbh_cm * (residual_wall_pct / 100.0) / 2.0;
}

namespace {

// Bisection over the solver's residual wall bracket with a caller-chosen budget.
std::optional<double> bisect_critical_wall(const SpeciesProfile& species,
                                           const TreeGeometry& geometry,
                                           const LoadScenario& scenario,
                                           const EngineSettings& settings,
                                           int max_iter,
                                           double sf_tolerance) noexcept {
  const SolverSettings& s = settings.solver;
  TreeGeometry solid = geometry;
  solid.cavity_inner_diameter_cm.reset();
  if (!is_evaluable(species, solid, scenario)) return std::nullopt;

  double lo = s.residual_wall_min_pct;
  double hi = s.residual_wall_max_pct;
  std::optional<double> found;

  for (int it = 0; it < max_iter; ++it) {
    const double mid = 0.5 * (lo + hi);
    const double sf = evaluate(species, with_residual_wall(solid, mid), scenario, settings).safety_factor;

    if (!is_finite(sf)) {
      hi = mid;
      continue;
    }
    if (std::fabs(sf - 1.0) < sf_tolerance) {
      found = mid;
      break;
    }
    if (sf > 1.0) hi = mid;
    else lo = mid;
  }

  if (found && *found > s.residual_wall_min_pct && *found < s.residual_wall_max_pct) return found;
  return std::nullopt;
}

}  // namespace

std::optional<double> critical_residual_wall_pct(const SpeciesProfile& species,
                                                 const TreeGeometry& geometry,
                                                 const LoadScenario& scenario,
                                                 const EngineSettings& settings) noexcept {
  return bisect_critical_wall(species, geometry, scenario, settings, settings.solver.bisection_max_iter,
                              settings.solver.sf_tolerance);
}

std::vector<FailureThresholdRow> failure_threshold_table(const SpeciesProfile& species,
                                                         const TreeGeometry& geometry,
                                                         const LoadScenario& scenario,
                                                         const EngineSettings& settings) {
  const ThresholdTableSettings& t = settings.thresholds;
  std::vector<FailureThresholdRow> rows;
  if (!is_evaluable(species, geometry, scenario)) return rows;

  const double current_pct = residual_wall_fraction(geometry, settings.load) * 100.0;
  rows.reserve(t.key_winds_m_s.size());
  for (const double v : t.key_winds_m_s) {
    LoadScenario at = scenario;
    at.design_wind_speed_m_s = v;
    const auto rw = bisect_critical_wall(species, geometry, at, settings, t.bisection_max_iter, t.sf_tolerance);
    if (!rw) continue;

    FailureThresholdRow row;
    row.wind_speed_m_s = v;
    row.critical_residual_wall_pct = *rw;
    row.critical_wall_thickness_cm = wall_thickness_cm(geometry.dbh_cm, *rw);
    row.decay_tolerance_pct = 100.0 - *rw;
    row.current_wall_below_critical = current_pct < *rw;
    rows.push_back(row);
  }
  return rows;
}

Curve decay_tolerance_curve(const SpeciesProfile& species,
                            const TreeGeometry& geometry,
                            const LoadScenario& scenario,
                            const EngineSettings& settings) {
  const SweepSettings& sw = settings.sweep;

  Curve c;
  c.x_label = "wind_speed_m_s";
  c.y_label = "critical_residual_wall_pct";
  if (!is_evaluable(species, geometry, scenario)) return c;

  const double v = scenario.design_wind_speed_m_s;
  const double v_min = sw.decay_wind_min_m_s;
  double v_max = clamp(v * sw.decay_wind_max_ratio, sw.decay_wind_max_lo_m_s, sw.decay_wind_max_hi_m_s);
  if (const auto v_fail = wind_to_failure(species, geometry, scenario, settings)) {
    v_max = std::fmax(v_max, *v_fail * sw.failure_margin);
  }

  c.points.reserve(static_cast<std::size_t>(sw.decay_steps));
  for (int i = 0; i < sw.decay_steps; ++i) {
    LoadScenario at = scenario;
    at.design_wind_speed_m_s = lerp_step(v_min, v_max, i, sw.decay_steps);
    if (const auto rw = critical_residual_wall_pct(species, geometry, at, settings)) {
      c.points.push_back({at.design_wind_speed_m_s, *rw});
    }
  }
  return c;
}

}  // namespace arbor
