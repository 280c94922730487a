#include "engine/physics/scenario_curves.hpp"

#include <cmath>

#include "engine/core/numeric.hpp"
#include "engine/physics/section_load.hpp"
#include "engine/physics/threshold_solver.hpp"

namespace arbor {

PruningScenarioResult pruning_scenario(const SpeciesProfile& species,
                                       const TreeGeometry& geometry,
                                       const LoadScenario& scenario,
                                       const PruningRequest& pruning,
                                       const EngineSettings& settings) {
  const double crown_red = clamp(is_finite(pruning.crown_diameter_reduction_pct) ? pruning.crown_diameter_reduction_pct : 0.0,
                                 0.0, 100.0);
  const double full_red = clamp(is_finite(pruning.fullness_reduction_pct) ? pruning.fullness_reduction_pct : 0.0,
                                0.0, 100.0);

  PruningScenarioResult out;
  out.fullness_before = effective_fullness(species, scenario.fullness_override, settings.load);
  out.fullness_after = clamp(out.fullness_before * (1.0 - full_red / 100.0),
                             settings.load.fullness_min, settings.load.fullness_max);
  out.crown_diameter_before_m = geometry.crown_diameter_m;
  out.crown_diameter_after_m = geometry.crown_diameter_m * (1.0 - crown_red / 100.0);

  LoadScenario before_sc = scenario;
  before_sc.fullness_override = out.fullness_before;
  out.before = evaluate(species, geometry, before_sc, settings);

  TreeGeometry after_g = geometry;
  after_g.crown_diameter_m = out.crown_diameter_after_m;
  LoadScenario after_sc = scenario;
  after_sc.fullness_override = out.fullness_after;
  out.after = evaluate(species, after_g, after_sc, settings);

  return out;
}

Curve sf_vs_wind_curve(const SpeciesProfile& species,
                       const TreeGeometry& geometry,
                       const LoadScenario& scenario,
                       const EngineSettings& settings) {
  const SweepSettings& sw = settings.sweep;

  Curve c;
  c.x_label = "wind_speed_m_s";
  c.y_label = "safety_factor";
  if (!is_evaluable(species, geometry, scenario)) return c;

  const double v = scenario.design_wind_speed_m_s;
  const double v_min = std::fmax(sw.wind_floor_m_s, v * sw.wind_min_ratio);
  double v_max = v * sw.wind_max_ratio;
  if (const auto v_fail = wind_to_failure(species, geometry, scenario, settings)) {
    v_max = std::fmax(v_max, *v_fail * sw.failure_margin);
  }
  if (v_max <= v_min) v_max = v_min + 5.0;

  c.points.reserve(static_cast<std::size_t>(sw.wind_steps));
  for (int i = 0; i < sw.wind_steps; ++i) {
    LoadScenario at = scenario;
    at.design_wind_speed_m_s = lerp_step(v_min, v_max, i, sw.wind_steps);
    c.points.push_back({at.design_wind_speed_m_s, evaluate(species, geometry, at, settings).safety_factor});
  }
  return c;
}

Curve sf_vs_reduction_curve(const SpeciesProfile& species,
                            const TreeGeometry& geometry,
                            const LoadScenario& scenario,
                            const PruningRequest& pruning,
                            const EngineSettings& settings) {
  const SweepSettings& sw = settings.sweep;

  Curve c;
  c.x_label = "crown_reduction_pct";
  c.y_label = "safety_factor";
  if (!is_evaluable(species, geometry, scenario)) return c;

  const double chosen = pruning.crown_diameter_reduction_pct;
  const double span = (!is_finite(chosen) || chosen <= 0.0)
                          ? sw.reduction_default_span_pct
                          : clamp(chosen, sw.reduction_span_min_pct, sw.reduction_span_max_pct);

  c.points.reserve(static_cast<std::size_t>(sw.reduction_steps));
  for (int i = 0; i < sw.reduction_steps; ++i) {
    PruningRequest at = pruning;
    at.crown_diameter_reduction_pct = lerp_step(0.0, span, i, sw.reduction_steps);
    const PruningScenarioResult r = pruning_scenario(species, geometry, scenario, at, settings);
    c.points.push_back({at.crown_diameter_reduction_pct, r.after.safety_factor});
  }
  return c;
}

Curve sf_vs_residual_wall_curve(const SpeciesProfile& species,
                                const TreeGeometry& geometry,
                                const LoadScenario& scenario,
                                const EngineSettings& settings) {
  const SweepSettings& sw = settings.sweep;

  Curve c;
  c.x_label = "residual_wall_pct";
  c.y_label = "safety_factor";
  if (!is_evaluable(species, geometry, scenario)) return c;

  c.points.reserve(static_cast<std::size_t>(sw.residual_steps));
  for (int i = 0; i < sw.residual_steps; ++i) {
    const double rw = lerp_step(sw.residual_min_pct, sw.residual_max_pct, i, sw.residual_steps);
    const double sf = evaluate(species, with_residual_wall(geometry, rw), scenario, settings).safety_factor;
    c.points.push_back({rw, sf});
  }
  return c;
}

std::vector<RegionalResult> regional_comparison(const SpeciesProfile& species,
                                                const TreeGeometry& geometry,
                                                const LoadScenario& scenario,
                                                const EngineSettings& settings) {
  std::vector<RegionalResult> out;
  if (!is_evaluable(species, geometry, scenario)) return out;

  out.reserve(settings.sweep.regional_winds.size());
  for (const auto& rw : settings.sweep.regional_winds) {
    LoadScenario at = scenario;
    at.design_wind_speed_m_s = rw.wind_speed_m_s;
    out.push_back({rw.label, rw.wind_speed_m_s, evaluate(species, geometry, at, settings).safety_factor});
  }
  return out;
}

}  // namespace arbor
