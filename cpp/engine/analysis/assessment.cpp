#include "engine/analysis/assessment.hpp"

#include <sstream>

#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"
#include "engine/physics/section_load.hpp"
#include "engine/physics/threshold_solver.hpp"

namespace arbor {

namespace {

// Species, wind source and scenario knobs that validate_inputs() does not see.
void validate_selection(const AssessmentInput& in,
                        const SpeciesCatalog& species,
                        const WindCatalog& winds,
                        RawTreeInputs* tree,
                        std::vector<ValidationIssue>* issues) {
  if (!species.find(in.species_id)) {
    issues->push_back(make_input_error("input.species.unknown",
                                       "Unknown species '" + in.species_id + "'.",
                                       "species_id"));
  }

  if (!tree->design_wind_speed_m_s.has_value() && in.wind_preset_id.has_value()) {
    if (const WindProfile* w = winds.find(*in.wind_preset_id)) {
      tree->design_wind_speed_m_s = w->design_wind_speed_m_s;
    } else {
      issues->push_back(make_input_error("input.wind_preset.unknown",
                                         "Unknown wind preset '" + *in.wind_preset_id + "'.",
                                         "wind_preset_id"));
    }
  }

  if (!(is_finite(in.site_factor) && in.site_factor >= 0.0)) {
    issues->push_back(make_input_error("input.site_factor.invalid",
                                       "Site factor must be zero or greater.",
                                       "scenario.site_factor"));
  }

  if (in.fullness_override.has_value()) {
    if (!is_finite(*in.fullness_override)) {
      issues->push_back(make_input_error("input.fullness.invalid",
                                         "Crown fullness override must be a number.",
                                         "scenario.fullness_override"));
    } else if (*in.fullness_override < 0.1 || *in.fullness_override > 1.0) {
      issues->push_back(make_input_warning("input.fullness.clamped",
                                           "Crown fullness outside 0.1-1.0 will be clamped.",
                                           "scenario.fullness_override"));
    }
  }

  if (in.pruning.has_value()) {
    const PruningRequest& p = *in.pruning;
    const bool ok = is_finite(p.crown_diameter_reduction_pct) && is_finite(p.fullness_reduction_pct);
    if (!ok) {
      issues->push_back(make_input_error("input.pruning.invalid",
                                         "Pruning reductions must be numbers.",
                                         "pruning"));
    } else if (p.crown_diameter_reduction_pct < 0.0 || p.crown_diameter_reduction_pct > 100.0 ||
               p.fullness_reduction_pct < 0.0 || p.fullness_reduction_pct > 100.0) {
      issues->push_back(make_input_warning("input.pruning.clamped",
                                           "Pruning reductions outside 0-100% will be clamped.",
                                           "pruning"));
    }
  }
}

std::string describe(const CalculationResult& r) {
  std::ostringstream oss;
  oss << "q=" << r.wind_pressure_Pa << "Pa F=" << r.wind_force_N << "N M=" << r.bending_moment_Nm
      << "Nm W=" << r.section_modulus_m3 << "m3 sigma=" << r.bending_stress_MPa << "MPa SF=" << r.safety_factor;
  return oss.str();
}

}  // namespace

Assessment run_assessment(const AssessmentInput& in,
                          const SpeciesCatalog& species,
                          const WindCatalog& winds,
                          const EngineSettings& settings) {
  settings.validate_or_throw();

  Assessment a;
  a.species_id = in.species_id;

  // 1) Validation
  RawTreeInputs tree = in.tree;
  std::vector<ValidationIssue> selection_issues;
  validate_selection(in, species, winds, &tree, &selection_issues);
  a.issues = validate_inputs(tree);
  a.issues.insert(a.issues.end(), selection_issues.begin(), selection_issues.end());

  if (has_blocking_error(a.issues)) {
    a.blocked = true;
    log_warn("assessment blocked: " + std::to_string(count_errors(a.issues)) + " input error(s)");
    return a;
  }

  const SpeciesProfile& sp = species.at(in.species_id);
  a.species_name = sp.display_name;
  a.geometry = to_geometry(tree);
  a.design_wind_speed_m_s = *tree.design_wind_speed_m_s;

  // 2) Defects
  a.defect_strength_factor = compose_defect_strength_factor(in.defects, a.geometry.height_m);

  LoadScenario sc;
  sc.design_wind_speed_m_s = a.design_wind_speed_m_s;
  sc.site_factor = in.site_factor;
  sc.fullness_override = in.fullness_override;
  sc.defect_strength_factor = a.defect_strength_factor;

  // 3-4) Design-wind result and wind-to-failure
  a.result = evaluate(sp, a.geometry, sc, settings);
  a.wind_to_failure_m_s = wind_to_failure(a.result, sc.design_wind_speed_m_s);
  if (log_enabled(LogLevel::DEBUG)) {
    log_debug("assessment " + sp.id + ": k_defect=" + std::to_string(a.defect_strength_factor) + " " +
              describe(a.result));
  }

  // 5) Pruning
  if (in.pruning.has_value()) {
    a.pruning = pruning_scenario(sp, a.geometry, sc, *in.pruning, settings);
    a.pruning_improvement_pct =
        mitigation_improvement_pct(a.pruning->before.safety_factor, a.pruning->after.safety_factor);
  }

  // 6) Post checks and ratings
  const auto post = post_calculation_warnings(a.result, settings.post);
  a.issues.insert(a.issues.end(), post.begin(), post.end());
  a.safety_factor_rating = rate_safety_factor(a.result.safety_factor);
  a.wind_margin_rating = rate_wind_margin(sc.design_wind_speed_m_s, a.wind_to_failure_m_s);

  // 7) Residual wall
  const double wall_fraction = residual_wall_fraction(a.geometry, settings.load);
  a.residual_wall_pct = wall_fraction * 100.0;
  a.residual_wall_rating = rate_residual_wall(wall_fraction);
  a.critical_residual_wall_pct = critical_residual_wall_pct(sp, a.geometry, sc, settings);
  if (a.critical_residual_wall_pct) {
    a.critical_wall_thickness_cm = wall_thickness_cm(a.geometry.dbh_cm, *a.critical_residual_wall_pct);
  }
  a.failure_thresholds = failure_threshold_table(sp, a.geometry, sc, settings);

  // 8) Curves
  a.sf_vs_wind = sf_vs_wind_curve(sp, a.geometry, sc, settings);
  if (in.pruning.has_value()) {
    a.sf_vs_reduction = sf_vs_reduction_curve(sp, a.geometry, sc, *in.pruning, settings);
  }
  a.sf_vs_residual_wall = sf_vs_residual_wall_curve(sp, a.geometry, sc, settings);
  a.decay_tolerance = decay_tolerance_curve(sp, a.geometry, sc, settings);
  a.regional = regional_comparison(sp, a.geometry, sc, settings);
  log_debug("assessment curves: wind=" + std::to_string(a.sf_vs_wind.size()) +
            " residual=" + std::to_string(a.sf_vs_residual_wall.size()) +
            " decay=" + std::to_string(a.decay_tolerance.size()) +
            " thresholds=" + std::to_string(a.failure_thresholds.size()));

  // 9) Root plate
  if (in.root_plate.has_value()) {
    const double f = compose_root_plate_stability(*in.root_plate, a.geometry.dbh_cm);
    a.root_plate_factor = f;
    a.root_plate_risk = root_plate_risk(f);
  }

  return a;
}

}  // namespace arbor
