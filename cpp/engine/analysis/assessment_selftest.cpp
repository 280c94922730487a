/*
  Assessment Pipeline Selftest

  Checks:
    1) Blocking input errors stop the pipeline (no result, no curves).
    2) Unknown species / wind preset are reported as issues, not thrown.
    3) Wind preset supplies the design wind; an explicit speed wins.
    4) Full pipeline on the reference tree: every derived field populated and
       consistent with the physics modules called directly.
    5) Pruning and root plate outputs appear only when requested.
    6) Rating bands, residual wall rating and mitigation improvement.
    7) Invalid settings throw ValidationError.

  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "engine/analysis/assessment.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/physics/section_load.hpp"
#include "engine/physics/threshold_solver.hpp"

using arbor::selftest::Report;

namespace arbor {
namespace {

AssessmentInput reference_input() {
  AssessmentInput in;
  in.species_id = "euc_typical";
  in.tree.dbh_cm = 50.0;
  in.tree.height_m = 18.0;
  in.tree.crown_diameter_m = 10.0;
  in.tree.design_wind_speed_m_s = 40.0;
  return in;
}

bool has_code(const std::vector<ValidationIssue>& issues, const std::string& code) {
  return std::any_of(issues.begin(), issues.end(), [&](const ValidationIssue& i) { return i.code == code; });
}

struct Catalogs {
  SpeciesCatalog species = SpeciesCatalog::builtin();
  WindCatalog winds = WindCatalog::builtin();
};

void test_blocked(Report& r) {
  const Catalogs c;
  AssessmentInput in = reference_input();
  in.tree.dbh_cm.reset();
  in.tree.crown_diameter_m = -1.0;

  const Assessment a = run_assessment(in, c.species, c.winds);
  r.expect_true(a.blocked, "blocked: missing DBH blocks");
  r.expect_true(count_errors(a.issues) == 2, "blocked: both errors reported");
  r.expect_true(a.sf_vs_wind.empty() && a.regional.empty() && !a.wind_to_failure_m_s,
                "blocked: nothing computed");
  r.expect_true(a.species_id == "euc_typical", "blocked: species id echoed");
}

void test_unknown_ids(Report& r) {
  const Catalogs c;
  AssessmentInput in = reference_input();
  in.species_id = "baobab";
  const Assessment a = run_assessment(in, c.species, c.winds);
  r.expect_true(a.blocked && has_code(a.issues, "input.species.unknown"), "unknown: species -> blocking issue");

  AssessmentInput w = reference_input();
  w.tree.design_wind_speed_m_s.reset();
  w.wind_preset_id = "Z_open";
  const Assessment b = run_assessment(w, c.species, c.winds);
  r.expect_true(b.blocked && has_code(b.issues, "input.wind_preset.unknown"), "unknown: preset -> blocking issue");

  AssessmentInput none = reference_input();
  none.tree.design_wind_speed_m_s.reset();
  const Assessment n = run_assessment(none, c.species, c.winds);
  r.expect_true(n.blocked && has_code(n.issues, "input.wind.not_positive"), "unknown: no wind source blocks");

  AssessmentInput site = reference_input();
  site.site_factor = -0.5;
  r.expect_true(has_code(run_assessment(site, c.species, c.winds).issues, "input.site_factor.invalid"),
                "unknown: negative site factor is an error");
}

void test_wind_source(Report& r) {
  const Catalogs c;
  AssessmentInput in = reference_input();
  in.tree.design_wind_speed_m_s.reset();
  in.wind_preset_id = "C_urban";
  const Assessment a = run_assessment(in, c.species, c.winds);
  r.expect_true(!a.blocked, "wind: preset accepted");
  r.expect_near(a.design_wind_speed_m_s, 50.0, 1e-12, "wind: C_urban supplies 50 m/s");

  in.tree.design_wind_speed_m_s = 33.0;
  const Assessment b = run_assessment(in, c.species, c.winds);
  r.expect_near(b.design_wind_speed_m_s, 33.0, 1e-12, "wind: explicit speed takes precedence");
}

void test_full_pipeline(Report& r) {
  const Catalogs c;
  AssessmentInput in = reference_input();
  in.tree.cavity_inner_diameter_cm = 20.0;
  in.defects.cracks = true;

  const Assessment a = run_assessment(in, c.species, c.winds);
  r.expect_true(!a.blocked && count_errors(a.issues) == 0, "pipeline: not blocked");
  r.expect_true(a.species_name == c.species.at("euc_typical").display_name, "pipeline: species name resolved");

  const double k = compose_defect_strength_factor(in.defects, 18.0);
  r.expect_near(a.defect_strength_factor, k, 1e-12, "pipeline: k_defect composed from observations");
  r.expect_true(a.defect_strength_factor < 1.0, "pipeline: cracks reduce k_defect");

  LoadScenario sc;
  sc.design_wind_speed_m_s = 40.0;
  sc.defect_strength_factor = k;
  const CalculationResult direct = evaluate(c.species.at("euc_typical"), a.geometry, sc);
  r.expect_true(a.result.safety_factor == direct.safety_factor, "pipeline: SF matches direct evaluation");

  r.expect_true(a.wind_to_failure_m_s.has_value(), "pipeline: wind-to-failure present");
  if (a.wind_to_failure_m_s) {
    r.expect_near(*a.wind_to_failure_m_s, 40.0 * std::sqrt(a.result.safety_factor), 1e-12,
                  "pipeline: V_fail = V sqrt(SF)");
  }

  r.expect_near(a.residual_wall_pct, 60.0, 1e-9, "pipeline: 20 cm cavity in 50 cm -> 60% wall");
  r.expect_true(a.residual_wall_rating == ResidualWallRating::Tolerable, "pipeline: 60% wall is tolerable");
  r.expect_true(!a.failure_thresholds.empty(), "pipeline: failure threshold table");
  bool flags_match = true;
  for (const auto& row : a.failure_thresholds) {
    if (row.current_wall_below_critical != (60.0 < row.critical_residual_wall_pct)) flags_match = false;
  }
  r.expect_true(flags_match, "pipeline: below-critical flag compares the 60% wall");
  r.expect_true(!a.pruning_improvement_pct, "pipeline: no improvement without pruning");
  r.expect_true(a.sf_vs_wind.size() == 12, "pipeline: wind curve");
  r.expect_true(a.sf_vs_residual_wall.size() == 9, "pipeline: residual wall curve");
  r.expect_true(!a.decay_tolerance.empty(), "pipeline: decay tolerance curve");
  r.expect_true(a.regional.size() == 5, "pipeline: regional comparison");
  r.expect_true(a.sf_vs_reduction.empty() && !a.pruning, "pipeline: no pruning unless requested");
  r.expect_true(!a.root_plate_factor && !a.root_plate_risk, "pipeline: no root plate unless requested");

  if (a.critical_residual_wall_pct) {
    r.expect_near(*a.critical_wall_thickness_cm, wall_thickness_cm(50.0, *a.critical_residual_wall_pct), 1e-12,
                  "pipeline: wall thickness follows critical wall");
  } else {
    r.expect_true(!a.critical_wall_thickness_cm, "pipeline: no thickness without critical wall");
  }
}

void test_critical_wall_at_high_wind(Report& r) {
  const Catalogs c;
  AssessmentInput in = reference_input();
  in.tree.design_wind_speed_m_s = 60.0;
  const Assessment a = run_assessment(in, c.species, c.winds);
  r.expect_true(a.critical_residual_wall_pct.has_value(), "critical: found at 60 m/s");
  r.expect_true(a.critical_wall_thickness_cm.has_value(), "critical: thickness reported");
  r.expect_true(a.safety_factor_rating == SafetyFactorRating::Reduced, "critical: SF ~1.35 is Reduced");
}

void test_optional_sections(Report& r) {
  const Catalogs c;
  AssessmentInput in = reference_input();
  in.pruning = PruningRequest{20.0, 10.0};
  RootPlateObservations rp;
  rp.soil = SoilType::Sandy;
  in.root_plate = rp;

  const Assessment a = run_assessment(in, c.species, c.winds);
  r.expect_true(a.pruning.has_value(), "optional: pruning result present");
  if (a.pruning) r.expect_true(a.pruning->after.safety_factor > a.result.safety_factor, "optional: pruning helps");
  r.expect_true(a.pruning_improvement_pct.has_value(), "optional: improvement present");
  if (a.pruning && a.pruning_improvement_pct) {
    const double before = a.pruning->before.safety_factor;
    r.expect_near(*a.pruning_improvement_pct, (a.pruning->after.safety_factor - before) / before * 100.0, 1e-12,
                  "optional: improvement relative to SF before");
  }
  r.expect_true(a.sf_vs_reduction.size() == 9, "optional: reduction curve present");
  r.expect_true(a.root_plate_factor.has_value() && a.root_plate_risk.has_value(), "optional: root plate present");
  if (a.root_plate_factor) {
    r.expect_near(*a.root_plate_factor, compose_root_plate_stability(rp, 50.0), 1e-12, "optional: factor composed");
  }

  AssessmentInput over = reference_input();
  over.pruning = PruningRequest{120.0, 0.0};
  over.fullness_override = 1.3;
  const Assessment o = run_assessment(over, c.species, c.winds);
  r.expect_true(!o.blocked, "optional: out-of-range knobs do not block");
  r.expect_true(has_code(o.issues, "input.pruning.clamped") && has_code(o.issues, "input.fullness.clamped"),
                "optional: clamping warnings reported");

  AssessmentInput nan = reference_input();
  nan.pruning = PruningRequest{std::numeric_limits<double>::quiet_NaN(), 0.0};
  r.expect_true(run_assessment(nan, c.species, c.winds).blocked, "optional: NaN pruning blocks");
}

void test_ratings(Report& r) {
  r.expect_true(rate_safety_factor(1.5) == SafetyFactorRating::Adequate, "rating: 1.5 Adequate");
  r.expect_true(rate_safety_factor(1.49) == SafetyFactorRating::Reduced, "rating: 1.49 Reduced");
  r.expect_true(rate_safety_factor(1.0) == SafetyFactorRating::Reduced, "rating: 1.0 Reduced");
  r.expect_true(rate_safety_factor(0.99) == SafetyFactorRating::Unacceptable, "rating: 0.99 Unacceptable");
  r.expect_true(rate_safety_factor(std::numeric_limits<double>::infinity()) == SafetyFactorRating::Adequate,
                "rating: +inf Adequate");

  r.expect_true(rate_wind_margin(40.0, 60.0) == WindMarginRating::Moderate, "margin: 1.5 Moderate");
  r.expect_true(rate_wind_margin(40.0, 44.0) == WindMarginRating::Narrow, "margin: 1.1 Narrow");
  r.expect_true(rate_wind_margin(40.0, 43.0) == WindMarginRating::Little, "margin: < 1.1 Little");
  r.expect_true(rate_wind_margin(40.0, std::nullopt) == WindMarginRating::Unresolved, "margin: absent");

  r.expect_true(rate_residual_wall(0.4) == ResidualWallRating::Tolerable, "wall: 0.4 Tolerable");
  r.expect_true(rate_residual_wall(0.39) == ResidualWallRating::Marginal, "wall: 0.39 Marginal");
  r.expect_true(rate_residual_wall(0.3) == ResidualWallRating::Marginal, "wall: 0.3 Marginal");
  r.expect_true(rate_residual_wall(0.29) == ResidualWallRating::Unacceptable, "wall: 0.29 Unacceptable");
  r.expect_true(rate_residual_wall(std::numeric_limits<double>::quiet_NaN()) == ResidualWallRating::Unacceptable,
                "wall: NaN Unacceptable");
}

void test_mitigation_improvement(Report& r) {
  const double inf = std::numeric_limits<double>::infinity();
  const auto up = mitigation_improvement_pct(2.0, 3.0);
  r.expect_true(up.has_value(), "mitigation: finite SFs -> present");
  if (up) r.expect_near(*up, 50.0, 1e-12, "mitigation: 2 -> 3 is +50%");
  const auto down = mitigation_improvement_pct(2.0, 1.0);
  r.expect_true(down.has_value(), "mitigation: worse outcome still reported");
  if (down) r.expect_near(*down, -50.0, 1e-12, "mitigation: 2 -> 1 is -50%");
  r.expect_true(!mitigation_improvement_pct(0.0, 1.0), "mitigation: zero SF before -> absent");
  r.expect_true(!mitigation_improvement_pct(inf, 2.0), "mitigation: infinite SF before -> absent");
  r.expect_true(!mitigation_improvement_pct(2.0, inf), "mitigation: infinite SF after -> absent");
}

void test_invalid_settings(Report& r) {
  const Catalogs c;
  EngineSettings s;
  s.solver.sf_tolerance = -1.0;
  r.expect_throws<ValidationError>([&] { (void)run_assessment(reference_input(), c.species, c.winds, s); },
                                   "settings: invalid tolerance throws");

  EngineSettings empty;
  empty.thresholds.key_winds_m_s.clear();
  r.expect_throws<ValidationError>([&] { empty.validate_or_throw(); }, "settings: no key winds throws");

  EngineSettings unordered;
  unordered.thresholds.key_winds_m_s = {40.0, 32.0};
  r.expect_throws<ValidationError>([&] { unordered.validate_or_throw(); }, "settings: unordered key winds throw");
}

}  // namespace
}  // namespace arbor

int main() {
  Report r{"assessment"};
  r.run("blocked", arbor::test_blocked);
  r.run("unknown_ids", arbor::test_unknown_ids);
  r.run("wind_source", arbor::test_wind_source);
  r.run("full_pipeline", arbor::test_full_pipeline);
  r.run("critical_wall_at_high_wind", arbor::test_critical_wall_at_high_wind);
  r.run("optional_sections", arbor::test_optional_sections);
  r.run("ratings", arbor::test_ratings);
  r.run("mitigation_improvement", arbor::test_mitigation_improvement);
  r.run("invalid_settings", arbor::test_invalid_settings);
  return r.finish();
}
