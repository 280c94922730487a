/*
  Threshold Solver Selftest

  Checks:
    1) evaluate() at the returned V_fail gives SF ~ 1; k_defect lowers V_fail.
    2) Infinite SF (zero wind) -> no wind-to-failure.
    3) Critical residual wall: SF at the result is within tolerance of 1 and
       lies strictly inside (10, 100); absent when no crossing is in range.
    4) SF strictly increases with residual wall.
    5) Decay tolerance curve: increasing winds, critical wall strictly
       increasing point to point, every point consistent.
    6) Failure threshold table at the key winds.
    7) Residual wall fraction and wall thickness helpers.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <limits>

#include "engine/core/selftest.hpp"
#include "engine/physics/section_load.hpp"
#include "engine/physics/threshold_solver.hpp"

using arbor::selftest::Report;

namespace arbor {
namespace {

SpeciesProfile typical_species() {
  SpeciesProfile s;
  s.id = "euc_typical";
  s.display_name = "Eucalypt (typical)";
  s.group = SpeciesGroup::Eucalypt;
  s.green_bending_strength_MPa = 35.0;
  s.drag_coefficient = 0.25;
  s.crown_shape_factor = 0.7;
  s.default_fullness = 0.9;
  return s;
}

TreeGeometry reference_tree() {
  TreeGeometry g;
  g.dbh_cm = 50.0;
  g.height_m = 18.0;
  g.crown_diameter_m = 10.0;
  return g;
}

LoadScenario at_wind(double v, double k_defect = 1.0) {
  LoadScenario sc;
  sc.design_wind_speed_m_s = v;
  sc.defect_strength_factor = k_defect;
  return sc;
}

void test_wind_to_failure(Report& r) {
  const SpeciesProfile sp = typical_species();
  for (double v : {20.0, 40.0, 65.0}) {
    TreeGeometry g = reference_tree();
    g.cavity_inner_diameter_cm = 25.0;
    const auto vf = wind_to_failure(sp, g, at_wind(v));
    r.expect_true(vf.has_value(), "w2f: present for finite SF");
    if (!vf) continue;
    const double sf = evaluate(sp, g, at_wind(*vf)).safety_factor;
    r.expect_near(sf, 1.0, 1e-9, "w2f: SF at V_fail ~ 1");
  }

  const auto clean = wind_to_failure(sp, reference_tree(), at_wind(40.0));
  const auto decayed = wind_to_failure(sp, reference_tree(), at_wind(40.0, 0.6));
  r.expect_true(clean && decayed && *decayed < *clean, "w2f: k_defect lowers V_fail");
  if (clean && decayed) r.expect_near(*decayed / *clean, std::sqrt(0.6), 1e-9, "w2f: V_fail scales with sqrt(k)");

  r.expect_true(!wind_to_failure(sp, reference_tree(), at_wind(0.0)).has_value(), "w2f: zero wind -> absent");

  CalculationResult bad;
  bad.safety_factor = -1.0;
  r.expect_true(!wind_to_failure(bad, 40.0).has_value(), "w2f: SF <= 0 -> absent");
  bad.safety_factor = std::numeric_limits<double>::quiet_NaN();
  r.expect_true(!wind_to_failure(bad, 40.0).has_value(), "w2f: NaN SF -> absent");

  TreeGeometry broken = reference_tree();
  broken.dbh_cm = -3.0;
  r.expect_true(!wind_to_failure(sp, broken, at_wind(40.0)).has_value(), "w2f: invalid inputs -> absent, no throw");
}

void test_critical_wall(Report& r) {
  const SpeciesProfile sp = typical_species();
  const EngineSettings& s = EngineSettings::defaults();

  const auto rw = critical_residual_wall_pct(sp, reference_tree(), at_wind(60.0));
  r.expect_true(rw.has_value(), "critical: found at 60 m/s");
  if (rw) {
    r.expect_true(*rw > 10.0 && *rw < 100.0, "critical: strictly inside (10, 100)");
    const double sf = evaluate(sp, with_residual_wall(reference_tree(), *rw), at_wind(60.0)).safety_factor;
    r.expect_true(std::fabs(sf - 1.0) < s.solver.sf_tolerance, "critical: SF at result within tolerance of 1");
  }

  // Geometry's own cavity does not change the answer.
  TreeGeometry hollow = reference_tree();
  hollow.cavity_inner_diameter_cm = 40.0;
  const auto rw2 = critical_residual_wall_pct(sp, hollow, at_wind(60.0));
  r.expect_true(rw && rw2 && *rw == *rw2, "critical: independent of current cavity");

  r.expect_true(!critical_residual_wall_pct(sp, reference_tree(), at_wind(100.0)).has_value(),
                "critical: solid stem already fails -> absent");
  r.expect_true(!critical_residual_wall_pct(sp, reference_tree(), at_wind(20.0)).has_value(),
                "critical: thinnest wall still safe -> absent");
  r.expect_true(!critical_residual_wall_pct(sp, reference_tree(), at_wind(0.0)).has_value(),
                "critical: infinite SF -> absent");

  // Heavier decay needs a thicker wall.
  const auto rw_k = critical_residual_wall_pct(sp, reference_tree(), at_wind(60.0, 0.8));
  r.expect_true(rw && rw_k && *rw_k > *rw, "critical: lower k_defect raises critical wall");
}

void test_monotonic_residual(Report& r) {
  double prev = -1.0;
  bool strictly = true;
  for (double rw = 10.0; rw <= 100.0; rw += 5.0) {
    const double sf = evaluate(typical_species(), with_residual_wall(reference_tree(), rw), at_wind(45.0)).safety_factor;
    if (!(sf > prev)) strictly = false;
    prev = sf;
  }
  r.expect_true(strictly, "monotonic: SF strictly increases with residual wall");
}

void test_decay_tolerance(Report& r) {
  const SpeciesProfile sp = typical_species();
  const Curve c = decay_tolerance_curve(sp, reference_tree(), at_wind(40.0));
  r.expect_true(!c.empty() && c.size() <= 10, "decay: 1..10 points");

  bool increasing_x = true;
  bool increasing_y = true;
  bool consistent = true;
  for (std::size_t i = 0; i < c.size(); ++i) {
    if (i > 0 && !(c.points[i].x > c.points[i - 1].x)) increasing_x = false;
    if (i > 0 && !(c.points[i].y > c.points[i - 1].y)) increasing_y = false;
    const double y = c.points[i].y;
    if (!(y > 10.0 && y < 100.0)) consistent = false;
    const double sf = evaluate(sp, with_residual_wall(reference_tree(), y), at_wind(c.points[i].x)).safety_factor;
    if (!(std::fabs(sf - 1.0) < 0.02)) consistent = false;
  }
  r.expect_true(increasing_x, "decay: wind samples increase");
  r.expect_true(increasing_y, "decay: each stronger wind needs a thicker wall");
  r.expect_true(consistent, "decay: every point has SF ~ 1 inside (10, 100)");
  r.expect_true(c.size() >= 3, "decay: enough points for the monotonic check to mean something");

  // V_fail = 40 sqrt(SF) ~ 69.8 m/s, so the range extends past 60 m/s.
  const auto vf = wind_to_failure(sp, reference_tree(), at_wind(40.0));
  r.expect_true(vf.has_value() && *vf * 1.1 > 60.0, "decay: range extension applies for this tree");

  TreeGeometry broken = reference_tree();
  broken.dbh_cm = 0.0;
  r.expect_true(decay_tolerance_curve(sp, broken, at_wind(40.0)).empty(), "decay: invalid inputs -> empty curve");
}

// Solid SF(V) = 3.044 (40 / V)^2 and a 10 % wall keeps ~34 % of the section
// modulus, so only the 50, 60 and 69 m/s key winds cross SF = 1 in range.
void test_failure_threshold_table(Report& r) {
  const SpeciesProfile sp = typical_species();
  const EngineSettings& s = EngineSettings::defaults();

  const auto rows = failure_threshold_table(sp, reference_tree(), at_wind(40.0));
  r.expect_true(rows.size() == 3, "table: three key winds have a threshold");
  if (rows.size() != 3) return;
  r.expect_true(rows[0].wind_speed_m_s == 50.0 && rows[1].wind_speed_m_s == 60.0 && rows[2].wind_speed_m_s == 69.0,
                "table: key-wind order kept, out-of-range winds omitted");

  bool consistent = true;
  for (const auto& row : rows) {
    const double sf = evaluate(sp, with_residual_wall(reference_tree(), row.critical_residual_wall_pct),
                               at_wind(row.wind_speed_m_s))
                          .safety_factor;
    if (!(std::fabs(sf - 1.0) < s.thresholds.sf_tolerance)) consistent = false;
    if (!(row.critical_residual_wall_pct > 10.0 && row.critical_residual_wall_pct < 100.0)) consistent = false;
    if (std::fabs(row.critical_wall_thickness_cm - 50.0 * row.critical_residual_wall_pct / 200.0) > 1e-12) {
      consistent = false;
    }
    if (std::fabs(row.decay_tolerance_pct - (100.0 - row.critical_residual_wall_pct)) > 1e-12) consistent = false;
    if (row.current_wall_below_critical) consistent = false;  // solid stem
  }
  r.expect_true(consistent, "table: SF ~ 1 within 0.01, thickness and tolerance derived, solid wall not below");
  r.expect_true(rows[0].critical_residual_wall_pct < rows[1].critical_residual_wall_pct &&
                    rows[1].critical_residual_wall_pct < rows[2].critical_residual_wall_pct,
                "table: critical wall rises with wind");

  // 45 cm cavity leaves a 10 % wall: below every critical value.
  TreeGeometry hollow = reference_tree();
  hollow.cavity_inner_diameter_cm = 45.0;
  const auto hr = failure_threshold_table(sp, hollow, at_wind(40.0));
  bool all_below = hr.size() == rows.size();
  for (std::size_t i = 0; i < hr.size() && i < rows.size(); ++i) {
    if (!hr[i].current_wall_below_critical) all_below = false;
    if (hr[i].critical_residual_wall_pct != rows[i].critical_residual_wall_pct) all_below = false;
  }
  r.expect_true(all_below, "table: thin current wall flagged, critical values independent of cavity");

  EngineSettings custom;
  custom.thresholds.key_winds_m_s = {30.0, 45.0};
  const auto cr = failure_threshold_table(sp, reference_tree(), at_wind(40.0), custom);
  r.expect_true(cr.size() == 1 && cr[0].wind_speed_m_s == 45.0, "table: custom key winds honoured");

  LoadScenario calm = at_wind(40.0);
  calm.site_factor = 0.0;
  r.expect_true(failure_threshold_table(sp, reference_tree(), calm).empty(), "table: infinite SF -> no rows");

  TreeGeometry broken = reference_tree();
  broken.dbh_cm = 0.0;
  r.expect_true(failure_threshold_table(sp, broken, at_wind(40.0)).empty(), "table: invalid inputs -> no rows");
}

void test_helpers(Report& r) {
  TreeGeometry g = reference_tree();
  r.expect_near(residual_wall_fraction(g), 1.0, 1e-12, "fraction: solid = 1");
  g.cavity_inner_diameter_cm = 20.0;
  r.expect_near(residual_wall_fraction(g), 0.6, 1e-12, "fraction: 20 of 50 cm -> 0.6");
  g.cavity_inner_diameter_cm = 75.0;
  r.expect_near(residual_wall_fraction(g), 0.01, 1e-9, "fraction: capped cavity -> 0.01");
  g.cavity_inner_diameter_cm = -4.0;
  r.expect_near(residual_wall_fraction(g), 1.0, 1e-12, "fraction: negative cavity solid");

  r.expect_near(wall_thickness_cm(50.0, 40.0), 10.0, 1e-12, "thickness: 50 cm at 40% -> 10 cm");

  const TreeGeometry full = with_residual_wall(reference_tree(), 100.0);
  r.expect_true(!full.cavity_inner_diameter_cm.has_value(), "with_residual_wall: 100% is solid");
  const TreeGeometry thin = with_residual_wall(reference_tree(), 30.0);
  r.expect_true(thin.cavity_inner_diameter_cm && std::fabs(*thin.cavity_inner_diameter_cm - 35.0) < 1e-9,
                "with_residual_wall: 30% of 50 cm leaves 35 cm cavity");
}

}  // namespace
}  // namespace arbor

int main() {
  Report r{"threshold_solver"};
  r.run("wind_to_failure", arbor::test_wind_to_failure);
  r.run("critical_wall", arbor::test_critical_wall);
  r.run("monotonic_residual", arbor::test_monotonic_residual);
  r.run("decay_tolerance", arbor::test_decay_tolerance);
  r.run("failure_threshold_table", arbor::test_failure_threshold_table);
  r.run("helpers", arbor::test_helpers);
  return r.finish();
}
