/*
  Scenario Curves Selftest

  Checks:
    1) Pruning: after crown = before * (1 - r/100); after fullness is the
       reduced fullness clamped to >= 0.1; reductions clamped to [0, 100].
    2) SF vs wind: 12 points over [max(5, 0.5V), max(1.8V, 1.1 V_fail)],
       strictly decreasing; zero wind falls back to [5, 10].
    3) SF vs reduction: span rules, SF rises with reduction.
    4) SF vs residual wall: 9 points over [20, 100], rising to the solid SF.
    5) Regional comparison matches direct evaluation.

  Non-zero return code indicates failure.
*/

#include <cmath>

#include "engine/core/selftest.hpp"
#include "engine/physics/scenario_curves.hpp"
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

LoadScenario at_wind(double v) {
  LoadScenario sc;
  sc.design_wind_speed_m_s = v;
  return sc;
}

bool strictly_decreasing(const Curve& c) {
  for (std::size_t i = 1; i < c.size(); ++i) {
    if (!(c.points[i].y < c.points[i - 1].y)) return false;
  }
  return true;
}

bool strictly_increasing(const Curve& c) {
  for (std::size_t i = 1; i < c.size(); ++i) {
    if (!(c.points[i].y > c.points[i - 1].y)) return false;
  }
  return true;
}

void test_pruning(Report& r) {
  const SpeciesProfile sp = typical_species();

  const PruningScenarioResult p = pruning_scenario(sp, reference_tree(), at_wind(40.0), PruningRequest{20.0, 30.0});
  r.expect_near(p.crown_diameter_before_m, 10.0, 1e-12, "pruning: crown before");
  r.expect_near(p.crown_diameter_after_m, 8.0, 1e-12, "pruning: crown after = 10 * 0.8");
  r.expect_near(p.fullness_before, 0.9, 1e-12, "pruning: fullness before = species default");
  r.expect_near(p.fullness_after, 0.63, 1e-12, "pruning: fullness after = 0.9 * 0.7");
  r.expect_true(p.after.safety_factor > p.before.safety_factor, "pruning: reduction raises SF");

  const double plain = evaluate(sp, reference_tree(), at_wind(40.0)).safety_factor;
  r.expect_true(p.before.safety_factor == plain, "pruning: before equals the unpruned evaluation");

  const PruningScenarioResult heavy = pruning_scenario(sp, reference_tree(), at_wind(40.0), PruningRequest{0.0, 99.0});
  r.expect_near(heavy.fullness_after, 0.1, 1e-12, "pruning: fullness never below 0.1");

  const PruningScenarioResult over = pruning_scenario(sp, reference_tree(), at_wind(40.0), PruningRequest{150.0, 0.0});
  r.expect_near(over.crown_diameter_after_m, 0.0, 1e-12, "pruning: crown reduction clamped to 100%");
  r.expect_true(std::isinf(over.after.safety_factor), "pruning: no crown -> SF +inf");

  const PruningScenarioResult neg = pruning_scenario(sp, reference_tree(), at_wind(40.0), PruningRequest{-10.0, -10.0});
  r.expect_near(neg.crown_diameter_after_m, 10.0, 1e-12, "pruning: negative reduction clamped to 0");
  r.expect_near(neg.fullness_after, 0.9, 1e-12, "pruning: negative fullness reduction clamped to 0");

  LoadScenario over_full = at_wind(40.0);
  over_full.fullness_override = 1.4;
  const PruningScenarioResult o = pruning_scenario(sp, reference_tree(), over_full, PruningRequest{0.0, 50.0});
  r.expect_near(o.fullness_before, 1.0, 1e-12, "pruning: before fullness is the clamped override");
  r.expect_near(o.fullness_after, 0.5, 1e-12, "pruning: reduction applies to clamped fullness");
}

void test_wind_curve(Report& r) {
  const SpeciesProfile sp = typical_species();
  const Curve c = sf_vs_wind_curve(sp, reference_tree(), at_wind(40.0));
  r.expect_true(c.size() == 12, "wind: 12 points");
  if (c.size() != 12) return;

  const auto vf = wind_to_failure(sp, reference_tree(), at_wind(40.0));
  r.expect_near(c.points.front().x, 20.0, 1e-12, "wind: starts at 0.5 V");
  r.expect_true(vf.has_value(), "wind: V_fail present");
  if (vf) r.expect_near(c.points.back().x, std::fmax(72.0, *vf * 1.1), 1e-12, "wind: ends at max(1.8 V, 1.1 V_fail)");
  r.expect_true(strictly_decreasing(c), "wind: SF strictly decreases");
  r.expect_true(c.points.back().y < 1.0, "wind: sweep reaches failure");

  const Curve low = sf_vs_wind_curve(sp, reference_tree(), at_wind(6.0));
  r.expect_true(!low.empty() && low.points.front().x == 5.0, "wind: floor at 5 m/s");

  const Curve calm = sf_vs_wind_curve(sp, reference_tree(), at_wind(0.0));
  r.expect_true(calm.size() == 12, "wind: zero design wind still 12 points");
  if (calm.size() == 12) {
    r.expect_near(calm.points.front().x, 5.0, 1e-12, "wind: zero design wind starts at 5");
    r.expect_near(calm.points.back().x, 10.0, 1e-12, "wind: empty range widened by 5 m/s");
  }

  TreeGeometry broken = reference_tree();
  broken.dbh_cm = 0.0;
  r.expect_true(sf_vs_wind_curve(sp, broken, at_wind(40.0)).empty(), "wind: invalid inputs -> empty");
}

void test_reduction_curve(Report& r) {
  const SpeciesProfile sp = typical_species();

  const Curve def = sf_vs_reduction_curve(sp, reference_tree(), at_wind(40.0), PruningRequest{0.0, 0.0});
  r.expect_true(def.size() == 9, "reduction: 9 points");
  if (!def.empty()) {
    r.expect_near(def.points.back().x, 10.0, 1e-12, "reduction: default span 10%");
    r.expect_near(def.points.front().x, 0.0, 1e-12, "reduction: starts at 0%");
  }
  r.expect_true(strictly_increasing(def), "reduction: SF rises with reduction");

  const Curve wide = sf_vs_reduction_curve(sp, reference_tree(), at_wind(40.0), PruningRequest{60.0, 0.0});
  r.expect_true(!wide.empty() && wide.points.back().x == 40.0, "reduction: span capped at 40%");
  const Curve narrow = sf_vs_reduction_curve(sp, reference_tree(), at_wind(40.0), PruningRequest{2.0, 0.0});
  r.expect_true(!narrow.empty() && narrow.points.back().x == 5.0, "reduction: span at least 5%");
  const Curve chosen = sf_vs_reduction_curve(sp, reference_tree(), at_wind(40.0), PruningRequest{25.0, 10.0});
  r.expect_true(!chosen.empty() && chosen.points.back().x == 25.0, "reduction: span follows chosen reduction");

  // Point y values are the pruning scenario's after SF.
  if (!chosen.empty()) {
    const PruningScenarioResult p =
        pruning_scenario(sp, reference_tree(), at_wind(40.0), PruningRequest{chosen.points.back().x, 10.0});
    r.expect_true(chosen.points.back().y == p.after.safety_factor, "reduction: y = pruning after SF");
  }
}

void test_residual_curve(Report& r) {
  const SpeciesProfile sp = typical_species();
  TreeGeometry g = reference_tree();
  g.cavity_inner_diameter_cm = 30.0;

  const Curve c = sf_vs_residual_wall_curve(sp, g, at_wind(40.0));
  r.expect_true(c.size() == 9, "residual: 9 points");
  if (c.size() != 9) return;
  r.expect_near(c.points.front().x, 20.0, 1e-12, "residual: starts at 20%");
  r.expect_near(c.points[1].x, 30.0, 1e-12, "residual: 10% steps");
  r.expect_near(c.points.back().x, 100.0, 1e-12, "residual: ends at 100%");
  r.expect_true(strictly_increasing(c), "residual: SF rises with wall");

  const double solid = evaluate(sp, reference_tree(), at_wind(40.0)).safety_factor;
  r.expect_true(c.points.back().y == solid, "residual: 100% equals the solid stem");
}

void test_regional(Report& r) {
  const SpeciesProfile sp = typical_species();
  const auto rows = regional_comparison(sp, reference_tree(), at_wind(40.0));
  r.expect_true(rows.size() == 5, "regional: five regions");
  if (rows.size() != 5) return;
  r.expect_true(rows[0].label == "Region A (32)" && rows[4].label == "Cyclone (69)", "regional: labels in order");
  const double sf40 = evaluate(sp, reference_tree(), at_wind(40.0)).safety_factor;
  r.expect_true(rows[1].wind_speed_m_s == 40.0 && rows[1].safety_factor == sf40, "regional: B matches direct SF");
  r.expect_true(rows[4].safety_factor < rows[0].safety_factor, "regional: cyclone worse than region A");
}

}  // namespace
}  // namespace arbor

int main() {
  Report r{"scenario_curves"};
  r.run("pruning", arbor::test_pruning);
  r.run("wind_curve", arbor::test_wind_curve);
  r.run("reduction_curve", arbor::test_reduction_curve);
  r.run("residual_curve", arbor::test_residual_curve);
  r.run("regional", arbor::test_regional);
  return r.finish();
}
