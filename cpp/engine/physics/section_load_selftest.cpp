/*
  Section & Load Selftest

  Checks:
    1) Hand calculation for the reference tree (DBH 50 cm, H 18 m, crown 10 m,
       V 40 m/s, fb 35 MPa, Cd 0.25, kA 0.7, fullness 0.9) to 1e-6 relative.
    2) Determinism: identical inputs give bit-identical results.
    3) SF strictly decreases with wind speed and with cavity size.
    4) Cavity >= DBH is capped at 0.99 DBH; negative cavity is solid.
    5) Fullness override is clamped to [0.1, 1.0].
    6) Zero stress gives SF = +inf.
    7) Contract violations throw ValidationError.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <limits>

#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/physics/section_load.hpp"

using arbor::selftest::Report;

namespace arbor {
namespace {

constexpr double kPi = 3.14159265358979323846;

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

void test_reference_case(Report& r) {
  const CalculationResult res = evaluate(typical_species(), reference_tree(), at_wind(40.0));

  const double q = 1.0 * 0.5 * 1.2 * 40.0 * 40.0;
  const double a_plan = kPi * 5.0 * 5.0;
  const double area = a_plan * 0.7 * 0.9;
  const double force = q * 0.25 * area;
  const double moment = force * 0.66 * 18.0;
  const double w = kPi * 0.5 * 0.5 * 0.5 / 32.0;
  const double sigma = moment / w / 1e6;
  const double sf = 35.0 / sigma;

  r.expect_near(res.wind_pressure_Pa, q, 1e-6, "reference: q = 960 Pa");
  r.expect_near(q, 960.0, 1e-12, "reference: hand q");
  r.expect_near(res.crown_plan_area_m2, a_plan, 1e-6, "reference: plan area");
  r.expect_near(res.projected_area_m2, area, 1e-6, "reference: projected area");
  r.expect_near(res.wind_force_N, force, 1e-6, "reference: force");
  r.expect_near(res.lever_arm_m, 11.88, 1e-6, "reference: lever arm 0.66 H");
  r.expect_near(res.bending_moment_Nm, moment, 1e-6, "reference: moment");
  r.expect_near(res.section_modulus_m3, w, 1e-6, "reference: solid W");
  r.expect_near(res.bending_stress_MPa, sigma, 1e-6, "reference: stress");
  r.expect_near(res.safety_factor, sf, 1e-6, "reference: SF");
  r.expect_near(res.effective_strength_MPa, 35.0, 1e-12, "reference: f_eff with k_defect = 1");
  r.expect_true(!res.is_hollow(), "reference: solid section");
}

void test_determinism(Report& r) {
  TreeGeometry g = reference_tree();
  g.cavity_inner_diameter_cm = 30.0;
  LoadScenario sc = at_wind(37.5);
  sc.site_factor = 1.15;
  sc.defect_strength_factor = 0.72;

  const CalculationResult a = evaluate(typical_species(), g, sc);
  const CalculationResult b = evaluate(typical_species(), g, sc);
  r.expect_true(a.wind_pressure_Pa == b.wind_pressure_Pa && a.wind_force_N == b.wind_force_N &&
                    a.bending_moment_Nm == b.bending_moment_Nm && a.bending_stress_MPa == b.bending_stress_MPa &&
                    a.safety_factor == b.safety_factor,
                "determinism: repeated evaluate is bit-identical");
}

void test_monotonic_wind(Report& r) {
  double prev = std::numeric_limits<double>::infinity();
  bool strictly = true;
  for (double v = 5.0; v <= 90.0; v += 2.5) {
    const double sf = evaluate(typical_species(), reference_tree(), at_wind(v)).safety_factor;
    if (!(sf < prev)) strictly = false;
    prev = sf;
  }
  r.expect_true(strictly, "monotonic: SF strictly decreases as wind rises");

  // Stress scales with V^2.
  const double sf20 = evaluate(typical_species(), reference_tree(), at_wind(20.0)).safety_factor;
  const double sf40 = evaluate(typical_species(), reference_tree(), at_wind(40.0)).safety_factor;
  r.expect_near(sf20 / sf40, 4.0, 1e-9, "monotonic: doubling wind quarters SF");
}

void test_monotonic_cavity(Report& r) {
  double prev = std::numeric_limits<double>::infinity();
  bool strictly = true;
  for (double cav = 0.0; cav <= 48.0; cav += 4.0) {
    TreeGeometry g = reference_tree();
    if (cav > 0.0) g.cavity_inner_diameter_cm = cav;
    const double sf = evaluate(typical_species(), g, at_wind(40.0)).safety_factor;
    if (!(sf < prev)) strictly = false;
    prev = sf;
  }
  r.expect_true(strictly, "monotonic: SF strictly decreases as cavity grows");
}

void test_cavity_cap(Report& r) {
  const LoadModelSettings& load = EngineSettings::defaults().load;
  r.expect_near(resolve_inner_diameter_m(50.0, 50.0, load), 0.495, 1e-12, "cavity: == DBH capped to 0.99 DBH");
  r.expect_near(resolve_inner_diameter_m(50.0, 80.0, load), 0.495, 1e-12, "cavity: > DBH capped to 0.99 DBH");
  r.expect_near(resolve_inner_diameter_m(50.0, 30.0, load), 0.30, 1e-12, "cavity: below DBH used as-is");
  r.expect_true(resolve_inner_diameter_m(50.0, -5.0, load) == 0.0, "cavity: negative treated as none");
  r.expect_true(resolve_inner_diameter_m(50.0, std::nullopt, load) == 0.0, "cavity: absent treated as none");

  TreeGeometry g = reference_tree();
  g.cavity_inner_diameter_cm = 120.0;
  const CalculationResult res = evaluate(typical_species(), g, at_wind(40.0));
  r.expect_true(res.is_hollow() && res.inner_diameter_m < res.outer_diameter_m, "cavity: capped inner < outer");
  r.expect_true(std::isfinite(res.safety_factor) && res.safety_factor > 0.0, "cavity: capped section gives finite SF");
  const double w = kPi * (std::pow(0.5, 4) - std::pow(0.495, 4)) / (32.0 * 0.5);
  r.expect_near(res.section_modulus_m3, w, 1e-9, "cavity: hollow W formula");

  TreeGeometry neg = reference_tree();
  neg.cavity_inner_diameter_cm = -10.0;
  const CalculationResult solid = evaluate(typical_species(), reference_tree(), at_wind(40.0));
  const CalculationResult negr = evaluate(typical_species(), neg, at_wind(40.0));
  r.expect_true(negr.safety_factor == solid.safety_factor, "cavity: negative equals solid result");
}

void test_fullness_clamp(Report& r) {
  const SpeciesProfile sp = typical_species();
  const LoadModelSettings& load = EngineSettings::defaults().load;
  r.expect_near(effective_fullness(sp, std::nullopt, load), 0.9, 1e-12, "fullness: species default");
  r.expect_near(effective_fullness(sp, 0.55, load), 0.55, 1e-12, "fullness: in-range override");
  r.expect_near(effective_fullness(sp, 1.7, load), 1.0, 1e-12, "fullness: above range -> 1.0");
  r.expect_near(effective_fullness(sp, 0.0, load), 0.1, 1e-12, "fullness: zero -> 0.1");
  r.expect_near(effective_fullness(sp, -2.0, load), 0.1, 1e-12, "fullness: negative -> 0.1");

  LoadScenario sc = at_wind(40.0);
  sc.fullness_override = 3.0;
  r.expect_near(evaluate(sp, reference_tree(), sc).fullness_used, 1.0, 1e-12, "fullness: evaluate uses clamp");
}

void test_infinite_sf(Report& r) {
  const CalculationResult calm = evaluate(typical_species(), reference_tree(), at_wind(0.0));
  r.expect_true(std::isinf(calm.safety_factor) && calm.safety_factor > 0.0, "infinite: zero wind -> SF +inf");

  LoadScenario sc = at_wind(40.0);
  sc.site_factor = 0.0;
  r.expect_true(std::isinf(evaluate(typical_species(), reference_tree(), sc).safety_factor),
                "infinite: zero site factor -> SF +inf");

  TreeGeometry bare = reference_tree();
  bare.crown_diameter_m = 0.0;
  r.expect_true(std::isinf(evaluate(typical_species(), bare, at_wind(40.0)).safety_factor),
                "infinite: zero crown -> SF +inf");
}

void test_defect_scaling(Report& r) {
  LoadScenario sc = at_wind(40.0);
  const double base = evaluate(typical_species(), reference_tree(), sc).safety_factor;
  sc.defect_strength_factor = 0.6;
  const double reduced = evaluate(typical_species(), reference_tree(), sc).safety_factor;
  r.expect_near(reduced, base * 0.6, 1e-12, "defect: SF scales with k_defect");

  sc = at_wind(40.0);
  sc.site_factor = 1.2;
  const double exposed = evaluate(typical_species(), reference_tree(), sc).safety_factor;
  r.expect_near(exposed, base / 1.2, 1e-12, "site factor: SF scales with 1/siteFactor");
}

void test_contract(Report& r) {
  const SpeciesProfile sp = typical_species();
  r.expect_throws<ValidationError>(
      [&] {
        TreeGeometry g = reference_tree();
        g.dbh_cm = 0.0;
        (void)evaluate(sp, g, at_wind(40.0));
      },
      "contract: DBH 0 throws");
  r.expect_throws<ValidationError>(
      [&] { (void)evaluate(sp, reference_tree(), at_wind(std::nan(""))); },
      "contract: NaN wind throws");
  r.expect_throws<ValidationError>(
      [&] {
        LoadScenario sc = at_wind(40.0);
        sc.defect_strength_factor = 0.0;
        (void)evaluate(sp, reference_tree(), sc);
      },
      "contract: k_defect 0 throws");
  r.expect_throws<ValidationError>(
      [&] {
        SpeciesProfile bad = sp;
        bad.drag_coefficient = -1.0;
        (void)evaluate(bad, reference_tree(), at_wind(40.0));
      },
      "contract: negative Cd throws");

  TreeGeometry g = reference_tree();
  g.height_m = -1.0;
  r.expect_true(!is_evaluable(sp, g, at_wind(40.0)), "contract: is_evaluable rejects negative height");
  r.expect_true(is_evaluable(sp, reference_tree(), at_wind(40.0)), "contract: is_evaluable accepts reference");
}

}  // namespace
}  // namespace arbor

int main() {
  Report r{"section_load"};
  r.run("reference", arbor::test_reference_case);
  r.run("determinism", arbor::test_determinism);
  r.run("monotonic_wind", arbor::test_monotonic_wind);
  r.run("monotonic_cavity", arbor::test_monotonic_cavity);
  r.run("cavity_cap", arbor::test_cavity_cap);
  r.run("fullness_clamp", arbor::test_fullness_clamp);
  r.run("infinite_sf", arbor::test_infinite_sf);
  r.run("defect_scaling", arbor::test_defect_scaling);
  r.run("contract", arbor::test_contract);
  return r.finish();
}
