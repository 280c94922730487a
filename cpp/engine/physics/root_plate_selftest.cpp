/*
  Root Plate Selftest

  Checks:
    1) Baseline (clay loam, moist, upright) -> 1.0, Low risk.
    2) Soil / moisture / lean / restriction tables.
    3) Severed roots and plate dimension terms.
    4) Clamp to [0.2, 1.1] and rating bands.

  Non-zero return code indicates failure.
*/

#include "engine/core/selftest.hpp"
#include "engine/physics/root_plate.hpp"

using arbor::selftest::Report;

namespace arbor {
namespace {

void test_baseline(Report& r) {
  const double f = compose_root_plate_stability(RootPlateObservations{});
  r.expect_near(f, 1.0, 1e-12, "baseline: 1.0");
  r.expect_true(root_plate_risk(f) == RootPlateRisk::Low, "baseline: Low risk");
}

void test_tables(Report& r) {
  RootPlateObservations o;
  o.soil = SoilType::Rocky;
  o.moisture = SoilMoisture::Dry;
  r.expect_near(compose_root_plate_stability(o), 1.1, 1e-12,
                "soil: rocky + dry clamps at 1.1");

  o = RootPlateObservations{};
  o.soil = SoilType::Sandy;
  o.moisture = SoilMoisture::Wet;
  r.expect_near(compose_root_plate_stability(o), 0.85 * 0.85, 1e-12, "soil: sandy + wet");

  r.expect_near(lean_factor(0.0), 1.0, 1e-12, "lean: 0 deg none");
  r.expect_near(lean_factor(5.0), 0.95, 1e-12, "lean: 5 deg");
  r.expect_near(lean_factor(10.0), 0.85, 1e-12, "lean: 10 deg");
  r.expect_near(lean_factor(15.0), 0.70, 1e-12, "lean: 15 deg");
  r.expect_near(lean_factor(15.1), 0.50, 1e-12, "lean: > 15 deg");
  r.expect_near(lean_factor(-4.0), 1.0, 1e-12, "lean: negative ignored");

  r.expect_near(restriction_factor(RootZoneRestriction::Excavation), 0.65, 1e-12, "restriction: excavation");
  r.expect_near(restriction_factor(RootZoneRestriction::None), 1.0, 1e-12, "restriction: none");

  o = RootPlateObservations{};
  o.recent_lean_change = true;
  o.heaving_or_cracking = true;
  o.root_decay = true;
  r.expect_near(compose_root_plate_stability(o), 0.70 * 0.60 * 0.75, 1e-12, "flags: lean change, heaving, decay");
}

void test_roots_and_dimensions(Report& r) {
  RootPlateObservations o;
  o.severed_roots_pct = 25.0;
  r.expect_near(compose_root_plate_stability(o), 0.8, 1e-12, "severed: 25% -> 0.8");
  o.severed_roots_pct = 100.0;
  r.expect_near(compose_root_plate_stability(o), 0.3, 1e-12, "severed: clamps at 0.3");

  // DBH 40 cm -> expected radius 1.4 m.
  o = RootPlateObservations{};
  o.plate_radius_m = 0.9;
  r.expect_near(compose_root_plate_stability(o, 40.0), 0.75, 1e-12, "radius: ratio < 0.7");
  o.plate_radius_m = 1.2;
  r.expect_near(compose_root_plate_stability(o, 40.0), 0.90, 1e-12, "radius: ratio < 0.9");
  o.plate_radius_m = 1.4;
  r.expect_near(compose_root_plate_stability(o, 40.0), 1.0, 1e-12, "radius: full size");
  o.plate_radius_m = 0.5;
  r.expect_near(compose_root_plate_stability(o), 1.0, 1e-12, "radius: skipped without DBH");

  o = RootPlateObservations{};
  o.plate_depth_m = 0.25;
  r.expect_near(compose_root_plate_stability(o), 0.70, 1e-12, "depth: < 0.3 m");
  o.plate_depth_m = 0.45;
  r.expect_near(compose_root_plate_stability(o), 0.85, 1e-12, "depth: < 0.5 m");
  o.plate_depth_m = 0.8;
  r.expect_near(compose_root_plate_stability(o), 1.0, 1e-12, "depth: deep plate");
}

void test_clamp_and_rating(Report& r) {
  RootPlateObservations o;
  o.soil = SoilType::Organic;
  o.moisture = SoilMoisture::Waterlogged;
  o.lean_deg = 30.0;
  o.recent_lean_change = true;
  o.heaving_or_cracking = true;
  o.root_decay = true;
  o.severed_roots_pct = 90.0;
  o.restriction = RootZoneRestriction::Excavation;
  o.plate_depth_m = 0.1;
  const double f = compose_root_plate_stability(o, 60.0);
  r.expect_near(f, 0.2, 1e-12, "clamp: worst case floors at 0.2");
  r.expect_true(root_plate_risk(f) == RootPlateRisk::Critical, "rating: floor is Critical");

  r.expect_true(root_plate_risk(0.9) == RootPlateRisk::Low, "rating: 0.9 Low");
  r.expect_true(root_plate_risk(0.89) == RootPlateRisk::Moderate, "rating: 0.89 Moderate");
  r.expect_true(root_plate_risk(0.7) == RootPlateRisk::Moderate, "rating: 0.7 Moderate");
  r.expect_true(root_plate_risk(0.5) == RootPlateRisk::High, "rating: 0.5 High");
  r.expect_true(root_plate_risk(0.49) == RootPlateRisk::Critical, "rating: 0.49 Critical");

  r.expect_true(parse_soil_type(to_string(SoilType::ClayLoam)) == SoilType::ClayLoam, "parse: clay_loam");
  r.expect_true(parse_soil_moisture("waterlogged") == SoilMoisture::Waterlogged, "parse: waterlogged");
  r.expect_true(!parse_root_zone_restriction("fence").has_value(), "parse: unknown restriction");
}

}  // namespace
}  // namespace arbor

int main() {
  Report r{"root_plate"};
  r.run("baseline", arbor::test_baseline);
  r.run("tables", arbor::test_tables);
  r.run("roots_and_dimensions", arbor::test_roots_and_dimensions);
  r.run("clamp_and_rating", arbor::test_clamp_and_rating);
  return r.finish();
}
