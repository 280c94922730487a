/*
  Defect Strength Selftest

  Checks:
    1) No observations -> 1.0.
    2) Individual factors and the fruiting body bands.
    3) Decay qualifiers apply only when fungi / cavity decay / basal decay.
    4) Extent, resonance and decay column terms (incl. 15 m fallback).
    5) Any combination stays within [0.20, 1.00].
    6) Enum spelling round-trips through parse_*.

  Non-zero return code indicates failure.
*/

#include <cmath>

#include "engine/core/selftest.hpp"
#include "engine/physics/defect_strength.hpp"

using arbor::selftest::Report;

namespace arbor {
namespace {

void test_no_defects(Report& r) {
  r.expect_near(compose_defect_strength_factor(DefectObservations{}), 1.0, 1e-12, "none: k = 1");

  // Qualifiers alone do nothing without a decay indicator.
  DefectObservations o;
  o.decay_type = DecayType::BrownRot;
  o.decay_location = DecayLocation::RootPlate;
  o.decay_severity = DecaySeverity::Extensive;
  r.expect_near(compose_defect_strength_factor(o), 1.0, 1e-12, "gate: qualifiers ignored without decay");
}

void test_single_factors(Report& r) {
  DefectObservations o;
  o.cracks = true;
  r.expect_near(compose_defect_strength_factor(o), 0.85, 1e-12, "single: cracks 0.85");

  o = DefectObservations{};
  o.weak_union = true;
  r.expect_near(compose_defect_strength_factor(o), 0.85, 1e-12, "single: weak union 0.85");

  r.expect_near(fruiting_body_factor(0), 0.85, 1e-12, "fungi: 0 bodies -> 0.85");
  r.expect_near(fruiting_body_factor(1), 0.85, 1e-12, "fungi: 1 body -> 0.85");
  r.expect_near(fruiting_body_factor(3), 0.75, 1e-12, "fungi: 3 bodies -> 0.75");
  r.expect_near(fruiting_body_factor(5), 0.65, 1e-12, "fungi: 5 bodies -> 0.65");
  r.expect_near(fruiting_body_factor(6), 0.55, 1e-12, "fungi: 6 bodies -> 0.55");
}

void test_decay_gate(Report& r) {
  // Cavity decay with default qualifiers: unknown 0.90, stem base 0.90, moderate 0.85.
  DefectObservations o;
  o.cavity_decay = true;
  r.expect_near(compose_defect_strength_factor(o), 0.80 * 0.90 * 0.90 * 0.85, 1e-12,
                "gate: cavity decay with default qualifiers");

  o = DefectObservations{};
  o.bracket_fungi = true;
  o.fruiting_body_count = 2;
  o.decay_type = DecayType::WhiteRot;
  o.decay_location = DecayLocation::UpperStem;
  o.decay_severity = DecaySeverity::Minor;
  r.expect_near(compose_defect_strength_factor(o), 0.75 * 0.85 * 1.0 * 0.95, 1e-12,
                "gate: fungi with white rot / upper stem / minor");

  o = DefectObservations{};
  o.basal_decay = true;
  o.decay_type = DecayType::SoftRot;
  o.decay_location = DecayLocation::MidStem;
  o.decay_severity = DecaySeverity::Moderate;
  r.expect_near(compose_defect_strength_factor(o), 0.75 * 0.90 * 0.95 * 0.85, 1e-12,
                "gate: basal decay with soft rot / mid stem");
}

void test_ungated_terms(Report& r) {
  DefectObservations o;
  o.decay_extent_pct = 50.0;
  r.expect_near(compose_defect_strength_factor(o), 0.8, 1e-12, "extent: 50% -> 0.8");
  o.decay_extent_pct = 100.0;
  r.expect_near(compose_defect_strength_factor(o), 0.6, 1e-12, "extent: 100% -> 0.6");
  o.decay_extent_pct = 400.0;
  r.expect_near(compose_defect_strength_factor(o), 0.4, 1e-12, "extent: clamps at 0.4");
  o.decay_extent_pct = -20.0;
  r.expect_near(compose_defect_strength_factor(o), 1.0, 1e-12, "extent: negative ignored");

  o = DefectObservations{};
  o.resonance = ResonanceResult::Drum;
  r.expect_near(compose_defect_strength_factor(o), 0.90, 1e-12, "resonance: drum 0.90");
  o.resonance = ResonanceResult::Hollow;
  r.expect_near(compose_defect_strength_factor(o), 0.75, 1e-12, "resonance: hollow 0.75");
  o.resonance = ResonanceResult::Solid;
  r.expect_near(compose_defect_strength_factor(o), 1.0, 1e-12, "resonance: solid no effect");

  o = DefectObservations{};
  o.decay_column_height_m = 5.0;
  r.expect_near(compose_defect_strength_factor(o, 20.0), 1.0 - 0.25 * 0.3, 1e-12, "column: 5 m of 20 m");
  r.expect_near(compose_defect_strength_factor(o, std::nullopt), 1.0 - (5.0 / 15.0) * 0.3, 1e-12,
                "column: missing height falls back to 15 m");
  o.decay_column_height_m = 40.0;
  r.expect_near(compose_defect_strength_factor(o, 20.0), 0.7, 1e-12, "column: ratio capped at 1");
  o.decay_column_height_m = 0.0;
  r.expect_near(compose_defect_strength_factor(o, 20.0), 1.0, 1e-12, "column: zero ignored");
}

void test_bounds(Report& r) {
  bool in_bounds = true;
  double lowest = 1.0;
  for (int mask = 0; mask < 32; ++mask) {
    for (int fungi : {0, 2, 4, 9}) {
      for (int sev = 0; sev < 4; ++sev) {
        for (int res = 0; res < 4; ++res) {
          for (double extent : {0.0, 35.0, 100.0}) {
            DefectObservations o;
            o.bracket_fungi = (mask & 1) != 0;
            o.fruiting_body_count = fungi;
            o.cavity_decay = (mask & 2) != 0;
            o.cracks = (mask & 4) != 0;
            o.basal_decay = (mask & 8) != 0;
            o.weak_union = (mask & 16) != 0;
            o.decay_type = DecayType::BrownRot;
            o.decay_location = DecayLocation::RootPlate;
            o.decay_severity = static_cast<DecaySeverity>(sev);
            o.resonance = static_cast<ResonanceResult>(res);
            o.decay_extent_pct = extent;
            o.decay_column_height_m = 12.0;
            const double k = compose_defect_strength_factor(o, 18.0);
            if (!(k >= kDefectFactorMin && k <= kDefectFactorMax)) in_bounds = false;
            lowest = std::fmin(lowest, k);
          }
        }
      }
    }
  }
  r.expect_true(in_bounds, "bounds: every combination within [0.20, 1.00]");
  r.expect_near(lowest, 0.20, 1e-12, "bounds: heavy stacking hits the 0.20 floor");
}

void test_parse(Report& r) {
  bool ok = true;
  for (auto t : {DecayType::Unknown, DecayType::WhiteRot, DecayType::BrownRot, DecayType::SoftRot}) {
    ok = ok && parse_decay_type(to_string(t)) == t;
  }
  for (auto l : {DecayLocation::RootPlate, DecayLocation::StemBase, DecayLocation::MidStem, DecayLocation::UpperStem}) {
    ok = ok && parse_decay_location(to_string(l)) == l;
  }
  for (auto s : {DecaySeverity::Minor, DecaySeverity::Moderate, DecaySeverity::Severe, DecaySeverity::Extensive}) {
    ok = ok && parse_decay_severity(to_string(s)) == s;
  }
  for (auto x : {ResonanceResult::NotDone, ResonanceResult::Solid, ResonanceResult::Drum, ResonanceResult::Hollow}) {
    ok = ok && parse_resonance(to_string(x)) == x;
  }
  r.expect_true(ok, "parse: to_string spellings parse back");
  r.expect_true(!parse_decay_type("White Rot").has_value(), "parse: unknown spelling rejected");
}

}  // namespace
}  // namespace arbor

int main() {
  Report r{"defect_strength"};
  r.run("no_defects", arbor::test_no_defects);
  r.run("single_factors", arbor::test_single_factors);
  r.run("decay_gate", arbor::test_decay_gate);
  r.run("ungated_terms", arbor::test_ungated_terms);
  r.run("bounds", arbor::test_bounds);
  r.run("parse", arbor::test_parse);
  return r.finish();
}
