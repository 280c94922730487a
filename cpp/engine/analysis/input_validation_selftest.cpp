/*
  Input Validation Selftest

  Checks:
    1) Clean inputs -> no issues.
    2) Each required field missing / zero / non-finite -> its own error.
    3) Advisory rules fire independently and never block.
    4) Post-calculation high-SF warning (finite only).
    5) to_geometry() contract.

  Non-zero return code indicates failure.
*/

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "engine/analysis/input_validation.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"

using arbor::selftest::Report;

namespace arbor {
namespace {

RawTreeInputs clean() {
  RawTreeInputs in;
  in.dbh_cm = 50.0;
  in.height_m = 18.0;
  in.crown_diameter_m = 10.0;
  in.design_wind_speed_m_s = 40.0;
  return in;
}

bool has_code(const std::vector<ValidationIssue>& issues, const std::string& code) {
  return std::any_of(issues.begin(), issues.end(), [&](const ValidationIssue& i) { return i.code == code; });
}

void test_clean(Report& r) {
  const auto issues = validate_inputs(clean());
  r.expect_true(issues.empty(), "clean: no issues");
  r.expect_true(!has_blocking_error(issues), "clean: not blocked");
}

void test_required(Report& r) {
  RawTreeInputs none;
  const auto all = validate_inputs(none);
  r.expect_true(count_errors(all) == 4, "required: all four missing -> four errors");
  r.expect_true(has_code(all, "input.dbh.not_positive") && has_code(all, "input.height.not_positive") &&
                    has_code(all, "input.crown.not_positive") && has_code(all, "input.wind.not_positive"),
                "required: one code per field");

  RawTreeInputs zero = clean();
  zero.dbh_cm = 0.0;
  const auto z = validate_inputs(zero);
  r.expect_true(count_errors(z) == 1 && has_code(z, "input.dbh.not_positive"), "required: DBH 0 is an error");

  RawTreeInputs nan = clean();
  nan.design_wind_speed_m_s = std::numeric_limits<double>::quiet_NaN();
  r.expect_true(has_code(validate_inputs(nan), "input.wind.not_positive"), "required: NaN wind is an error");

  RawTreeInputs neg = clean();
  neg.crown_diameter_m = -2.0;
  const auto n = validate_inputs(neg);
  r.expect_true(has_blocking_error(n), "required: negative crown blocks");
  for (const auto& i : n) {
    if (i.code == "input.crown.not_positive") {
      r.expect_true(i.field == "geometry.crown_diameter_m", "required: error names its field");
    }
  }
}

void test_advisory(Report& r) {
  RawTreeInputs wind = clean();
  wind.design_wind_speed_m_s = 85.0;
  const auto w = validate_inputs(wind);
  r.expect_true(has_code(w, "input.wind.implausible") && !has_blocking_error(w), "advisory: wind > 80 warns only");

  RawTreeInputs edge = clean();
  edge.design_wind_speed_m_s = 80.0;
  r.expect_true(validate_inputs(edge).empty(), "advisory: wind == 80 is fine");

  RawTreeInputs neg = clean();
  neg.cavity_inner_diameter_cm = -3.0;
  r.expect_true(has_code(validate_inputs(neg), "input.cavity.negative"), "advisory: negative cavity warns");

  RawTreeInputs cap = clean();
  cap.cavity_inner_diameter_cm = 50.0;
  const auto c = validate_inputs(cap);
  r.expect_true(has_code(c, "input.cavity.capped") && !has_blocking_error(c), "advisory: cavity >= DBH warns");

  RawTreeInputs squat = clean();
  squat.height_m = 0.9;  // < 2 x 0.5 m
  squat.crown_diameter_m = 1.5;
  r.expect_true(has_code(validate_inputs(squat), "input.geometry.slenderness"), "advisory: squat stem warns");

  RawTreeInputs wide = clean();
  wide.crown_diameter_m = 40.0;  // > 2 x 18 m
  r.expect_true(has_code(validate_inputs(wide), "input.geometry.crown_ratio"), "advisory: wide crown warns");

  // Independent rules stack.
  RawTreeInputs many = clean();
  many.design_wind_speed_m_s = 90.0;
  many.cavity_inner_diameter_cm = 60.0;
  many.crown_diameter_m = 40.0;
  const auto m = validate_inputs(many);
  r.expect_true(count_warnings(m) == 3 && count_errors(m) == 0, "advisory: three independent warnings");
}

void test_post_checks(Report& r) {
  CalculationResult res;
  res.safety_factor = 6.0;
  r.expect_true(has_code(post_calculation_warnings(res), "result.sf.unusually_high"), "post: SF 6 warns");
  res.safety_factor = 5.0;
  r.expect_true(post_calculation_warnings(res).empty(), "post: SF 5 does not warn");
  res.safety_factor = std::numeric_limits<double>::infinity();
  r.expect_true(post_calculation_warnings(res).empty(), "post: infinite SF does not warn");
}

void test_to_geometry(Report& r) {
  RawTreeInputs in = clean();
  in.cavity_inner_diameter_cm = 12.0;
  const TreeGeometry g = to_geometry(in);
  r.expect_true(g.dbh_cm == 50.0 && g.height_m == 18.0 && g.crown_diameter_m == 10.0 &&
                    g.cavity_inner_diameter_cm == 12.0,
                "to_geometry: copies values");

  RawTreeInputs missing = clean();
  missing.height_m.reset();
  r.expect_throws<ValidationError>([&] { (void)to_geometry(missing); }, "to_geometry: missing height throws");
}

}  // namespace
}  // namespace arbor

int main() {
  Report r{"input_validation"};
  r.run("clean", arbor::test_clean);
  r.run("required", arbor::test_required);
  r.run("advisory", arbor::test_advisory);
  r.run("post_checks", arbor::test_post_checks);
  r.run("to_geometry", arbor::test_to_geometry);
  return r.finish();
}
