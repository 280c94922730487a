#include "engine/analysis/input_validation.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/numeric.hpp"
#include "engine/core/units.hpp"

#include <algorithm>

namespace arbor {

namespace {

bool present_positive(const std::optional<double>& v) noexcept {
  return is_finite(v) && *v > 0.0;
}

bool present(const std::optional<double>& v) noexcept {
  return is_finite(v);
}

}  // namespace

std::vector<ValidationIssue> validate_inputs(const RawTreeInputs& in) {
  std::vector<ValidationIssue> issues;
  issues.reserve(8);

  // ---- Required, strictly positive
  if (!present_positive(in.dbh_cm)) {
    issues.push_back(make_input_error("input.dbh.not_positive",
                                      "DBH must be greater than zero.",
                                      "geometry.dbh_cm"));
  }
  if (!present_positive(in.height_m)) {
    issues.push_back(make_input_error("input.height.not_positive",
                                      "Height must be greater than zero.",
                                      "geometry.height_m"));
  }
  if (!present_positive(in.crown_diameter_m)) {
    issues.push_back(make_input_error("input.crown.not_positive",
                                      "Crown diameter must be greater than zero.",
                                      "geometry.crown_diameter_m"));
  }
  if (!present_positive(in.design_wind_speed_m_s)) {
    issues.push_back(make_input_error("input.wind.not_positive",
                                      "Design wind speed must be greater than zero.",
                                      "scenario.design_wind_speed_m_s"));
  }

  // ---- Advisory
  if (present(in.design_wind_speed_m_s) && *in.design_wind_speed_m_s > kImplausibleWindSpeed_m_s) {
    issues.push_back(make_input_warning(
        "input.wind.implausible",
        "Design wind speed above 80 m/s (~288 km/h) is likely unrealistic for most sites.",
        "scenario.design_wind_speed_m_s"));
  }

  if (present(in.cavity_inner_diameter_cm) && *in.cavity_inner_diameter_cm < 0.0) {
    issues.push_back(make_input_warning(
        "input.cavity.negative",
        "Cavity inner diameter cannot be negative. It will be treated as zero.",
        "geometry.cavity_inner_diameter_cm"));
  }

  if (present_positive(in.dbh_cm) && present(in.cavity_inner_diameter_cm) &&
      *in.cavity_inner_diameter_cm >= *in.dbh_cm) {
    issues.push_back(make_input_warning(
        "input.cavity.capped",
        "Cavity inner diameter is equal to or greater than DBH. It will be capped at 99% of DBH for calculations.",
        "geometry.cavity_inner_diameter_cm"));
  }

  if (present(in.dbh_cm) && present_positive(in.height_m) &&
      *in.height_m < 2.0 * (*in.dbh_cm * units::cm_to_m)) {
    issues.push_back(make_input_warning(
        "input.geometry.slenderness",
        "Height is very low relative to stem diameter; geometry may be atypical.",
        "geometry.height_m"));
  }

  if (present(in.height_m) && present(in.crown_diameter_m) &&
      *in.crown_diameter_m > 2.0 * *in.height_m) {
    issues.push_back(make_input_warning(
        "input.geometry.crown_ratio",
        "Crown diameter is very large relative to height; check measurements.",
        "geometry.crown_diameter_m"));
  }

  return issues;
}

std::vector<ValidationIssue> post_calculation_warnings(const CalculationResult& r,
                                                       const PostCheckSettings& s) {
  std::vector<ValidationIssue> issues;
  if (is_finite(r.safety_factor) && r.safety_factor > s.high_sf_warning) {
    issues.push_back(make_input_warning(
        "result.sf.unusually_high",
        "Unusually high safety factor; check that inputs and presets are realistic.",
        "result.safety_factor"));
  }
  return issues;
}

bool has_blocking_error(const std::vector<ValidationIssue>& issues) noexcept {
  return std::any_of(issues.begin(), issues.end(), [](const ValidationIssue& i) { return i.is_error; });
}

std::size_t count_errors(const std::vector<ValidationIssue>& issues) noexcept {
  return static_cast<std::size_t>(
      std::count_if(issues.begin(), issues.end(), [](const ValidationIssue& i) { return i.is_error; }));
}

std::size_t count_warnings(const std::vector<ValidationIssue>& issues) noexcept {
  return issues.size() - count_errors(issues);
}

TreeGeometry to_geometry(const RawTreeInputs& in) {
  ARBOR_REQUIRE(present_positive(in.dbh_cm), "geometry.dbh_cm", "to_geometry: DBH missing or <= 0");
  ARBOR_REQUIRE(present_positive(in.height_m), "geometry.height_m", "to_geometry: height missing or <= 0");
  ARBOR_REQUIRE(present_positive(in.crown_diameter_m), "geometry.crown_diameter_m",
                "to_geometry: crown diameter missing or <= 0");

  TreeGeometry g;
  g.dbh_cm = *in.dbh_cm;
  g.height_m = *in.height_m;
  g.crown_diameter_m = *in.crown_diameter_m;
  if (present(in.cavity_inner_diameter_cm)) g.cavity_inner_diameter_cm = *in.cavity_inner_diameter_cm;
  return g;
}

}  // namespace arbor
