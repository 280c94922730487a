#pragma once
/*
================================================================================
Analysis: Input Validation (Blocking Errors vs Advisory Warnings)
FILE: cpp/engine/analysis/input_validation.hpp

Purpose:
  - Range/sanity checks on raw measurements before any calculation.
  - Produces an ordered list of ValidationIssue. Errors block calculation,
    warnings never do.

Design rules:
  - Each rule is independent; one input can trigger several issues.
  - Missing (nullopt) or non-finite required values are errors.
  - Pure function: no logging, no state.
  - Every issue carries a stable machine code ("input.dbh.not_positive", ...) and the
    field it refers to, so UIs can highlight the field without string matching.
================================================================================
*/

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/core/tree.hpp"

namespace arbor {

struct ValidationIssue {
  std::string code;     // stable, e.g. "input.cavity.capped"
  std::string message;  // human readable
  std::string field;    // e.g. "geometry.cavity_inner_diameter_cm"
  bool is_error = false;
};

inline ValidationIssue make_input_error(std::string code, std::string message, std::string field) {
  return ValidationIssue{std::move(code), std::move(message), std::move(field), true};
}

inline ValidationIssue make_input_warning(std::string code, std::string message, std::string field) {
  return ValidationIssue{std::move(code), std::move(message), std::move(field), false};
}

// Raw form values; any may be absent.
struct RawTreeInputs {
  std::optional<double> dbh_cm;
  std::optional<double> height_m;
  std::optional<double> crown_diameter_m;
  std::optional<double> design_wind_speed_m_s;
  std::optional<double> cavity_inner_diameter_cm;
};

// Wind speed above this is flagged as implausible for most sites.
inline constexpr double kImplausibleWindSpeed_m_s = 80.0;

std::vector<ValidationIssue> validate_inputs(const RawTreeInputs& in);

// Checks applied to a finished calculation (e.g. suspiciously high SF).
std::vector<ValidationIssue> post_calculation_warnings(const CalculationResult& r,
                                                       const PostCheckSettings& s = EngineSettings::defaults().post);

bool has_blocking_error(const std::vector<ValidationIssue>& issues) noexcept;

std::size_t count_errors(const std::vector<ValidationIssue>& issues) noexcept;
std::size_t count_warnings(const std::vector<ValidationIssue>& issues) noexcept;

// Builds the engine geometry from validated raw inputs.
// Precondition: !has_blocking_error(validate_inputs(in)); throws ValidationError otherwise.
TreeGeometry to_geometry(const RawTreeInputs& in);

}  // namespace arbor
