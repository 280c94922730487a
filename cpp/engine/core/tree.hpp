#pragma once
/*
================================================================================
Core: Tree / Load Schema
FILE: cpp/engine/core/tree.hpp

Purpose:
  - Value types passed into and returned from the statics engine.
  - All are plain aggregates with explicit units in the field names; nothing
    here owns resources or holds identity beyond its field values.

Units:
  - *_cm for stem diameters, *_m for lengths, *_m_s for wind speed,
    *_Pa, *_N, *_Nm, *_MPa for loads and stresses.

Infinite safety factor:
  - CalculationResult::safety_factor == +inf when bending stress <= 0 (e.g.
    zero wind). That is a valid result; consumers must special-case it.
================================================================================
*/

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

// Per-call tree measurements.
struct TreeGeometry {
  double dbh_cm = 0.0;
  double height_m = 0.0;
  double crown_diameter_m = 0.0;

  // Inner diameter of a modelled central cavity at the assessment section.
  // Absent or <= 0 means a solid stem.
  std::optional<double> cavity_inner_diameter_cm;
};

struct LoadScenario {
  double design_wind_speed_m_s = 0.0;
  double site_factor = 1.0;

  // Overrides the species default fullness; clamped to [0.1, 1.0] either way.
  std::optional<double> fullness_override;

  // k_defect in (0, 1]; 1.0 = no observed defects.
  double defect_strength_factor = 1.0;
};

struct CalculationResult {
  double wind_pressure_Pa = 0.0;
  double wind_force_N = 0.0;
  double bending_moment_Nm = 0.0;
  double bending_stress_MPa = 0.0;
  double safety_factor = 0.0;

  // Breakdown of the hand calculation.
  double outer_diameter_m = 0.0;
  double inner_diameter_m = 0.0;
  double fullness_used = 0.0;
  double crown_plan_area_m2 = 0.0;
  double projected_area_m2 = 0.0;
  double lever_arm_m = 0.0;
  double section_modulus_m3 = 0.0;
  double effective_strength_MPa = 0.0;

  bool is_hollow() const noexcept { return inner_diameter_m > 0.0; }
};

// Before/after pair for a crown reduction, with the inputs used on each side.
struct PruningScenarioResult {
  CalculationResult before;
  CalculationResult after;
  double crown_diameter_before_m = 0.0;
  double crown_diameter_after_m = 0.0;
  double fullness_before = 0.0;
  double fullness_after = 0.0;
};

struct CurvePoint {
  double x = 0.0;
  double y = 0.0;
};

// Paired (x, y) sequence for downstream charts. x is strictly increasing.
struct Curve {
  std::string x_label;
  std::string y_label;
  std::vector<CurvePoint> points;

  bool empty() const noexcept { return points.empty(); }
  std::size_t size() const noexcept { return points.size(); }
};

}  // namespace arbor
