#include "engine/physics/section_load.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/numeric.hpp"
#include "engine/core/units.hpp"

namespace arbor {

namespace {

bool cavity_ok(const std::optional<double>& cav) noexcept {
  return !cav.has_value() || is_finite(*cav);
}

void validate_inputs(const SpeciesProfile& species,
                     const TreeGeometry& g,
                     const LoadScenario& sc) {
  ARBOR_REQUIRE(is_finite(species.green_bending_strength_MPa) && species.green_bending_strength_MPa > 0.0,
                "species.green_bending_strength_MPa", "evaluate: species strength must be > 0");
  ARBOR_REQUIRE(is_finite(species.drag_coefficient) && species.drag_coefficient > 0.0,
                "species.drag_coefficient", "evaluate: species Cd must be > 0");
  ARBOR_REQUIRE(is_finite(species.crown_shape_factor) && species.crown_shape_factor > 0.0,
                "species.crown_shape_factor", "evaluate: species kA must be > 0");

  ARBOR_REQUIRE(is_finite(g.dbh_cm) && g.dbh_cm > 0.0, "geometry.dbh_cm", "evaluate: DBH must be > 0");
  ARBOR_REQUIRE(is_finite(g.height_m) && g.height_m >= 0.0, "geometry.height_m", "evaluate: height must be >= 0");
  ARBOR_REQUIRE(is_finite(g.crown_diameter_m) && g.crown_diameter_m >= 0.0, "geometry.crown_diameter_m",
                "evaluate: crown diameter must be >= 0");
  ARBOR_REQUIRE(cavity_ok(g.cavity_inner_diameter_cm), "geometry.cavity_inner_diameter_cm",
                "evaluate: cavity diameter must be finite");

  ARBOR_REQUIRE(is_finite(sc.design_wind_speed_m_s) && sc.design_wind_speed_m_s >= 0.0,
                "scenario.design_wind_speed_m_s", "evaluate: wind speed must be >= 0");
  ARBOR_REQUIRE(is_finite(sc.site_factor) && sc.site_factor >= 0.0, "scenario.site_factor",
                "evaluate: site factor must be >= 0");
  ARBOR_REQUIRE(!sc.fullness_override.has_value() || is_finite(*sc.fullness_override),
                "scenario.fullness_override", "evaluate: fullness override must be finite");
  ARBOR_REQUIRE(is_finite(sc.defect_strength_factor) && sc.defect_strength_factor > 0.0 &&
                    sc.defect_strength_factor <= 1.0,
                "scenario.defect_strength_factor", "evaluate: defect strength factor must be in (0,1]");
}

}  // namespace

double wind_pressure_Pa(double wind_speed_m_s, double site_factor, const AirSettings& air) {
  return site_factor * 0.5 * air.rho_kg_m3 * wind_speed_m_s * wind_speed_m_s;
}

double crown_plan_area_m2(double crown_diameter_m) noexcept {
  return units::circle_area_from_diameter(crown_diameter_m);
}

double effective_fullness(const SpeciesProfile& species,
                          const std::optional<double>& fullness_override,
                          const LoadModelSettings& load) noexcept {
  const double base = fullness_override.value_or(species.default_fullness);
  return clamp(base, load.fullness_min, load.fullness_max);
}

double resolve_inner_diameter_m(double dbh_cm,
                                const std::optional<double>& cavity_inner_diameter_cm,
                                const LoadModelSettings& load) noexcept {
  if (!cavity_inner_diameter_cm.has_value()) return 0.0;
  double cav_cm = *cavity_inner_diameter_cm;
  if (!(cav_cm > 0.0)) return 0.0;
  if (cav_cm >= dbh_cm) cav_cm = dbh_cm * load.cavity_cap_ratio;
  return cav_cm * units::cm_to_m;
}

double section_modulus_m3(double outer_m, double inner_m) noexcept {
  if (inner_m > 0.0) {
    return units::kPi * (units::pow4(outer_m) - units::pow4(inner_m)) / (32.0 * outer_m);
  }
  return units::kPi * units::cube(outer_m) / 32.0;
}

CalculationResult evaluate(const SpeciesProfile& species,
                           const TreeGeometry& geometry,
                           const LoadScenario& scenario,
                           const EngineSettings& settings) {
  validate_inputs(species, geometry, scenario);

  CalculationResult r;

  // 1) Section diameters
  r.outer_diameter_m = geometry.dbh_cm * units::cm_to_m;
  r.inner_diameter_m = resolve_inner_diameter_m(geometry.dbh_cm, geometry.cavity_inner_diameter_cm, settings.load);

  // 2) Wind pressure
  r.wind_pressure_Pa = wind_pressure_Pa(scenario.design_wind_speed_m_s, scenario.site_factor, settings.air);

  // 3) Crown areas
  r.fullness_used = effective_fullness(species, scenario.fullness_override, settings.load);
  r.crown_plan_area_m2 = crown_plan_area_m2(geometry.crown_diameter_m);
  r.projected_area_m2 = r.crown_plan_area_m2 * species.crown_shape_factor * r.fullness_used;

  // 4-6) Force and base moment about the effective load height
  r.wind_force_N = r.wind_pressure_Pa * species.drag_coefficient * r.projected_area_m2;
  r.lever_arm_m = settings.load.lever_arm_ratio * geometry.height_m;
  r.bending_moment_Nm = r.wind_force_N * r.lever_arm_m;

  // 7-8) Section modulus and stress
  r.section_modulus_m3 = section_modulus_m3(r.outer_diameter_m, r.inner_diameter_m);
  r.bending_stress_MPa = (r.bending_moment_Nm / r.section_modulus_m3) * units::Pa_to_MPa;

  // 9-10) Strength and safety factor
  r.effective_strength_MPa = species.green_bending_strength_MPa * scenario.defect_strength_factor;
  r.safety_factor = (r.bending_stress_MPa > 0.0) ? r.effective_strength_MPa / r.bending_stress_MPa : kInf;

  return r;
}

bool is_evaluable(const SpeciesProfile& species,
                  const TreeGeometry& g,
                  const LoadScenario& sc) noexcept {
  if (!(is_finite(species.green_bending_strength_MPa) && species.green_bending_strength_MPa > 0.0)) return false;
  if (!(is_finite(species.drag_coefficient) && species.drag_coefficient > 0.0)) return false;
  if (!(is_finite(species.crown_shape_factor) && species.crown_shape_factor > 0.0)) return false;
  if (!(is_finite(g.dbh_cm) && g.dbh_cm > 0.0)) return false;
  if (!(is_finite(g.height_m) && g.height_m >= 0.0)) return false;
  if (!(is_finite(g.crown_diameter_m) && g.crown_diameter_m >= 0.0)) return false;
  if (!cavity_ok(g.cavity_inner_diameter_cm)) return false;
  if (!(is_finite(sc.design_wind_speed_m_s) && sc.design_wind_speed_m_s >= 0.0)) return false;
  if (!(is_finite(sc.site_factor) && sc.site_factor >= 0.0)) return false;
  if (sc.fullness_override.has_value() && !is_finite(*sc.fullness_override)) return false;
  if (!(is_finite(sc.defect_strength_factor) && sc.defect_strength_factor > 0.0 &&
        sc.defect_strength_factor <= 1.0)) {
    return false;
  }
  return true;
}

}  // namespace arbor
