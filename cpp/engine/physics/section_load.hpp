#pragma once
/*
================================================================================
Physics: Section & Load Calculator (Cantilever Stem Statics)
FILE: cpp/engine/physics/section_load.hpp

Purpose:
  - Single-scenario statics for a tree stem loaded by wind on its crown:
    wind pressure -> crown force -> base bending moment -> bending stress at
    the assessment section -> safety factor against effective green strength.

Model:
  - q      = siteFactor * 0.5 * rho * V^2                     (Pa)
  - A_plan = pi * (D_crown / 2)^2
  - A      = A_plan * kA * clamp(fullness, 0.1, 1.0)
  - F      = q * Cd * A                                      (N)
  - h_eff  = 0.66 * H                                        (distributed load)
  - M      = F * h_eff                                       (N·m)
  - W      = pi d^3 / 32                 (solid)
             pi (d^4 - d_i^4) / (32 d)   (hollow, when resolved d_i > 0)
  - sigma  = M / W / 1e6                                     (MPa)
  - f_eff  = fb,green * k_defect
  - SF     = f_eff / sigma, or +inf when sigma <= 0

Hardening:
  - Cavity >= DBH is capped to 99% of DBH before W is formed, so the hollow
    modulus can never reach zero. Negative cavity is treated as solid.
  - evaluate() is deterministic and side-effect free; identical inputs give
    bit-identical outputs.
  - Contract violations (non-finite or out-of-domain inputs) throw
    ValidationError; user-facing range checks belong to input_validation.
================================================================================
*/

#include <optional>

#include "engine/catalog/species_catalog.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/tree.hpp"

namespace arbor {

// q in Pa.
double wind_pressure_Pa(double wind_speed_m_s, double site_factor, const AirSettings& air);

double crown_plan_area_m2(double crown_diameter_m) noexcept;

// Species default or override, clamped to the load model's fullness bounds.
double effective_fullness(const SpeciesProfile& species,
                          const std::optional<double>& fullness_override,
                          const LoadModelSettings& load) noexcept;

// Inner diameter in m used for the section: 0 when there is no (positive)
// cavity, otherwise the cavity capped at cavity_cap_ratio * DBH.
double resolve_inner_diameter_m(double dbh_cm,
                                const std::optional<double>& cavity_inner_diameter_cm,
                                const LoadModelSettings& load) noexcept;

// Section modulus in m^3. Hollow formula iff inner_m > 0.
double section_modulus_m3(double outer_m, double inner_m) noexcept;

// Full single-scenario evaluation.
CalculationResult evaluate(const SpeciesProfile& species,
                           const TreeGeometry& geometry,
                           const LoadScenario& scenario,
                           const EngineSettings& settings = EngineSettings::defaults());

// True when evaluate() would accept the inputs (no throw). Used by the solver
// and curve builders so they can report "absent" instead of throwing.
bool is_evaluable(const SpeciesProfile& species,
                  const TreeGeometry& geometry,
                  const LoadScenario& scenario) noexcept;

}  // namespace arbor
