#pragma once
/*
================================================================================
Physics: Scenario & Curve Generator
FILE: cpp/engine/physics/scenario_curves.hpp

Purpose:
  - Before/after pruning comparison and parametric SF sweeps, each built by
    re-running evaluate() at varied inputs. No I/O, no state between calls.

Sweeps (layouts from SweepSettings):
  - SF vs wind:          [max(floor, 0.5 V), 1.8 V], extended to 1.1 V_fail
  - SF vs reduction %:   0..span, y = pruning_scenario(...).after SF
  - SF vs residual wall: [20, 100] %
  - Regional comparison: SF at each named regional wind speed

Notes:
  - Curves may contain +inf y values (zero stress); consumers special-case.
  - A scenario evaluate() would reject yields an empty curve.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/catalog/species_catalog.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/tree.hpp"

namespace arbor {

// Reduction percentages are clamped to [0, 100] before use.
struct PruningRequest {
  double crown_diameter_reduction_pct = 0.0;
  double fullness_reduction_pct = 0.0;
};

PruningScenarioResult pruning_scenario(const SpeciesProfile& species,
                                       const TreeGeometry& geometry,
                                       const LoadScenario& scenario,
                                       const PruningRequest& pruning,
                                       const EngineSettings& settings = EngineSettings::defaults());

Curve sf_vs_wind_curve(const SpeciesProfile& species,
                       const TreeGeometry& geometry,
                       const LoadScenario& scenario,
                       const EngineSettings& settings = EngineSettings::defaults());

// crown_reduction_pct picks the sweep span; fullness reduction is held at the
// request's value for every sample.
Curve sf_vs_reduction_curve(const SpeciesProfile& species,
                            const TreeGeometry& geometry,
                            const LoadScenario& scenario,
                            const PruningRequest& pruning,
                            const EngineSettings& settings = EngineSettings::defaults());

Curve sf_vs_residual_wall_curve(const SpeciesProfile& species,
                                const TreeGeometry& geometry,
                                const LoadScenario& scenario,
                                const EngineSettings& settings = EngineSettings::defaults());

struct RegionalResult {
  std::string label;
  double wind_speed_m_s = 0.0;
  double safety_factor = 0.0;
};

std::vector<RegionalResult> regional_comparison(const SpeciesProfile& species,
                                                const TreeGeometry& geometry,
                                                const LoadScenario& scenario,
                                                const EngineSettings& settings = EngineSettings::defaults());

}  // namespace arbor
