#pragma once
/*
================================================================================
Analysis: Assessment Pipeline
FILE: cpp/engine/analysis/assessment.hpp

Purpose:
  - One call that runs the complete tree assessment for a set of field
    observations and returns every derived value as a plain struct:
      1) validate inputs (errors -> blocked, nothing else computed)
      2) compose k_defect
      3) evaluate at design wind
      4) wind-to-failure
      5) optional pruning scenario
      6) post-calculation warnings and ratings
      7) current / critical residual wall, key-wind failure thresholds
      8) curves and regional comparison
      9) optional root-plate stability

Rules:
  - Unknown species or wind preset ids and out-of-range measurements are
    reported as ValidationIssue entries, never thrown.
  - Invalid EngineSettings throw ValidationError (kInvalidConfig).
  - Absent thresholds stay std::nullopt.
  - The design wind is the explicit speed when given, otherwise the wind
    preset's speed.
================================================================================
*/

#include <optional>
#include <string>
#include <vector>

#include "engine/analysis/input_validation.hpp"
#include "engine/analysis/ratings.hpp"
#include "engine/catalog/species_catalog.hpp"
#include "engine/catalog/wind_catalog.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/tree.hpp"
#include "engine/physics/defect_strength.hpp"
#include "engine/physics/root_plate.hpp"
#include "engine/physics/scenario_curves.hpp"
#include "engine/physics/threshold_solver.hpp"

namespace arbor {

struct AssessmentInput {
  std::string species_id;

  // Geometry plus optional explicit design wind.
  RawTreeInputs tree;
  std::optional<std::string> wind_preset_id;

  double site_factor = 1.0;
  std::optional<double> fullness_override;

  DefectObservations defects;
  std::optional<PruningRequest> pruning;
  std::optional<RootPlateObservations> root_plate;
};

struct Assessment {
  bool blocked = false;
  std::vector<ValidationIssue> issues;

  std::string species_id;
  std::string species_name;
  double design_wind_speed_m_s = 0.0;
  TreeGeometry geometry;

  double defect_strength_factor = 1.0;
  CalculationResult result;
  std::optional<double> wind_to_failure_m_s;

  SafetyFactorRating safety_factor_rating = SafetyFactorRating::Unacceptable;
  WindMarginRating wind_margin_rating = WindMarginRating::Unresolved;

  std::optional<PruningScenarioResult> pruning;
  std::optional<double> pruning_improvement_pct;

  double residual_wall_pct = 100.0;
  ResidualWallRating residual_wall_rating = ResidualWallRating::Tolerable;
  std::optional<double> critical_residual_wall_pct;
  std::optional<double> critical_wall_thickness_cm;
  std::vector<FailureThresholdRow> failure_thresholds;

  Curve sf_vs_wind;
  Curve sf_vs_reduction;  // empty unless pruning was requested
  Curve sf_vs_residual_wall;
  Curve decay_tolerance;
  std::vector<RegionalResult> regional;

  std::optional<double> root_plate_factor;
  std::optional<RootPlateRisk> root_plate_risk;
};

Assessment run_assessment(const AssessmentInput& in,
                          const SpeciesCatalog& species,
                          const WindCatalog& winds,
                          const EngineSettings& settings = EngineSettings::defaults());

}  // namespace arbor
