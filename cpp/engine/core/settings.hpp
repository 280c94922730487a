#pragma once
/*
================================================================================
Core: Engine Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every model constant and numerical knob (air density, lever
    arm ratio, clamp bounds, bisection budget, sweep layouts) in one validated
    value that is passed into calculations by const&.
  - Defaults reproduce the AusTreeCalc constants exactly; results computed
    with EngineSettings::defaults() are the reference results.

Rules:
  - No global instance. Callers own a settings value and inject it.
  - validate_or_throw() rejects nonsensical values before any arithmetic.
================================================================================
*/

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "engine/core/errors.hpp"

namespace arbor {

namespace detail {

[[noreturn]] inline void bad_setting(const char* field, const char* msg) {
  throw ValidationError(ErrorCode::kInvalidConfig, msg, field, ErrorSite{});
}

}  // namespace detail

// ----------------------------- Air -------------------------------------------
struct AirSettings {
  // kg/m^3. The model uses 1.2 rather than ISA sea level.
  double rho_kg_m3 = 1.2;

  void validate_or_throw() const {
    if (!(rho_kg_m3 >= 0.5 && rho_kg_m3 <= 1.6)) {
      detail::bad_setting("air.rho_kg_m3", "AirSettings: rho_kg_m3 outside sane bounds");
    }
  }
};

// ----------------------------- Load model ------------------------------------
struct LoadModelSettings {
  // Height of the resultant crown load as a fraction of tree height.
  double lever_arm_ratio = 0.66;

  // Crown fullness is always clamped into [fullness_min, fullness_max].
  double fullness_min = 0.1;
  double fullness_max = 1.0;

  // A cavity >= DBH is capped to this fraction of DBH.
  double cavity_cap_ratio = 0.99;

  void validate_or_throw() const {
    if (!(lever_arm_ratio > 0.0 && lever_arm_ratio <= 1.0)) {
      detail::bad_setting("load.lever_arm_ratio", "LoadModelSettings: lever_arm_ratio must be (0,1]");
    }
    if (!(fullness_min > 0.0 && fullness_min < fullness_max && fullness_max <= 1.0)) {
      detail::bad_setting("load.fullness_min", "LoadModelSettings: fullness bounds invalid");
    }
    if (!(cavity_cap_ratio > 0.5 && cavity_cap_ratio < 1.0)) {
      detail::bad_setting("load.cavity_cap_ratio", "LoadModelSettings: cavity_cap_ratio must be (0.5,1)");
    }
  }
};

// ----------------------------- Threshold solver ------------------------------
struct SolverSettings {
  // Residual wall search bracket (% of DBH retained as sound wall).
  double residual_wall_min_pct = 10.0;
  double residual_wall_max_pct = 100.0;

  int bisection_max_iter = 20;

  // Accept a bisection midpoint when |SF - 1| < sf_tolerance.
  double sf_tolerance = 0.02;

  void validate_or_throw() const {
    if (!(residual_wall_min_pct > 0.0 && residual_wall_min_pct < residual_wall_max_pct &&
          residual_wall_max_pct <= 100.0)) {
      detail::bad_setting("solver.residual_wall_min_pct", "SolverSettings: residual wall bracket invalid");
    }
    if (bisection_max_iter < 5 || bisection_max_iter > 200) {
      detail::bad_setting("solver.bisection_max_iter", "SolverSettings: bisection_max_iter outside sane bounds");
    }
    if (!(sf_tolerance >= 0.001 && sf_tolerance <= 0.05)) {
      detail::bad_setting("solver.sf_tolerance", "SolverSettings: sf_tolerance must be in [0.001,0.05]");
    }
  }
};

// ----------------------------- Sweeps ----------------------------------------
struct RegionalWind {
  std::string label;
  double wind_speed_m_s = 0.0;
};

struct SweepSettings {
  // SF vs wind: [max(floor, min_ratio*V), max_ratio*V], extended to
  // failure_margin*V_fail when that is larger.
  int wind_steps = 12;
  double wind_min_ratio = 0.5;
  double wind_floor_m_s = 5.0;
  double wind_max_ratio = 1.8;
  double failure_margin = 1.1;

  // SF vs crown reduction: 0..span, span = default when no reduction chosen,
  // else the chosen reduction clamped into [span_min, span_max].
  int reduction_steps = 9;
  double reduction_default_span_pct = 10.0;
  double reduction_span_min_pct = 5.0;
  double reduction_span_max_pct = 40.0;

  // SF vs residual wall.
  int residual_steps = 9;
  double residual_min_pct = 20.0;
  double residual_max_pct = 100.0;

  // Critical residual wall vs wind (decay tolerance).
  int decay_steps = 10;
  double decay_wind_min_m_s = 15.0;
  double decay_wind_max_ratio = 1.5;
  double decay_wind_max_lo_m_s = 50.0;
  double decay_wind_max_hi_m_s = 80.0;

  std::vector<RegionalWind> regional_winds = {
      {"Region A (32)", 32.0},
      {"Region B (40)", 40.0},
      {"Region C (50)", 50.0},
      {"Region D (60)", 60.0},
      {"Cyclone (69)", 69.0},
  };

  void validate_or_throw() const {
    if (wind_steps < 2 || reduction_steps < 2 || residual_steps < 2 || decay_steps < 2) {
      detail::bad_setting("sweep.steps", "SweepSettings: every sweep needs at least 2 steps");
    }
    if (wind_steps > 1000 || reduction_steps > 1000 || residual_steps > 1000 || decay_steps > 1000) {
      detail::bad_setting("sweep.steps", "SweepSettings: sweep step count outside sane bounds");
    }
    if (!(wind_min_ratio > 0.0 && wind_min_ratio < wind_max_ratio)) {
      detail::bad_setting("sweep.wind_min_ratio", "SweepSettings: wind ratios invalid");
    }
    if (!(wind_floor_m_s >= 0.0 && failure_margin >= 1.0)) {
      detail::bad_setting("sweep.failure_margin", "SweepSettings: wind floor / failure margin invalid");
    }
    if (!(reduction_default_span_pct > 0.0 && reduction_span_min_pct > 0.0 &&
          reduction_span_min_pct <= reduction_span_max_pct && reduction_span_max_pct <= 100.0)) {
      detail::bad_setting("sweep.reduction_span", "SweepSettings: reduction span invalid");
    }
    if (!(residual_min_pct > 0.0 && residual_min_pct < residual_max_pct && residual_max_pct <= 100.0)) {
      detail::bad_setting("sweep.residual_min_pct", "SweepSettings: residual wall range invalid");
    }
    if (!(decay_wind_min_m_s > 0.0 && decay_wind_max_ratio > 0.0 &&
          decay_wind_max_lo_m_s > decay_wind_min_m_s && decay_wind_max_lo_m_s <= decay_wind_max_hi_m_s)) {
      detail::bad_setting("sweep.decay_wind", "SweepSettings: decay tolerance wind range invalid");
    }
    for (const auto& rw : regional_winds) {
      if (rw.label.empty() || !(rw.wind_speed_m_s > 0.0)) {
        detail::bad_setting("sweep.regional_winds", "SweepSettings: regional wind entry invalid");
      }
    }
  }
};

// ----------------------------- Failure thresholds ----------------------------
// Critical residual wall tabulated at fixed key winds. Uses its own, tighter
// bisection budget than the design-wind search.
struct ThresholdTableSettings {
  std::vector<double> key_winds_m_s = {25.0, 32.0, 40.0, 50.0, 60.0, 69.0};
  int bisection_max_iter = 25;
  double sf_tolerance = 0.01;

  void validate_or_throw() const {
    if (key_winds_m_s.empty() || key_winds_m_s.size() > 100) {
      detail::bad_setting("thresholds.key_winds_m_s", "ThresholdTableSettings: need 1..100 key winds");
    }
    for (std::size_t i = 0; i < key_winds_m_s.size(); ++i) {
      if (!(key_winds_m_s[i] > 0.0) || (i > 0 && !(key_winds_m_s[i] > key_winds_m_s[i - 1]))) {
        detail::bad_setting("thresholds.key_winds_m_s",
                            "ThresholdTableSettings: key winds must be positive and strictly increasing");
      }
    }
    if (bisection_max_iter < 5 || bisection_max_iter > 200) {
      detail::bad_setting("thresholds.bisection_max_iter",
                          "ThresholdTableSettings: bisection_max_iter outside sane bounds");
    }
    if (!(sf_tolerance >= 0.001 && sf_tolerance <= 0.05)) {
      detail::bad_setting("thresholds.sf_tolerance", "ThresholdTableSettings: sf_tolerance must be in [0.001,0.05]");
    }
  }
};

// ----------------------------- Post checks -----------------------------------
struct PostCheckSettings {
  // Finite SF above this raises an advisory "check inputs" warning.
  double high_sf_warning = 5.0;

  void validate_or_throw() const {
    if (!(high_sf_warning > 1.0)) {
      detail::bad_setting("post.high_sf_warning", "PostCheckSettings: high_sf_warning must be > 1");
    }
  }
};

// ----------------------------- EngineSettings --------------------------------
struct EngineSettings {
  AirSettings air;
  LoadModelSettings load;
  SolverSettings solver;
  SweepSettings sweep;
  ThresholdTableSettings thresholds;
  PostCheckSettings post;

  void validate_or_throw() const {
    air.validate_or_throw();
    load.validate_or_throw();
    solver.validate_or_throw();
    sweep.validate_or_throw();
    thresholds.validate_or_throw();
    post.validate_or_throw();
  }

  static const EngineSettings& defaults() {
    static const EngineSettings s{};
    return s;
  }
};

}  // namespace arbor
