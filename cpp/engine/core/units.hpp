#pragma once
/*
================================================================================
Core: Units + Conversions
FILE: cpp/engine/core/units.hpp

Purpose:
  - Explicit unit helpers so the statics code stays readable and avoids silent
    cm-vs-m and Pa-vs-MPa slips.

Engine unit conventions:
  - Stem diameters (DBH, cavity) are entered in cm and converted here.
  - Heights, crown diameter, root-plate radius/depth in m.
  - Wind speed m/s, pressure Pa, force N, moment N·m, stress MPa.
================================================================================
*/

namespace arbor::units {

inline constexpr double kPi = 3.141592653589793238462643383279502884;

// Length
inline constexpr double cm_to_m = 0.01;
inline constexpr double m_to_cm = 100.0;

// Speed
inline constexpr double m_s_to_km_h = 3.6;
inline constexpr double km_h_to_m_s = 1.0 / m_s_to_km_h;

// Stress
inline constexpr double Pa_to_MPa = 1.0e-6;
inline constexpr double MPa_to_Pa = 1.0e6;

// Percent
inline constexpr double pct_to_frac = 0.01;
inline constexpr double frac_to_pct = 100.0;

// Helpers
constexpr double sqr(double x) { return x * x; }
constexpr double cube(double x) { return x * x * x; }
constexpr double pow4(double x) { return sqr(x) * sqr(x); }

constexpr double circle_area_from_diameter(double d) { return kPi * sqr(0.5 * d); }

} // namespace arbor::units
