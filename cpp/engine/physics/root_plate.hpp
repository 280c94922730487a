#pragma once
/*
================================================================================
Physics: Root-Plate Stability Composer
FILE: cpp/engine/physics/root_plate.hpp

Purpose:
  - Advisory anchorage score from soil, lean and root-zone observations.
  - The score is NOT fed into the bending safety factor; it only drives the
    root-plate risk rating.

Model:
  - factor = product of independent multipliers, clamped to [0.2, 1.1]
    (rocky soil may lift the score above 1.0).
  - Expected root-plate radius ~ 3.5 * DBH_m; a measured plate smaller than
    0.7 / 0.9 of that applies 0.75 / 0.90. Depth < 0.3 m / < 0.5 m applies
    0.70 / 0.85.
  - Rating: >= 0.9 Low, >= 0.7 Moderate, >= 0.5 High, else Critical.
================================================================================
*/

#include <cstdint>
#include <optional>
#include <string_view>

namespace arbor {

enum class SoilType : std::uint8_t { Rocky = 0, Clay = 1, ClayLoam = 2, Loam = 3, Sandy = 4, Organic = 5 };

enum class SoilMoisture : std::uint8_t { Dry = 0, Moist = 1, Wet = 2, Waterlogged = 3 };

enum class RootZoneRestriction : std::uint8_t { None = 0, Pavement = 1, Building = 2, Wall = 3, Excavation = 4 };

enum class RootPlateRisk : std::uint8_t { Low = 0, Moderate = 1, High = 2, Critical = 3 };

const char* to_string(SoilType s) noexcept;
const char* to_string(SoilMoisture m) noexcept;
const char* to_string(RootZoneRestriction r) noexcept;
const char* to_string(RootPlateRisk r) noexcept;

std::optional<SoilType> parse_soil_type(std::string_view s) noexcept;
std::optional<SoilMoisture> parse_soil_moisture(std::string_view s) noexcept;
std::optional<RootZoneRestriction> parse_root_zone_restriction(std::string_view s) noexcept;

struct RootPlateObservations {
  SoilType soil = SoilType::ClayLoam;
  SoilMoisture moisture = SoilMoisture::Moist;

  // Degrees from vertical; <= 0 applies no lean factor.
  double lean_deg = 0.0;
  bool recent_lean_change = false;
  bool heaving_or_cracking = false;
  bool root_decay = false;

  // % of structural roots severed; <= 0 applies nothing.
  double severed_roots_pct = 0.0;

  RootZoneRestriction restriction = RootZoneRestriction::None;

  // Measured plate dimensions (m); absent or <= 0 means not measured.
  std::optional<double> plate_radius_m;
  std::optional<double> plate_depth_m;
};

inline constexpr double kRootPlateFactorMin = 0.2;
inline constexpr double kRootPlateFactorMax = 1.1;
inline constexpr double kExpectedPlateRadiusPerDbh = 3.5;

double soil_type_factor(SoilType s) noexcept;
double soil_moisture_factor(SoilMoisture m) noexcept;
double lean_factor(double lean_deg) noexcept;
double restriction_factor(RootZoneRestriction r) noexcept;

// dbh_cm is needed only for the radius check; absent skips it.
double compose_root_plate_stability(const RootPlateObservations& obs,
                                    std::optional<double> dbh_cm = std::nullopt) noexcept;

RootPlateRisk root_plate_risk(double stability_factor) noexcept;

}  // namespace arbor
