#include "engine/physics/root_plate.hpp"

#include "engine/core/numeric.hpp"
#include "engine/core/units.hpp"

namespace arbor {

const char* to_string(SoilType s) noexcept {
  switch (s) {
    case SoilType::Rocky:    return "rocky";
    case SoilType::Clay:     return "clay";
    case SoilType::ClayLoam: return "clay_loam";
    case SoilType::Loam:     return "loam";
    case SoilType::Sandy:    return "sandy";
    case SoilType::Organic:  return "organic";
  }
  return "clay_loam";
}

const char* to_string(SoilMoisture m) noexcept {
  switch (m) {
    case SoilMoisture::Dry:         return "dry";
    case SoilMoisture::Moist:       return "moist";
    case SoilMoisture::Wet:         return "wet";
    case SoilMoisture::Waterlogged: return "waterlogged";
  }
  return "moist";
}

const char* to_string(RootZoneRestriction r) noexcept {
  switch (r) {
    case RootZoneRestriction::None:       return "none";
    case RootZoneRestriction::Pavement:   return "pavement";
    case RootZoneRestriction::Building:   return "building";
    case RootZoneRestriction::Wall:       return "wall";
    case RootZoneRestriction::Excavation: return "excavation";
  }
  return "none";
}

const char* to_string(RootPlateRisk r) noexcept {
  switch (r) {
    case RootPlateRisk::Low:      return "Low Risk";
    case RootPlateRisk::Moderate: return "Moderate Risk";
    case RootPlateRisk::High:     return "High Risk";
    case RootPlateRisk::Critical: return "Critical Risk";
  }
  return "Critical Risk";
}

std::optional<SoilType> parse_soil_type(std::string_view s) noexcept {
  if (s == "rocky") return SoilType::Rocky;
  if (s == "clay") return SoilType::Clay;
  if (s == "clay_loam") return SoilType::ClayLoam;
  if (s == "loam") return SoilType::Loam;
  if (s == "sandy") return SoilType::Sandy;
  if (s == "organic") return SoilType::Organic;
  return std::nullopt;
}

std::optional<SoilMoisture> parse_soil_moisture(std::string_view s) noexcept {
  if (s == "dry") return SoilMoisture::Dry;
  if (s == "moist") return SoilMoisture::Moist;
  if (s == "wet") return SoilMoisture::Wet;
  if (s == "waterlogged") return SoilMoisture::Waterlogged;
  return std::nullopt;
}

std::optional<RootZoneRestriction> parse_root_zone_restriction(std::string_view s) noexcept {
  if (s == "none") return RootZoneRestriction::None;
  if (s == "pavement") return RootZoneRestriction::Pavement;
  if (s == "building") return RootZoneRestriction::Building;
  if (s == "wall") return RootZoneRestriction::Wall;
  if (s == "excavation") return RootZoneRestriction::Excavation;
  return std::nullopt;
}

double soil_type_factor(SoilType s) noexcept {
  switch (s) {
    case SoilType::Rocky:    return 1.10;
    case SoilType::Clay:     return 0.95;
    case SoilType::ClayLoam: return 1.00;
    case SoilType::Loam:     return 0.95;
    case SoilType::Sandy:    return 0.85;
    case SoilType::Organic:  return 0.75;
  }
  return 1.00;
}

double soil_moisture_factor(SoilMoisture m) noexcept {
  switch (m) {
    case SoilMoisture::Dry:         return 1.05;
    case SoilMoisture::Moist:       return 1.00;
    case SoilMoisture::Wet:         return 0.85;
    case SoilMoisture::Waterlogged: return 0.65;
  }
  return 1.00;
}

double lean_factor(double lean_deg) noexcept {
  if (!is_finite(lean_deg) || lean_deg <= 0.0) return 1.0;
  if (lean_deg <= 5.0) return 0.95;
  if (lean_deg <= 10.0) return 0.85;
  if (lean_deg <= 15.0) return 0.70;
  return 0.50;
}

double restriction_factor(RootZoneRestriction r) noexcept {
  switch (r) {
    case RootZoneRestriction::Pavement:   return 0.85;
    case RootZoneRestriction::Building:   return 0.75;
    case RootZoneRestriction::Wall:       return 0.80;
    case RootZoneRestriction::Excavation: return 0.65;
    case RootZoneRestriction::None:       return 1.00;
  }
  return 1.00;
}

double compose_root_plate_stability(const RootPlateObservations& obs,
                                    std::optional<double> dbh_cm) noexcept {
  double f = 1.0;

  f *= soil_type_factor(obs.soil);
  f *= soil_moisture_factor(obs.moisture);
  f *= lean_factor(obs.lean_deg);

  if (obs.recent_lean_change) f *= 0.70;
  if (obs.heaving_or_cracking) f *= 0.60;

  if (is_finite(obs.severed_roots_pct) && obs.severed_roots_pct > 0.0) {
    f *= clamp(1.0 - (obs.severed_roots_pct / 100.0) * 0.8, 0.3, 1.0);
  }

  if (obs.root_decay) f *= 0.75;
  f *= restriction_factor(obs.restriction);

  // Plate dimensions, when measured
  if (is_finite(dbh_cm) && *dbh_cm > 0.0 && is_finite(obs.plate_radius_m) && *obs.plate_radius_m > 0.0) {
    const double expected_m = *dbh_cm * units::cm_to_m * kExpectedPlateRadiusPerDbh;
    const double ratio = *obs.plate_radius_m / expected_m;
    if (ratio < 0.7) f *= 0.75;
    else if (ratio < 0.9) f *= 0.90;
  }
  if (is_finite(obs.plate_depth_m) && *obs.plate_depth_m > 0.0) {
    if (*obs.plate_depth_m < 0.3) f *= 0.70;
    else if (*obs.plate_depth_m < 0.5) f *= 0.85;
  }

  return clamp(f, kRootPlateFactorMin, kRootPlateFactorMax);
}

RootPlateRisk root_plate_risk(double stability_factor) noexcept {
  if (stability_factor >= 0.9) return RootPlateRisk::Low;
  if (stability_factor >= 0.7) return RootPlateRisk::Moderate;
  if (stability_factor >= 0.5) return RootPlateRisk::High;
  return RootPlateRisk::Critical;
}

}  // namespace arbor
