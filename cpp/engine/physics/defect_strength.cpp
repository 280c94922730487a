#include "engine/physics/defect_strength.hpp"

#include "engine/core/numeric.hpp"

namespace arbor {

const char* to_string(DecayType t) noexcept {
  switch (t) {
    case DecayType::WhiteRot: return "white_rot";
    case DecayType::BrownRot: return "brown_rot";
    case DecayType::SoftRot:  return "soft_rot";
    case DecayType::Unknown:  return "unknown";
  }
  return "unknown";
}

const char* to_string(DecayLocation l) noexcept {
  switch (l) {
    case DecayLocation::RootPlate: return "root_plate";
    case DecayLocation::StemBase:  return "stem_base";
    case DecayLocation::MidStem:   return "mid_stem";
    case DecayLocation::UpperStem: return "upper_stem";
  }
  return "stem_base";
}

const char* to_string(DecaySeverity s) noexcept {
  switch (s) {
    case DecaySeverity::Minor:     return "minor";
    case DecaySeverity::Moderate:  return "moderate";
    case DecaySeverity::Severe:    return "severe";
    case DecaySeverity::Extensive: return "extensive";
  }
  return "moderate";
}

const char* to_string(ResonanceResult r) noexcept {
  switch (r) {
    case ResonanceResult::NotDone: return "not_done";
    case ResonanceResult::Solid:   return "solid";
    case ResonanceResult::Drum:    return "drum";
    case ResonanceResult::Hollow:  return "hollow";
  }
  return "not_done";
}

std::optional<DecayType> parse_decay_type(std::string_view s) noexcept {
  if (s == "unknown") return DecayType::Unknown;
  if (s == "white_rot") return DecayType::WhiteRot;
  if (s == "brown_rot") return DecayType::BrownRot;
  if (s == "soft_rot") return DecayType::SoftRot;
  return std::nullopt;
}

std::optional<DecayLocation> parse_decay_location(std::string_view s) noexcept {
  if (s == "root_plate") return DecayLocation::RootPlate;
  if (s == "stem_base") return DecayLocation::StemBase;
  if (s == "mid_stem") return DecayLocation::MidStem;
  if (s == "upper_stem") return DecayLocation::UpperStem;
  return std::nullopt;
}

std::optional<DecaySeverity> parse_decay_severity(std::string_view s) noexcept {
  if (s == "minor") return DecaySeverity::Minor;
  if (s == "moderate") return DecaySeverity::Moderate;
  if (s == "severe") return DecaySeverity::Severe;
  if (s == "extensive") return DecaySeverity::Extensive;
  return std::nullopt;
}

std::optional<ResonanceResult> parse_resonance(std::string_view s) noexcept {
  if (s == "not_done") return ResonanceResult::NotDone;
  if (s == "solid") return ResonanceResult::Solid;
  if (s == "drum") return ResonanceResult::Drum;
  if (s == "hollow") return ResonanceResult::Hollow;
  return std::nullopt;
}

double fruiting_body_factor(int count) noexcept {
  if (count <= 1) return 0.85;
  if (count <= 3) return 0.75;
  if (count <= 5) return 0.65;
  return 0.55;
}

double decay_type_factor(DecayType t) noexcept {
  switch (t) {
    case DecayType::WhiteRot: return 0.85;
    case DecayType::BrownRot: return 0.80;
    case DecayType::SoftRot:  return 0.90;
    case DecayType::Unknown:  return 0.90;
  }
  return 0.90;
}

double decay_location_factor(DecayLocation l) noexcept {
  switch (l) {
    case DecayLocation::RootPlate: return 0.85;
    case DecayLocation::StemBase:  return 0.90;
    case DecayLocation::MidStem:   return 0.95;
    case DecayLocation::UpperStem: return 1.00;
  }
  return 1.00;
}

double decay_severity_factor(DecaySeverity s) noexcept {
  switch (s) {
    case DecaySeverity::Minor:     return 0.95;
    case DecaySeverity::Moderate:  return 0.85;
    case DecaySeverity::Severe:    return 0.70;
    case DecaySeverity::Extensive: return 0.50;
  }
  return 1.00;
}

double resonance_factor(ResonanceResult r) noexcept {
  switch (r) {
    case ResonanceResult::Drum:   return 0.90;
    case ResonanceResult::Hollow: return 0.75;
    case ResonanceResult::Solid:
    case ResonanceResult::NotDone:
      return 1.00;
  }
  return 1.00;
}

double compose_defect_strength_factor(const DefectObservations& obs,
                                      std::optional<double> tree_height_m) noexcept {
  double k = 1.0;

  // Observed defects
  if (obs.bracket_fungi) k *= fruiting_body_factor(obs.fruiting_body_count);
  if (obs.cavity_decay) k *= 0.80;
  if (obs.cracks) k *= 0.85;
  if (obs.basal_decay) k *= 0.75;
  if (obs.weak_union) k *= 0.85;

  // Decay qualifiers only count when decay is actually indicated.
  if (obs.decay_indicated()) {
    k *= decay_type_factor(obs.decay_type);
    k *= decay_location_factor(obs.decay_location);
    k *= decay_severity_factor(obs.decay_severity);
  }

  if (is_finite(obs.decay_extent_pct) && obs.decay_extent_pct > 0.0) {
    k *= clamp(1.0 - (obs.decay_extent_pct / 100.0) * 0.4, 0.4, 1.0);
  }

  k *= resonance_factor(obs.resonance);

  if (is_finite(obs.decay_column_height_m) && *obs.decay_column_height_m > 0.0) {
    const double h = positive_or(tree_height_m.value_or(0.0), kFallbackTreeHeight_m);
    const double ratio = clamp(*obs.decay_column_height_m / h, 0.0, 1.0);
    k *= clamp(1.0 - ratio * 0.3, 0.5, 1.0);
  }

  return clamp(k, kDefectFactorMin, kDefectFactorMax);
}

}  // namespace arbor
