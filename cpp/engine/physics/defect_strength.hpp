#pragma once
/*
================================================================================
Physics: Defect Strength Composer
FILE: cpp/engine/physics/defect_strength.hpp

Purpose:
  - Fold independent structural-defect observations into one multiplicative
    strength reduction k_defect, applied to green bending strength.

Factors (each 1.0 when not observed):
  - Bracket fungi by fruiting body count  <=1:0.85  <=3:0.75  <=5:0.65  >5:0.55
  - Cavity with visible decay 0.80, longitudinal cracks 0.85,
    basal decay 0.75, included bark / weak union 0.85
  - Decay gate (fungi, cavity decay or basal decay present):
      type      white 0.85  brown 0.80  soft 0.90  unknown 0.90
      location  root_plate 0.85  stem_base 0.90  mid_stem 0.95  upper_stem 1.0
      severity  minor 0.95  moderate 0.85  severe 0.70  extensive 0.50
  - Ungated:
      extent e%      clamp(1 - e/100 * 0.4, 0.4, 1.0)   (only when e > 0)
      resonance      drum 0.90  hollow 0.75
      decay column   clamp(1 - clamp(hc/H, 0, 1) * 0.3, 0.5, 1.0)   (hc > 0)
  - Final product clamped to [0.20, 1.00].
================================================================================
*/

#include <cstdint>
#include <optional>
#include <string_view>

namespace arbor {

enum class DecayType : std::uint8_t { Unknown = 0, WhiteRot = 1, BrownRot = 2, SoftRot = 3 };

enum class DecayLocation : std::uint8_t { RootPlate = 0, StemBase = 1, MidStem = 2, UpperStem = 3 };

enum class DecaySeverity : std::uint8_t { Minor = 0, Moderate = 1, Severe = 2, Extensive = 3 };

enum class ResonanceResult : std::uint8_t { NotDone = 0, Solid = 1, Drum = 2, Hollow = 3 };

const char* to_string(DecayType t) noexcept;
const char* to_string(DecayLocation l) noexcept;
const char* to_string(DecaySeverity s) noexcept;
const char* to_string(ResonanceResult r) noexcept;

// Accept the to_string() spelling ("white_rot", "stem_base", ...).
std::optional<DecayType> parse_decay_type(std::string_view s) noexcept;
std::optional<DecayLocation> parse_decay_location(std::string_view s) noexcept;
std::optional<DecaySeverity> parse_decay_severity(std::string_view s) noexcept;
std::optional<ResonanceResult> parse_resonance(std::string_view s) noexcept;

struct DefectObservations {
  bool bracket_fungi = false;
  int fruiting_body_count = 0;

  bool cavity_decay = false;
  bool cracks = false;
  bool basal_decay = false;
  bool weak_union = false;

  DecayType decay_type = DecayType::Unknown;
  DecayLocation decay_location = DecayLocation::StemBase;
  DecaySeverity decay_severity = DecaySeverity::Moderate;

  // % of cross-section estimated to be compromised; <= 0 means not assessed.
  double decay_extent_pct = 0.0;

  ResonanceResult resonance = ResonanceResult::NotDone;

  // Decay column height (m); absent or <= 0 means not measured.
  std::optional<double> decay_column_height_m;

  // True if any of the decay-indicating observations is present.
  bool decay_indicated() const noexcept { return bracket_fungi || cavity_decay || basal_decay; }
};

inline constexpr double kDefectFactorMin = 0.20;
inline constexpr double kDefectFactorMax = 1.00;

// Tree height used to scale the decay column when the caller has none.
inline constexpr double kFallbackTreeHeight_m = 15.0;

double fruiting_body_factor(int count) noexcept;
double decay_type_factor(DecayType t) noexcept;
double decay_location_factor(DecayLocation l) noexcept;
double decay_severity_factor(DecaySeverity s) noexcept;
double resonance_factor(ResonanceResult r) noexcept;

// k_defect in [0.20, 1.00]. tree_height_m scales the decay column term; a
// missing or non-positive height falls back to kFallbackTreeHeight_m.
double compose_defect_strength_factor(const DefectObservations& obs,
                                      std::optional<double> tree_height_m = std::nullopt) noexcept;

}  // namespace arbor
