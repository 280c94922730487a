#pragma once
/*
================================================================================
Catalog: Species Profiles
FILE: cpp/engine/catalog/species_catalog.hpp

Purpose:
  - Immutable species table (green bending strength, drag coefficient, crown
    shape factor, default fullness) used by every calculation.
  - Built once by the caller (SpeciesCatalog::builtin()) and passed by const&.
    There is no process-wide instance.

Data sources:
  - Wood strengths from published green timber property data.
  - Drag coefficients from wind tunnel studies (Rudnicki et al.,
    Vollsinger et al.).

Hardening:
  - Every entry is validated on construction; duplicate ids are rejected.
  - find() returns nullptr for an unknown id; at() throws LookupError.
================================================================================
*/

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace arbor {

enum class SpeciesGroup : int {
  Eucalypt = 0,
  OtherNative = 1,
  Exotic = 2,
  Conifer = 3,
  Palm = 4,
  Generic = 5,
};

const char* to_string(SpeciesGroup g) noexcept;

struct SpeciesProfile {
  std::string id;
  std::string display_name;
  SpeciesGroup group = SpeciesGroup::Generic;
  double green_bending_strength_MPa = 0.0;  // fb,green
  double drag_coefficient = 0.0;            // Cd
  double crown_shape_factor = 0.0;          // kA
  double default_fullness = 0.0;            // [0, 1]

  // Throws ValidationError naming the bad field.
  void validate_or_throw() const;
};

class SpeciesCatalog final {
 public:
  explicit SpeciesCatalog(std::vector<SpeciesProfile> profiles);

  // The compiled-in AusTreeCalc species table (60 entries).
  static SpeciesCatalog builtin();

  const SpeciesProfile* find(std::string_view id) const noexcept;
  const SpeciesProfile& at(std::string_view id) const;

  const std::vector<SpeciesProfile>& all() const noexcept { return profiles_; }
  std::size_t size() const noexcept { return profiles_.size(); }

 private:
  std::vector<SpeciesProfile> profiles_;
  std::map<std::string, std::size_t, std::less<>> index_;
};

}  // namespace arbor
