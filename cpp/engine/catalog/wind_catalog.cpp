#include "engine/catalog/wind_catalog.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/numeric.hpp"

#include <utility>

namespace arbor {

void WindProfile::validate_or_throw() const {
  ARBOR_REQUIRE(!id.empty(), "wind.id", "WindProfile: id must not be empty");
  ARBOR_REQUIRE(is_finite(design_wind_speed_m_s) && design_wind_speed_m_s > 0.0,
                "wind.design_wind_speed_m_s",
                "WindProfile '" + id + "': design wind speed must be > 0");
}

WindCatalog::WindCatalog(std::vector<WindProfile> profiles) : profiles_(std::move(profiles)) {
  for (std::size_t i = 0; i < profiles_.size(); ++i) {
    profiles_[i].validate_or_throw();
    const bool inserted = index_.emplace(profiles_[i].id, i).second;
    ARBOR_REQUIRE(inserted, "wind.id", "WindCatalog: duplicate id '" + profiles_[i].id + "'");
  }
}

const WindProfile* WindCatalog::find(std::string_view id) const noexcept {
  const auto it = index_.find(id);
  return it == index_.end() ? nullptr : &profiles_[it->second];
}

const WindProfile& WindCatalog::at(std::string_view id) const {
  const WindProfile* p = find(id);
  if (!p) throw LookupError(ErrorCode::kUnknownWindPreset, std::string(id), ARBOR_SITE);
  return *p;
}

WindCatalog WindCatalog::builtin() {
  std::vector<WindProfile> rows = {
      {"A_urban", "Region A - Urban/Suburban", 35.0},
      {"A_open", "Region A - Open/Exposed", 40.0},
      {"B_urban", "Region B - Urban/Suburban", 40.0},
      {"B_open", "Region B - Open/Exposed", 45.0},
      {"C_urban", "Region C - Urban/Suburban", 50.0},
      {"C_open", "Region C - Open/Exposed", 55.0},
      {"D_urban", "Region D - Urban/Suburban", 55.0},
      {"D_open", "Region D - Open/Exposed", 60.0},
  };
  return WindCatalog(std::move(rows));
}

}  // namespace arbor
