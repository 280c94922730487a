#pragma once
/*
================================================================================
Catalog: Wind Presets
FILE: cpp/engine/catalog/wind_catalog.hpp

Purpose:
  - Design gust presets approximating the Australian wind regions A-D, each in
    an urban/suburban and an open/exposed variant.
  - designWindSpeed is the design gust at tree height (m/s).
================================================================================
*/

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace arbor {

struct WindProfile {
  std::string id;
  std::string display_name;
  double design_wind_speed_m_s = 0.0;

  void validate_or_throw() const;
};

class WindCatalog final {
 public:
  explicit WindCatalog(std::vector<WindProfile> profiles);

  static WindCatalog builtin();

  const WindProfile* find(std::string_view id) const noexcept;
  const WindProfile& at(std::string_view id) const;

  const std::vector<WindProfile>& all() const noexcept { return profiles_; }
  std::size_t size() const noexcept { return profiles_.size(); }

 private:
  std::vector<WindProfile> profiles_;
  std::map<std::string, std::size_t, std::less<>> index_;
};

}  // namespace arbor
