#include "engine/catalog/species_catalog.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/numeric.hpp"

#include <utility>

namespace arbor {

const char* to_string(SpeciesGroup g) noexcept {
  switch (g) {
    case SpeciesGroup::Eucalypt:    return "eucalypt";
    case SpeciesGroup::OtherNative: return "other_native";
    case SpeciesGroup::Exotic:      return "exotic";
    case SpeciesGroup::Conifer:     return "conifer";
    case SpeciesGroup::Palm:        return "palm";
    case SpeciesGroup::Generic:     return "generic";
    default:                        return "unknown";
  }
}

void SpeciesProfile::validate_or_throw() const {
  ARBOR_REQUIRE(!id.empty(), "species.id", "SpeciesProfile: id must not be empty");
  ARBOR_REQUIRE(!display_name.empty(), "species.display_name",
                "SpeciesProfile '" + id + "': display_name must not be empty");
  ARBOR_REQUIRE(is_finite(green_bending_strength_MPa) && green_bending_strength_MPa > 0.0,
                "species.green_bending_strength_MPa",
                "SpeciesProfile '" + id + "': green bending strength must be > 0");
  ARBOR_REQUIRE(is_finite(drag_coefficient) && drag_coefficient > 0.0, "species.drag_coefficient",
                "SpeciesProfile '" + id + "': drag coefficient must be > 0");
  ARBOR_REQUIRE(is_finite(crown_shape_factor) && crown_shape_factor > 0.0, "species.crown_shape_factor",
                "SpeciesProfile '" + id + "': crown shape factor must be > 0");
  ARBOR_REQUIRE(is_finite(default_fullness) && default_fullness >= 0.0 && default_fullness <= 1.0,
                "species.default_fullness",
                "SpeciesProfile '" + id + "': default fullness must be in [0,1]");
}

SpeciesCatalog::SpeciesCatalog(std::vector<SpeciesProfile> profiles) : profiles_(std::move(profiles)) {
  for (std::size_t i = 0; i < profiles_.size(); ++i) {
    const SpeciesProfile& p = profiles_[i];
    p.validate_or_throw();
    const bool inserted = index_.emplace(p.id, i).second;
    ARBOR_REQUIRE(inserted, "species.id", "SpeciesCatalog: duplicate id '" + p.id + "'");
  }
}

const SpeciesProfile* SpeciesCatalog::find(std::string_view id) const noexcept {
  const auto it = index_.find(id);
  return it == index_.end() ? nullptr : &profiles_[it->second];
}

const SpeciesProfile& SpeciesCatalog::at(std::string_view id) const {
  const SpeciesProfile* p = find(id);
  if (!p) throw LookupError(ErrorCode::kUnknownSpecies, std::string(id), ARBOR_SITE);
  return *p;
}

SpeciesCatalog SpeciesCatalog::builtin() {
  // id, display name, group, fb,green (MPa), Cd, kA, default fullness
  std::vector<SpeciesProfile> rows = {
      {"ironbark", "Ironbark (Eucalyptus sideroxylon, E. crebra)", SpeciesGroup::Eucalypt, 55.0, 0.22, 0.65, 0.85},
      {"spotted_gum", "Spotted Gum (Corymbia maculata)", SpeciesGroup::Eucalypt, 52.0, 0.24, 0.7, 0.85},
      {"flooded_gum", "Flooded Gum / Rose Gum (E. grandis)", SpeciesGroup::Eucalypt, 38.0, 0.25, 0.7, 0.9},
      {"lemon_scented_gum", "Lemon-Scented Gum (Corymbia citriodora)", SpeciesGroup::Eucalypt, 48.0, 0.22, 0.6, 0.8},
      {"river_red_gum", "River Red Gum (E. camaldulensis)", SpeciesGroup::Eucalypt, 42.0, 0.26, 0.75, 0.85},
      {"forest_red_gum", "Forest Red Gum (E. tereticornis)", SpeciesGroup::Eucalypt, 45.0, 0.25, 0.7, 0.85},
      {"sydney_blue_gum", "Sydney Blue Gum (E. saligna)", SpeciesGroup::Eucalypt, 40.0, 0.25, 0.7, 0.9},
      {"scribbly_gum", "Scribbly Gum (E. haemastoma, E. racemosa)", SpeciesGroup::Eucalypt, 32.0, 0.26, 0.7, 0.85},
      {"ghost_gum", "Ghost Gum (Corymbia aparrerinja)", SpeciesGroup::Eucalypt, 28.0, 0.24, 0.65, 0.8},
      {"snow_gum", "Snow Gum (E. pauciflora)", SpeciesGroup::Eucalypt, 30.0, 0.28, 0.75, 0.85},
      {"sugar_gum", "Sugar Gum (E. cladocalyx)", SpeciesGroup::Eucalypt, 45.0, 0.24, 0.7, 0.85},
      {"yellow_box", "Yellow Box (E. melliodora)", SpeciesGroup::Eucalypt, 40.0, 0.26, 0.75, 0.9},
      {"grey_box", "Grey Box (E. microcarpa, E. moluccana)", SpeciesGroup::Eucalypt, 42.0, 0.25, 0.7, 0.85},
      {"stringybark", "Stringybark (E. obliqua, E. eugenioides)", SpeciesGroup::Eucalypt, 35.0, 0.27, 0.7, 0.9},
      {"peppermint", "Peppermint (E. radiata, E. dives)", SpeciesGroup::Eucalypt, 32.0, 0.26, 0.7, 0.9},
      {"bloodwood", "Bloodwood (Corymbia gummifera)", SpeciesGroup::Eucalypt, 38.0, 0.26, 0.7, 0.85},
      {"tallowwood", "Tallowwood (E. microcorys)", SpeciesGroup::Eucalypt, 48.0, 0.24, 0.7, 0.85},
      {"blackbutt", "Blackbutt (E. pilularis)", SpeciesGroup::Eucalypt, 45.0, 0.25, 0.7, 0.85},
      {"brush_box", "Brush Box (Lophostemon confertus)", SpeciesGroup::Eucalypt, 42.0, 0.28, 0.8, 0.95},
      {"melaleuca", "Melaleuca / Paperbark (M. quinquenervia)", SpeciesGroup::OtherNative, 28.0, 0.28, 0.7, 0.9},
      {"casuarina", "Casuarina / She-Oak (C. cunninghamiana)", SpeciesGroup::OtherNative, 32.0, 0.22, 0.6, 0.85},
      {"bangalay", "Bangalay (E. botryoides)", SpeciesGroup::OtherNative, 38.0, 0.26, 0.75, 0.9},
      {"angophora", "Angophora / Sydney Red Gum (A. costata)", SpeciesGroup::OtherNative, 32.0, 0.28, 0.8, 0.9},
      {"moreton_bay_fig", "Moreton Bay Fig (Ficus macrophylla)", SpeciesGroup::OtherNative, 22.0, 0.35, 0.85, 1.0},
      {"port_jackson_fig", "Port Jackson Fig (Ficus rubiginosa)", SpeciesGroup::OtherNative, 20.0, 0.32, 0.8, 0.95},
      {"bunya", "Bunya Pine (Araucaria bidwillii)", SpeciesGroup::OtherNative, 26.0, 0.30, 0.7, 0.95},
      {"hoop_pine", "Hoop Pine (Araucaria cunninghamii)", SpeciesGroup::OtherNative, 24.0, 0.28, 0.65, 0.9},
      {"norfolk_pine", "Norfolk Island Pine (Araucaria heterophylla)", SpeciesGroup::OtherNative, 24.0, 0.30, 0.7, 0.95},
      {"jacaranda", "Jacaranda (Jacaranda mimosifolia)", SpeciesGroup::OtherNative, 22.0, 0.32, 0.8, 0.9},
      {"poinciana", "Poinciana / Flame Tree (Delonix regia)", SpeciesGroup::OtherNative, 18.0, 0.35, 0.85, 0.9},
      {"silky_oak", "Silky Oak (Grevillea robusta)", SpeciesGroup::OtherNative, 28.0, 0.26, 0.7, 0.85},
      {"tulipwood", "Tulipwood (Harpullia pendula)", SpeciesGroup::OtherNative, 25.0, 0.30, 0.75, 0.9},
      {"leopard_tree", "Leopard Tree (Caesalpinia ferrea)", SpeciesGroup::OtherNative, 35.0, 0.28, 0.75, 0.85},
      {"tuckeroo", "Tuckeroo (Cupaniopsis anacardioides)", SpeciesGroup::OtherNative, 28.0, 0.30, 0.8, 0.95},
      {"lillypilly", "Lilly Pilly (Syzygium spp.)", SpeciesGroup::OtherNative, 30.0, 0.30, 0.8, 0.95},
      {"bottlebrush", "Bottlebrush (Callistemon / Melaleuca)", SpeciesGroup::OtherNative, 26.0, 0.28, 0.7, 0.85},
      {"london_plane", "London Plane (Platanus × acerifolia)", SpeciesGroup::Exotic, 28.0, 0.32, 0.8, 0.95},
      {"english_elm", "English Elm (Ulmus procera)", SpeciesGroup::Exotic, 26.0, 0.32, 0.8, 0.95},
      {"dutch_elm", "Dutch Elm (Ulmus × hollandica)", SpeciesGroup::Exotic, 24.0, 0.30, 0.75, 0.9},
      {"english_oak", "English Oak (Quercus robur)", SpeciesGroup::Exotic, 32.0, 0.32, 0.8, 0.95},
      {"pin_oak", "Pin Oak (Quercus palustris)", SpeciesGroup::Exotic, 30.0, 0.30, 0.75, 0.9},
      {"liquidambar", "Liquidambar (Liquidambar styraciflua)", SpeciesGroup::Exotic, 26.0, 0.30, 0.7, 0.9},
      {"tulip_tree", "Tulip Tree (Liriodendron tulipifera)", SpeciesGroup::Exotic, 24.0, 0.28, 0.7, 0.85},
      {"ash", "Ash (Fraxinus spp.)", SpeciesGroup::Exotic, 28.0, 0.30, 0.75, 0.9},
      {"birch", "Birch (Betula spp.)", SpeciesGroup::Exotic, 22.0, 0.28, 0.65, 0.85},
      {"poplar", "Poplar (Populus spp.)", SpeciesGroup::Exotic, 20.0, 0.26, 0.6, 0.85},
      {"willow", "Willow (Salix spp.)", SpeciesGroup::Exotic, 18.0, 0.35, 0.85, 0.9},
      {"camphor_laurel", "Camphor Laurel (Cinnamomum camphora)", SpeciesGroup::Exotic, 24.0, 0.32, 0.8, 0.95},
      {"magnolia", "Magnolia (Magnolia grandiflora)", SpeciesGroup::Exotic, 26.0, 0.32, 0.8, 0.95},
      {"radiata_pine", "Radiata Pine (Pinus radiata)", SpeciesGroup::Conifer, 18.0, 0.35, 0.7, 0.95},
      {"cypress_pine", "Cypress Pine (Callitris spp.)", SpeciesGroup::Conifer, 22.0, 0.28, 0.65, 0.9},
      {"monterey_cypress", "Monterey Cypress (Cupressus macrocarpa)", SpeciesGroup::Conifer, 20.0, 0.32, 0.75, 0.95},
      {"leyland_cypress", "Leyland Cypress (× Cuprocyparis leylandii)", SpeciesGroup::Conifer, 18.0, 0.30, 0.7, 0.95},
      {"cocos_palm", "Cocos Palm (Syagrus romanzoffiana)", SpeciesGroup::Palm, 15.0, 0.40, 0.5, 0.7},
      {"phoenix_palm", "Phoenix / Canary Palm (Phoenix canariensis)", SpeciesGroup::Palm, 18.0, 0.45, 0.6, 0.8},
      {"washingtonia_palm", "Washingtonia Palm (Washingtonia robusta)", SpeciesGroup::Palm, 14.0, 0.38, 0.5, 0.7},
      {"bangalow_palm", "Bangalow Palm (Archontophoenix cunninghamiana)", SpeciesGroup::Palm, 12.0, 0.35, 0.5, 0.7},
      {"euc_typical", "Eucalypt – Generic/Typical", SpeciesGroup::Generic, 35.0, 0.25, 0.7, 0.9},
      {"unknown_hardwood", "Unknown Hardwood (broadleaf)", SpeciesGroup::Generic, 25.0, 0.28, 0.7, 0.9},
      {"unknown_softwood", "Unknown Softwood / Evergreen", SpeciesGroup::Generic, 18.0, 0.33, 0.75, 0.95},
  };
  return SpeciesCatalog(std::move(rows));
}

}  // namespace arbor
