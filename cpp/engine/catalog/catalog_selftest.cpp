/*
  Catalog Selftest

  Checks:
    1) Built-in species table: 60 valid, uniquely keyed entries in catalogue
       order; the typical eucalypt carries the reference properties.
    2) Built-in wind table: 8 presets, A-D urban/open, 35-60 m/s.
    3) find() -> nullptr and at() -> LookupError for unknown ids.
    4) Construction rejects invalid and duplicate entries.

  Non-zero return code indicates failure.
*/

#include <set>
#include <string>
#include <vector>

#include "engine/catalog/species_catalog.hpp"
#include "engine/catalog/wind_catalog.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"

using arbor::selftest::Report;

namespace arbor {
namespace {

void test_species_builtin(Report& r) {
  const SpeciesCatalog cat = SpeciesCatalog::builtin();
  r.expect_true(cat.size() == 60, "species: 60 entries");
  r.expect_true(cat.all().front().id == "ironbark", "species: catalogue order starts with ironbark");

  std::set<std::string> ids;
  bool fullness_ok = true;
  for (const auto& s : cat.all()) {
    ids.insert(s.id);
    if (!(s.default_fullness > 0.0 && s.default_fullness <= 1.0)) fullness_ok = false;
  }
  r.expect_true(ids.size() == cat.size(), "species: ids unique");
  r.expect_true(fullness_ok, "species: default fullness in (0, 1]");

  const SpeciesProfile* t = cat.find("euc_typical");
  r.expect_true(t != nullptr, "species: euc_typical present");
  if (t) {
    r.expect_true(t->green_bending_strength_MPa == 35.0 && t->drag_coefficient == 0.25 &&
                      t->crown_shape_factor == 0.7 && t->default_fullness == 0.9,
                  "species: euc_typical = 35 MPa / Cd 0.25 / kA 0.7 / 0.9");
  }

  const SpeciesProfile& palm = cat.at("cocos_palm");
  r.expect_true(palm.group == SpeciesGroup::Palm, "species: at() returns grouped profile");
}

void test_wind_builtin(Report& r) {
  const WindCatalog cat = WindCatalog::builtin();
  r.expect_true(cat.size() == 8, "wind: 8 presets");
  r.expect_true(cat.at("A_urban").design_wind_speed_m_s == 35.0, "wind: A_urban 35 m/s");
  r.expect_true(cat.at("D_open").design_wind_speed_m_s == 60.0, "wind: D_open 60 m/s");

  bool in_range = true;
  for (const auto& w : cat.all()) {
    if (w.design_wind_speed_m_s < 35.0 || w.design_wind_speed_m_s > 60.0) in_range = false;
  }
  r.expect_true(in_range, "wind: all presets within 35-60 m/s");
}

void test_lookup_errors(Report& r) {
  const SpeciesCatalog species = SpeciesCatalog::builtin();
  const WindCatalog winds = WindCatalog::builtin();
  r.expect_true(species.find("baobab") == nullptr, "lookup: unknown species -> nullptr");
  r.expect_true(winds.find("E_open") == nullptr, "lookup: unknown wind -> nullptr");
  r.expect_throws<LookupError>([&] { (void)species.at("baobab"); }, "lookup: species at() throws");
  r.expect_throws<LookupError>([&] { (void)winds.at("E_open"); }, "lookup: wind at() throws");

  try {
    (void)species.at("baobab");
  } catch (const LookupError& e) {
    r.expect_true(e.code() == ErrorCode::kUnknownSpecies && e.key() == "baobab", "lookup: code and key carried");
  }
}

void test_construction(Report& r) {
  SpeciesProfile ok{"a", "A", SpeciesGroup::Generic, 30.0, 0.3, 0.7, 0.9};
  SpeciesProfile bad_cd{"b", "B", SpeciesGroup::Generic, 30.0, 0.0, 0.7, 0.9};
  SpeciesProfile bad_full{"c", "C", SpeciesGroup::Generic, 30.0, 0.3, 0.7, 1.5};

  r.expect_throws<ValidationError>([&] { SpeciesCatalog c({ok, ok}); }, "construct: duplicate species rejected");
  r.expect_throws<ValidationError>([&] { SpeciesCatalog c({ok, bad_cd}); }, "construct: Cd 0 rejected");
  r.expect_throws<ValidationError>([&] { SpeciesCatalog c({bad_full}); }, "construct: fullness > 1 rejected");
  const std::vector<WindProfile> negative{WindProfile{"x", "X", -5.0}};
  r.expect_throws<ValidationError>([&] { WindCatalog c(negative); }, "construct: negative wind rejected");

  const SpeciesCatalog one({ok});
  r.expect_true(one.size() == 1 && one.find("a") != nullptr, "construct: custom catalogue usable");
}

}  // namespace
}  // namespace arbor

int main() {
  Report r{"catalog"};
  r.run("species_builtin", arbor::test_species_builtin);
  r.run("wind_builtin", arbor::test_wind_builtin);
  r.run("lookup_errors", arbor::test_lookup_errors);
  r.run("construction", arbor::test_construction);
  return r.finish();
}
