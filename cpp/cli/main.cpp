/*
================================================================================
CLI: Main Entry Point (arbor_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end over the assessment engine.

Usage:
  arbor_cli species
  arbor_cli winds
  arbor_cli assess --species <id> --dbh <cm> --height <m> --crown <m>
                   (--wind <m/s> | --wind-preset <id>) [options]
  arbor_cli help

Exit codes (stable, for scripting):
  0  calculated, SF >= 1
  1  invalid arguments / I/O failure
  2  blocked by input validation errors
  3  calculated, SF < 1
================================================================================
*/

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "engine/analysis/assessment.hpp"
#include "engine/catalog/species_catalog.hpp"
#include "engine/catalog/wind_catalog.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/exports/assessment_csv.hpp"

namespace arbor {
namespace {

enum class ExitCode : int {
  kSafe = 0,
  kError = 1,
  kBlocked = 2,
  kBelowUnity = 3,
};

constexpr int to_int(ExitCode c) { return static_cast<int>(c); }

struct Args {
  AssessmentInput input;
  std::optional<std::string> csv_dir;
  bool verbose = false;
};

void print_usage(std::ostream& os) {
  os <<
    "arbor_cli - tree wind-load safety factor assessment\n"
    "\n"
    "Commands:\n"
    "  species                 List species presets\n"
    "  winds                   List design wind presets\n"
    "  assess [options]        Run an assessment\n"
    "  help                    Show this message\n"
    "\n"
    "assess, required:\n"
    "  --species <id> --dbh <cm> --height <m> --crown <m>\n"
    "  --wind <m/s> | --wind-preset <id>\n"
    "\n"
    "assess, optional:\n"
    "  --cavity <cm> --fullness <0.1..1> --site-factor <x>\n"
    "  --fungi <count> --cavity-decay --cracks --basal-decay --weak-union\n"
    "  --decay-type unknown|white_rot|brown_rot|soft_rot\n"
    "  --decay-location root_plate|stem_base|mid_stem|upper_stem\n"
    "  --decay-severity minor|moderate|severe|extensive\n"
    "  --decay-extent <%> --resonance not_done|solid|drum|hollow --decay-column <m>\n"
    "  --prune-crown <%> --prune-fullness <%>\n"
    "  --soil rocky|clay|clay_loam|loam|sandy|organic\n"
    "  --moisture dry|moist|wet|waterlogged --lean <deg> --lean-change\n"
    "  --heaving --root-decay --severed-roots <%>\n"
    "  --restriction none|pavement|building|wall|excavation\n"
    "  --plate-radius <m> --plate-depth <m>\n"
    "  --csv-dir <dir> --verbose\n"
    "\n"
    "Exit codes: 0 SF>=1, 1 error, 2 blocked by input errors, 3 SF<1\n";
}

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool parse_int(const char* s, int* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0' || v < 0 || v > 1000) return false;
  *out = static_cast<int>(v);
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

RootPlateObservations& root_plate(Args* a) {
  if (!a->input.root_plate) a->input.root_plate.emplace();
  return *a->input.root_plate;
}

PruningRequest& pruning(Args* a) {
  if (!a->input.pruning) a->input.pruning.emplace();
  return *a->input.pruning;
}

// Parses "assess" options starting at argv[first].
bool parse_assess_args(int first, int argc, char** argv, Args* a, std::string* err) {
  AssessmentInput& in = a->input;
  DefectObservations& dx = in.defects;

  for (int i = first; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    // Flags without a value
    if (std::strcmp(k, "--cavity-decay") == 0) { dx.cavity_decay = true; continue; }
    if (std::strcmp(k, "--cracks") == 0) { dx.cracks = true; continue; }
    if (std::strcmp(k, "--basal-decay") == 0) { dx.basal_decay = true; continue; }
    if (std::strcmp(k, "--weak-union") == 0) { dx.weak_union = true; continue; }
    if (std::strcmp(k, "--lean-change") == 0) { root_plate(a).recent_lean_change = true; continue; }
    if (std::strcmp(k, "--heaving") == 0) { root_plate(a).heaving_or_cracking = true; continue; }
    if (std::strcmp(k, "--root-decay") == 0) { root_plate(a).root_decay = true; continue; }
    if (std::strcmp(k, "--verbose") == 0) { a->verbose = true; continue; }

    if (std::strncmp(k, "--", 2) != 0) {
      *err = std::string("Unexpected argument: ") + k;
      return false;
    }
    if (!get_next(i, argc, argv, &v)) {
      *err = std::string(k) + " requires a value";
      return false;
    }

    // String-valued
    if (std::strcmp(k, "--species") == 0) { in.species_id = v; continue; }
    if (std::strcmp(k, "--wind-preset") == 0) { in.wind_preset_id = std::string(v); continue; }
    if (std::strcmp(k, "--csv-dir") == 0) { a->csv_dir = std::string(v); continue; }

    if (std::strcmp(k, "--decay-type") == 0) {
      const auto t = parse_decay_type(v);
      if (!t) { *err = std::string("Unknown --decay-type: ") + v; return false; }
      dx.decay_type = *t;
      continue;
    }
    if (std::strcmp(k, "--decay-location") == 0) {
      const auto l = parse_decay_location(v);
      if (!l) { *err = std::string("Unknown --decay-location: ") + v; return false; }
      dx.decay_location = *l;
      continue;
    }
    if (std::strcmp(k, "--decay-severity") == 0) {
      const auto s = parse_decay_severity(v);
      if (!s) { *err = std::string("Unknown --decay-severity: ") + v; return false; }
      dx.decay_severity = *s;
      continue;
    }
    if (std::strcmp(k, "--resonance") == 0) {
      const auto r = parse_resonance(v);
      if (!r) { *err = std::string("Unknown --resonance: ") + v; return false; }
      dx.resonance = *r;
      continue;
    }
    if (std::strcmp(k, "--soil") == 0) {
      const auto s = parse_soil_type(v);
      if (!s) { *err = std::string("Unknown --soil: ") + v; return false; }
      root_plate(a).soil = *s;
      continue;
    }
    if (std::strcmp(k, "--moisture") == 0) {
      const auto m = parse_soil_moisture(v);
      if (!m) { *err = std::string("Unknown --moisture: ") + v; return false; }
      root_plate(a).moisture = *m;
      continue;
    }
    if (std::strcmp(k, "--restriction") == 0) {
      const auto r = parse_root_zone_restriction(v);
      if (!r) { *err = std::string("Unknown --restriction: ") + v; return false; }
      root_plate(a).restriction = *r;
      continue;
    }

    if (std::strcmp(k, "--fungi") == 0) {
      int n = 0;
      if (!parse_int(v, &n)) { *err = "--fungi must be a fruiting body count (0-1000)"; return false; }
      dx.bracket_fungi = true;
      dx.fruiting_body_count = n;
      continue;
    }

    // Numeric
    double d = 0.0;
    if (!parse_double(v, &d)) {
      *err = std::string(k) + " must be a finite number";
      return false;
    }
    if (std::strcmp(k, "--dbh") == 0) in.tree.dbh_cm = d;
    else if (std::strcmp(k, "--height") == 0) in.tree.height_m = d;
    else if (std::strcmp(k, "--crown") == 0) in.tree.crown_diameter_m = d;
    else if (std::strcmp(k, "--wind") == 0) in.tree.design_wind_speed_m_s = d;
    else if (std::strcmp(k, "--cavity") == 0) in.tree.cavity_inner_diameter_cm = d;
    else if (std::strcmp(k, "--fullness") == 0) in.fullness_override = d;
    else if (std::strcmp(k, "--site-factor") == 0) in.site_factor = d;
    else if (std::strcmp(k, "--decay-extent") == 0) dx.decay_extent_pct = d;
    else if (std::strcmp(k, "--decay-column") == 0) dx.decay_column_height_m = d;
    else if (std::strcmp(k, "--prune-crown") == 0) pruning(a).crown_diameter_reduction_pct = d;
    else if (std::strcmp(k, "--prune-fullness") == 0) pruning(a).fullness_reduction_pct = d;
    else if (std::strcmp(k, "--lean") == 0) root_plate(a).lean_deg = d;
    else if (std::strcmp(k, "--severed-roots") == 0) root_plate(a).severed_roots_pct = d;
    else if (std::strcmp(k, "--plate-radius") == 0) root_plate(a).plate_radius_m = d;
    else if (std::strcmp(k, "--plate-depth") == 0) root_plate(a).plate_depth_m = d;
    else {
      *err = std::string("Unknown argument: ") + k;
      return false;
    }
  }

  if (in.species_id.empty()) { *err = "Missing --species"; return false; }
  if (in.tree.design_wind_speed_m_s && in.wind_preset_id) {
    *err = "Give either --wind or --wind-preset, not both";
    return false;
  }
  if (!in.tree.design_wind_speed_m_s && !in.wind_preset_id) {
    *err = "Missing --wind or --wind-preset";
    return false;
  }
  return true;
}

std::string fmt(double x, int precision = 2) {
  if (std::isinf(x) && x > 0.0) return "very high (no bending stress)";
  if (!std::isfinite(x)) return "n/a";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

std::string fmt(const std::optional<double>& x, int precision = 2) {
  return x ? fmt(*x, precision) : std::string("not in range");
}

void print_issues(const std::vector<ValidationIssue>& issues) {
  for (const auto& i : issues) {
    std::cout << "  [" << (i.is_error ? "ERROR" : "WARN ") << "] " << i.message << " (" << i.code << ")\n";
  }
}

void print_assessment(const Assessment& a) {
  const CalculationResult& r = a.result;
  std::cout << "Species: " << a.species_name << " (" << a.species_id << ")\n";
  std::cout << "Design wind: " << fmt(a.design_wind_speed_m_s, 1) << " m/s\n";
  std::cout << "Defect strength factor: " << fmt(a.defect_strength_factor, 3) << "\n";
  std::cout << "\nResults:\n";
  std::cout << "  Wind pressure:     " << fmt(r.wind_pressure_Pa, 1) << " Pa\n";
  std::cout << "  Projected area:    " << fmt(r.projected_area_m2, 2) << " m2 (fullness " << fmt(r.fullness_used, 2)
            << ")\n";
  std::cout << "  Wind force:        " << fmt(r.wind_force_N, 0) << " N\n";
  std::cout << "  Bending moment:    " << fmt(r.bending_moment_Nm, 0) << " N.m\n";
  std::cout << "  Section modulus:   " << fmt(r.section_modulus_m3, 6) << " m3 (" << (r.is_hollow() ? "hollow" : "solid")
            << ")\n";
  std::cout << "  Bending stress:    " << fmt(r.bending_stress_MPa, 2) << " MPa\n";
  std::cout << "  Safety factor:     " << fmt(r.safety_factor, 2) << " - " << to_string(a.safety_factor_rating) << "\n";
  std::cout << "  Wind to failure:   " << fmt(a.wind_to_failure_m_s, 1) << " m/s - " << to_string(a.wind_margin_rating)
            << "\n";
  std::cout << "  Residual wall:     " << fmt(a.residual_wall_pct, 0) << " % - " << to_string(a.residual_wall_rating)
            << "\n";
  std::cout << "  Critical wall:     " << fmt(a.critical_residual_wall_pct, 0) << " %";
  if (a.critical_wall_thickness_cm) std::cout << " (" << fmt(a.critical_wall_thickness_cm, 1) << " cm)";
  std::cout << "\n";

  if (a.pruning) {
    const PruningScenarioResult& p = *a.pruning;
    std::cout << "\nPruning: crown " << fmt(p.crown_diameter_before_m, 1) << " -> " << fmt(p.crown_diameter_after_m, 1)
              << " m, fullness " << fmt(p.fullness_before, 2) << " -> " << fmt(p.fullness_after, 2) << "\n";
    std::cout << "  SF " << fmt(p.before.safety_factor, 2) << " -> " << fmt(p.after.safety_factor, 2);
    if (a.pruning_improvement_pct) std::cout << " (" << fmt(*a.pruning_improvement_pct, 0) << " %)";
    std::cout << "\n";
  }

  if (!a.failure_thresholds.empty()) {
    std::cout << "\nFailure thresholds (critical residual wall):\n";
    for (const auto& t : a.failure_thresholds) {
      std::cout << "  " << std::setw(4) << fmt(t.wind_speed_m_s, 0) << " m/s  " << std::setw(4)
                << fmt(t.critical_residual_wall_pct, 0) << " %  " << std::setw(5) << fmt(t.critical_wall_thickness_cm, 1)
                << " cm  tolerance " << fmt(t.decay_tolerance_pct, 0) << " %"
                << (t.current_wall_below_critical ? "  current wall below critical" : "") << "\n";
    }
  }

  std::cout << "\nRegional comparison:\n";
  for (const auto& rr : a.regional) {
    std::cout << "  " << std::left << std::setw(16) << rr.label << " SF " << fmt(rr.safety_factor, 2) << "\n";
  }

  if (a.root_plate_factor) {
    std::cout << "\nRoot plate stability: " << fmt(*a.root_plate_factor, 2) << " - "
              << (a.root_plate_risk ? to_string(*a.root_plate_risk) : "") << "\n";
  }
}

int cmd_species() {
  const SpeciesCatalog cat = SpeciesCatalog::builtin();
  std::cout << std::left << std::setw(22) << "id" << std::setw(12) << "group" << std::setw(8) << "fb_MPa"
            << std::setw(6) << "Cd" << std::setw(6) << "kA" << std::setw(6) << "full" << "name\n";
  for (const auto& s : cat.all()) {
    std::cout << std::left << std::setw(22) << s.id << std::setw(12) << to_string(s.group) << std::setw(8)
              << fmt(s.green_bending_strength_MPa, 0) << std::setw(6) << fmt(s.drag_coefficient, 2) << std::setw(6)
              << fmt(s.crown_shape_factor, 2) << std::setw(6) << fmt(s.default_fullness, 2) << s.display_name << "\n";
  }
  return to_int(ExitCode::kSafe);
}

int cmd_winds() {
  const WindCatalog cat = WindCatalog::builtin();
  for (const auto& w : cat.all()) {
    std::cout << std::left << std::setw(10) << w.id << std::setw(6) << fmt(w.design_wind_speed_m_s, 0) << w.display_name
              << "\n";
  }
  return to_int(ExitCode::kSafe);
}

int cmd_assess(int argc, char** argv) {
  Args args;
  std::string err;
  if (!parse_assess_args(2, argc, argv, &args, &err)) {
    log_error(err);
    print_usage(std::cerr);
    return to_int(ExitCode::kError);
  }
  if (args.verbose) set_log_level(LogLevel::DEBUG);

  const SpeciesCatalog species = SpeciesCatalog::builtin();
  const WindCatalog winds = WindCatalog::builtin();
  const Assessment a = run_assessment(args.input, species, winds, EngineSettings::defaults());

  if (a.blocked) {
    std::cout << "Assessment blocked by input errors:\n";
    print_issues(a.issues);
    return to_int(ExitCode::kBlocked);
  }

  print_assessment(a);
  if (!a.issues.empty()) {
    std::cout << "\nNotes:\n";
    print_issues(a.issues);
  }

  if (args.csv_dir) {
    // IOError propagates to main() and maps to ExitCode::kError.
    const auto files = write_assessment_csv_bundle(a, *args.csv_dir);
    log_info(std::to_string(files.size()) + " CSV files written to '" + *args.csv_dir + "'");
  }

  return a.result.safety_factor >= 1.0 ? to_int(ExitCode::kSafe) : to_int(ExitCode::kBelowUnity);
}

}  // namespace
}  // namespace arbor

int main(int argc, char** argv) {
  using namespace arbor;
  init_log_level_from_env();

  const std::string cmd = (argc >= 2) ? std::string(argv[1]) : "help";

  try {
    if (cmd == "help" || cmd == "-h" || cmd == "--help") {
      print_usage(std::cout);
      return to_int(ExitCode::kSafe);
    }
    if (cmd == "species") return cmd_species();
    if (cmd == "winds") return cmd_winds();
    if (cmd == "assess") return cmd_assess(argc, argv);
  } catch (const ArborError& e) {
    log_error(std::string("arbor error ") + to_string(e.code()) + ": " + e.what());
    return to_int(ExitCode::kError);
  } catch (const std::exception& e) {
    log_error(std::string("unexpected error: ") + e.what());
    return to_int(ExitCode::kError);
  }

  log_error("Unknown command: " + cmd);
  std::cerr << "Run 'arbor_cli help' for usage information.\n";
  return to_int(ExitCode::kError);
}
