/*
  Assessment CSV Selftest

  Checks:
    1) Escaping: delimiter, quote and newline trigger quoting; quotes doubled.
    2) Infinity -> "inf" / "-inf"; NaN and unset numbers -> empty cell.
    3) Curve, regional and failure threshold tables: header + one row per
       point, fixed precision.
    4) Summary: stable leading rows; blocked assessments omit scalars but keep
       the issue rows; an unloaded stem exports SF as "inf".
    5) write_text_file() reports an unwritable path by return value; the
       bundle writer throws IOError naming the file.

  Non-zero return code indicates failure.
*/

#include <filesystem>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "engine/analysis/assessment.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/selftest.hpp"
#include "engine/exports/assessment_csv.hpp"

using arbor::selftest::Report;

namespace arbor {
namespace {

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) out.push_back(line);
  return out;
}

bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

void test_escape(Report& r) {
  r.expect_true(csv_escape("plain") == "plain", "escape: plain untouched");
  r.expect_true(csv_escape("a,b") == "\"a,b\"", "escape: delimiter quoted");
  r.expect_true(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"", "escape: quotes doubled");
  r.expect_true(csv_escape("two\nlines") == "\"two\nlines\"", "escape: newline quoted");
  r.expect_true(csv_escape("a,b", ';') == "a,b", "escape: custom delimiter");
}

void test_numbers(Report& r) {
  r.expect_true(csv_double(1.5, 3) == "1.500", "number: fixed precision");
  r.expect_true(csv_double(std::numeric_limits<double>::infinity()) == "inf", "number: +inf spelled out");
  r.expect_true(csv_double(-std::numeric_limits<double>::infinity(), 2) == "-inf", "number: -inf spelled out");
  r.expect_true(csv_double(std::numeric_limits<double>::quiet_NaN()).empty(), "number: NaN empty");
  r.expect_true(csv_double(std::optional<double>{}).empty(), "number: unset empty");
  r.expect_true(csv_double(std::optional<double>{2.0}, 1) == "2.0", "number: set optional");
}

void test_tables(Report& r) {
  Curve c;
  c.points = {{10.0, 3.0}, {20.0, std::numeric_limits<double>::infinity()}};
  CsvExportOptions opt;
  opt.precision = 2;
  const auto rows = lines_of(curve_to_csv(c, "wind_speed_m_s", "safety_factor", opt));
  r.expect_true(rows.size() == 3, "curve: header + 2 rows");
  if (rows.size() == 3) {
    r.expect_true(rows[0] == "wind_speed_m_s,safety_factor", "curve: header");
    r.expect_true(rows[1] == "10.00,3.00", "curve: row");
    r.expect_true(rows[2] == "20.00,inf", "curve: inf y kept");
  }

  opt.include_header = false;
  r.expect_true(lines_of(curve_to_csv(c, "x", "y", opt)).size() == 2, "curve: header optional");

  const std::vector<RegionalResult> reg{{"Region A (32)", 32.0, 4.0}, {"Cyclone (69)", 69.0, 0.5}};
  const auto rr = lines_of(regional_comparison_csv(reg));
  r.expect_true(rr.size() == 3 && rr[0] == "label,wind_speed_m_s,safety_factor", "regional: header");
  if (rr.size() == 3) r.expect_true(rr[2] == "Cyclone (69),69.000000,0.500000", "regional: row");

  FailureThresholdRow ft;
  ft.wind_speed_m_s = 60.0;
  ft.critical_residual_wall_pct = 28.5;
  ft.critical_wall_thickness_cm = 7.125;
  ft.decay_tolerance_pct = 71.5;
  ft.current_wall_below_critical = true;
  CsvExportOptions p1;
  p1.precision = 1;
  const auto tr = lines_of(failure_threshold_table_csv({ft}, p1));
  r.expect_true(tr.size() == 2, "thresholds: header + 1 row");
  if (tr.size() == 2) {
    r.expect_true(tr[0] == "wind_speed_m_s,critical_residual_wall_pct,critical_wall_thickness_cm,"
                           "decay_tolerance_pct,current_wall_below_critical",
                  "thresholds: header");
    r.expect_true(tr[1] == "60.0,28.5,7.1,71.5,true", "thresholds: row");
  }
  r.expect_true(lines_of(failure_threshold_table_csv({})).size() == 1, "thresholds: empty table keeps header");
}

AssessmentInput reference_input() {
  AssessmentInput in;
  in.species_id = "euc_typical";
  in.tree.dbh_cm = 50.0;
  in.tree.height_m = 18.0;
  in.tree.crown_diameter_m = 10.0;
  in.tree.design_wind_speed_m_s = 40.0;
  return in;
}

void test_summary(Report& r) {
  const SpeciesCatalog species = SpeciesCatalog::builtin();
  const WindCatalog winds = WindCatalog::builtin();

  const AssessmentInput in = reference_input();
  const Assessment a = run_assessment(in, species, winds);

  const std::string csv = assessment_summary_csv(a);
  const auto rows = lines_of(csv);
  r.expect_true(rows.size() > 5 && rows[0] == "key,value", "summary: header");
  if (rows.size() > 4) {
    r.expect_true(rows[1] == "species_id,euc_typical", "summary: species first");
    r.expect_true(rows[2] == "blocked,false", "summary: blocked flag");
    r.expect_true(rows[3] == "error_count,0", "summary: error count");
  }
  r.expect_true(contains(csv, "\nsafety_factor,3.04"), "summary: SF exported");
  r.expect_true(contains(csv, "\ncavity_inner_diameter_cm,\n"), "summary: unset cavity is empty");
  r.expect_true(contains(csv, "\nresidual_wall_rating,Tolerable structural condition\n"),
                "summary: residual wall rating");
  r.expect_true(!contains(csv, "pruning_improvement_pct"), "summary: no improvement row without pruning");

  AssessmentInput pruned = in;
  pruned.pruning = PruningRequest{20.0, 10.0};
  r.expect_true(contains(assessment_summary_csv(run_assessment(pruned, species, winds)), "\npruning_improvement_pct,"),
                "summary: improvement row with pruning");
  r.expect_true(!contains(csv, "root_plate_factor"), "summary: root plate rows absent when not assessed");

  AssessmentInput bad = in;
  bad.tree.height_m.reset();
  const std::string blocked = assessment_summary_csv(run_assessment(bad, species, winds));
  r.expect_true(contains(blocked, "blocked,true"), "summary: blocked flag set");
  r.expect_true(!contains(blocked, "safety_factor"), "summary: blocked omits results");
  r.expect_true(contains(blocked, "error:input.height.not_positive,"), "summary: issue row");
}

// Zero site factor means no wind load: SF is +inf and the derived winds are
// unresolved.
void test_unloaded_summary(Report& r) {
  const SpeciesCatalog species = SpeciesCatalog::builtin();
  const WindCatalog winds = WindCatalog::builtin();

  AssessmentInput in = reference_input();
  in.site_factor = 0.0;
  const Assessment a = run_assessment(in, species, winds);
  r.expect_true(!a.blocked, "unloaded: zero site factor does not block");

  const std::string csv = assessment_summary_csv(a);
  r.expect_true(contains(csv, "\nsafety_factor,inf\n"), "unloaded: SF exported as inf");
  r.expect_true(contains(csv, "\nwind_to_failure_m_s,\n"), "unloaded: wind-to-failure empty");
  r.expect_true(contains(csv, "\ncritical_residual_wall_pct,\n"), "unloaded: critical wall empty");

  const auto wind_rows = lines_of(curve_to_csv(a.sf_vs_wind, "wind_speed_m_s", "safety_factor"));
  bool all_inf = wind_rows.size() == a.sf_vs_wind.size() + 1;
  for (std::size_t i = 1; i < wind_rows.size(); ++i) {
    const std::string& row = wind_rows[i];
    if (row.size() < 4 || row.compare(row.size() - 4, 4, ",inf") != 0) all_inf = false;
  }
  r.expect_true(all_inf, "unloaded: every wind sample exports inf");
}

void test_write(Report& r) {
  r.expect_true(!write_text_file("/nonexistent-dir/arbor/out.csv", "x\n"), "write: bad path -> false");

  const Assessment a =
      run_assessment(reference_input(), SpeciesCatalog::builtin(), WindCatalog::builtin());
  try {
    (void)write_assessment_csv_bundle(a, "/nonexistent-dir/arbor");
    r.expect_true(false, "bundle: bad dir throws IOError");
  } catch (const IOError& e) {
    r.expect_true(e.code() == ErrorCode::kIoError, "bundle: IOError code");
    r.expect_true(e.path() == "/nonexistent-dir/arbor/summary.csv", "bundle: first file named");
  }

  const std::filesystem::path dir = std::filesystem::temp_directory_path() / "arbor_csv_selftest";
  std::filesystem::create_directories(dir);
  const auto files = write_assessment_csv_bundle(a, dir.string());
  r.expect_true(files.size() == 6, "bundle: six files without pruning");
  bool all_exist = true;
  for (const auto& f : files) {
    if (!std::filesystem::exists(f)) all_exist = false;
  }
  r.expect_true(all_exist, "bundle: every reported file exists");
  r.expect_true(std::filesystem::exists(dir / "failure_thresholds.csv"), "bundle: threshold table written");
  std::filesystem::remove_all(dir);
}

}  // namespace
}  // namespace arbor

int main() {
  Report r{"assessment_csv"};
  r.run("escape", arbor::test_escape);
  r.run("numbers", arbor::test_numbers);
  r.run("tables", arbor::test_tables);
  r.run("summary", arbor::test_summary);
  r.run("unloaded_summary", arbor::test_unloaded_summary);
  r.run("write", arbor::test_write);
  return r.finish();
}
