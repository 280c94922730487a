#pragma once
/*
================================================================================
Exports: Assessment CSV
FILE: cpp/engine/exports/assessment_csv.hpp

Purpose:
  - Turn curves and assessment results into deterministic CSV text for
    spreadsheets and report tooling.

Hardening:
  - Strings quoted RFC-4180 style when they contain the delimiter, a quote or
    a line break; embedded quotes doubled.
  - +inf exports as "inf" (an unloaded stem's SF), -inf as "-inf".
    NaN and unset numbers ("no threshold in range") export as an empty cell.
  - Fixed precision, stable row order.
  - write_text_file() reports failure by return value only;
    write_assessment_csv_bundle() throws IOError naming the failed file.
================================================================================
*/

#include <optional>
#include <string>
#include <vector>

#include "engine/analysis/assessment.hpp"
#include "engine/core/tree.hpp"

namespace arbor {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 6;
};

std::string csv_escape(const std::string& s, char delim = ',');

// "inf" / "-inf" for infinities, empty for NaN.
std::string csv_double(double x, int precision = 6);
std::string csv_double(const std::optional<double>& x, int precision = 6);

// Two columns, one row per point.
std::string curve_to_csv(const Curve& curve,
                         const std::string& x_header,
                         const std::string& y_header,
                         const CsvExportOptions& opt = CsvExportOptions());

// key,value rows for every scalar output (plus the issue list).
std::string assessment_summary_csv(const Assessment& a, const CsvExportOptions& opt = CsvExportOptions());

// label,wind_speed_m_s,safety_factor
std::string regional_comparison_csv(const std::vector<RegionalResult>& rows,
                                    const CsvExportOptions& opt = CsvExportOptions());

// wind_speed_m_s,critical_residual_wall_pct,critical_wall_thickness_cm,
// decay_tolerance_pct,current_wall_below_critical
std::string failure_threshold_table_csv(const std::vector<FailureThresholdRow>& rows,
                                        const CsvExportOptions& opt = CsvExportOptions());

// Returns false on any I/O failure.
bool write_text_file(const std::string& file_path, const std::string& text) noexcept;

// Writes summary.csv, sf_vs_wind.csv, sf_vs_residual_wall.csv,
// decay_tolerance.csv, failure_thresholds.csv, regional.csv and, when pruning
// was assessed, sf_vs_reduction.csv into dir. Returns the paths written.
// Throws IOError on the first file that cannot be written.
std::vector<std::string> write_assessment_csv_bundle(const Assessment& a, const std::string& dir);

}  // namespace arbor
