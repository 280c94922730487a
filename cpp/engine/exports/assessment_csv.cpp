#include "engine/exports/assessment_csv.hpp"

#include <cmath>
#include <exception>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "engine/core/errors.hpp"

namespace arbor {

std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }
  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

std::string csv_double(double x, int precision) {
  if (std::isnan(x)) return "";
  if (std::isinf(x)) return x > 0.0 ? "inf" : "-inf";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

std::string csv_double(const std::optional<double>& x, int precision) {
  return x.has_value() ? csv_double(*x, precision) : std::string{};
}

std::string curve_to_csv(const Curve& curve,
                         const std::string& x_header,
                         const std::string& y_header,
                         const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  std::ostringstream out;
  if (opt.include_header) out << csv_escape(x_header, d) << d << csv_escape(y_header, d) << "\n";
  for (const auto& p : curve.points) {
    out << csv_double(p.x, opt.precision) << d << csv_double(p.y, opt.precision) << "\n";
  }
  return out.str();
}

namespace {

class SummaryWriter final {
 public:
  explicit SummaryWriter(const CsvExportOptions& opt) : opt_(opt) {
    if (opt_.include_header) out_ << "key" << opt_.delimiter << "value\n";
  }

  void text(const std::string& key, const std::string& value) {
    out_ << csv_escape(key, opt_.delimiter) << opt_.delimiter << csv_escape(value, opt_.delimiter) << "\n";
  }

  void num(const std::string& key, double v) { text(key, csv_double(v, opt_.precision)); }
  void num(const std::string& key, const std::optional<double>& v) { text(key, csv_double(v, opt_.precision)); }

  std::string str() const { return out_.str(); }

 private:
  const CsvExportOptions& opt_;
  std::ostringstream out_;
};

}  // namespace

std::string assessment_summary_csv(const Assessment& a, const CsvExportOptions& opt) {
  SummaryWriter w(opt);

  w.text("species_id", a.species_id);
  w.text("blocked", a.blocked ? "true" : "false");
  w.text("error_count", std::to_string(count_errors(a.issues)));
  w.text("warning_count", std::to_string(count_warnings(a.issues)));

  if (!a.blocked) {
    w.text("species_name", a.species_name);
    w.num("design_wind_speed_m_s", a.design_wind_speed_m_s);
    w.num("dbh_cm", a.geometry.dbh_cm);
    w.num("height_m", a.geometry.height_m);
    w.num("crown_diameter_m", a.geometry.crown_diameter_m);
    w.num("cavity_inner_diameter_cm", a.geometry.cavity_inner_diameter_cm);
    w.num("defect_strength_factor", a.defect_strength_factor);

    const CalculationResult& r = a.result;
    w.num("wind_pressure_Pa", r.wind_pressure_Pa);
    w.num("fullness_used", r.fullness_used);
    w.num("crown_plan_area_m2", r.crown_plan_area_m2);
    w.num("projected_area_m2", r.projected_area_m2);
    w.num("wind_force_N", r.wind_force_N);
    w.num("lever_arm_m", r.lever_arm_m);
    w.num("bending_moment_Nm", r.bending_moment_Nm);
    w.num("section_modulus_m3", r.section_modulus_m3);
    w.num("bending_stress_MPa", r.bending_stress_MPa);
    w.num("effective_strength_MPa", r.effective_strength_MPa);
    w.num("safety_factor", r.safety_factor);
    w.text("safety_factor_rating", to_string(a.safety_factor_rating));
    w.num("wind_to_failure_m_s", a.wind_to_failure_m_s);
    w.text("wind_margin_rating", to_string(a.wind_margin_rating));

    w.num("residual_wall_pct", a.residual_wall_pct);
    w.text("residual_wall_rating", to_string(a.residual_wall_rating));
    w.num("critical_residual_wall_pct", a.critical_residual_wall_pct);
    w.num("critical_wall_thickness_cm", a.critical_wall_thickness_cm);

    if (a.pruning) {
      w.num("pruning_crown_before_m", a.pruning->crown_diameter_before_m);
      w.num("pruning_crown_after_m", a.pruning->crown_diameter_after_m);
      w.num("pruning_fullness_before", a.pruning->fullness_before);
      w.num("pruning_fullness_after", a.pruning->fullness_after);
      w.num("pruning_sf_before", a.pruning->before.safety_factor);
      w.num("pruning_sf_after", a.pruning->after.safety_factor);
      w.num("pruning_improvement_pct", a.pruning_improvement_pct);
    }
    if (a.root_plate_factor) {
      w.num("root_plate_factor", a.root_plate_factor);
      w.text("root_plate_risk", a.root_plate_risk ? to_string(*a.root_plate_risk) : "");
    }
  }

  for (const auto& i : a.issues) {
    w.text(std::string(i.is_error ? "error:" : "warning:") + i.code, i.message);
  }
  return w.str();
}

std::string regional_comparison_csv(const std::vector<RegionalResult>& rows, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  std::ostringstream out;
  if (opt.include_header) out << "label" << d << "wind_speed_m_s" << d << "safety_factor\n";
  for (const auto& r : rows) {
    out << csv_escape(r.label, d) << d << csv_double(r.wind_speed_m_s, opt.precision) << d
        << csv_double(r.safety_factor, opt.precision) << "\n";
  }
  return out.str();
}

std::string failure_threshold_table_csv(const std::vector<FailureThresholdRow>& rows,
                                        const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  std::ostringstream out;
  if (opt.include_header) {
    out << "wind_speed_m_s" << d << "critical_residual_wall_pct" << d << "critical_wall_thickness_cm" << d
        << "decay_tolerance_pct" << d << "current_wall_below_critical\n";
  }
  for (const auto& r : rows) {
    out << csv_double(r.wind_speed_m_s, opt.precision) << d << csv_double(r.critical_residual_wall_pct, opt.precision)
        << d << csv_double(r.critical_wall_thickness_cm, opt.precision) << d
        << csv_double(r.decay_tolerance_pct, opt.precision) << d << (r.current_wall_below_critical ? "true" : "false")
        << "\n";
  }
  return out.str();
}

bool write_text_file(const std::string& file_path, const std::string& text) noexcept {
  try {
    std::ofstream ofs(file_path, std::ios::out | std::ios::trunc);
    if (!ofs.is_open()) return false;
    ofs << text;
    ofs.flush();
    return ofs.good();
  } catch (const std::exception&) {
    return false;
  }
}

std::vector<std::string> write_assessment_csv_bundle(const Assessment& a, const std::string& dir) {
  const std::string base = (dir.empty() || dir.back() == '/') ? dir : dir + "/";
  std::vector<std::string> written;

  const auto put = [&](const char* name, const std::string& text) {
    const std::string path = base + name;
    if (!write_text_file(path, text)) throw IOError("cannot write CSV file '" + path + "'", path, ARBOR_SITE);
    written.push_back(path);
  };

  put("summary.csv", assessment_summary_csv(a));
  put("sf_vs_wind.csv", curve_to_csv(a.sf_vs_wind, "wind_speed_m_s", "safety_factor"));
  put("sf_vs_residual_wall.csv", curve_to_csv(a.sf_vs_residual_wall, "residual_wall_pct", "safety_factor"));
  put("decay_tolerance.csv", curve_to_csv(a.decay_tolerance, "wind_speed_m_s", "critical_residual_wall_pct"));
  put("failure_thresholds.csv", failure_threshold_table_csv(a.failure_thresholds));
  put("regional.csv", regional_comparison_csv(a.regional));
  if (!a.sf_vs_reduction.empty()) {
    put("sf_vs_reduction.csv", curve_to_csv(a.sf_vs_reduction, "crown_reduction_pct", "safety_factor"));
  }
  return written;
}

}  // namespace arbor
