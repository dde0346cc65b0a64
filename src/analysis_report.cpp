#include "psyfit/analysis_report.hpp"

#include "psyfit/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace psyfit {

namespace {

static std::string fmt_fixed(double v, int digits) {
  if (!std::isfinite(v)) return "N/A";
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::fixed << std::setprecision(digits) << v;
  return oss.str();
}

static std::string pad_right(const std::string& s, size_t width) {
  if (s.size() >= width) return s + " ";
  return s + std::string(width - s.size(), ' ');
}

static std::string target_percent_label(double target) {
  return fmt_fixed(target * 100.0, 1) + "%";
}

static void mean_and_pop_std(const std::vector<double>& xs, double* mean, double* sd) {
  double m = 0.0;
  for (double x : xs) m += x;
  m /= static_cast<double>(xs.size());
  double ss = 0.0;
  for (double x : xs) ss += (x - m) * (x - m);
  *mean = m;
  *sd = std::sqrt(ss / static_cast<double>(xs.size()));
}

static void append_range_block(std::ostringstream& oss,
                               const std::string& label,
                               const std::vector<double>& xs) {
  const auto mm = std::minmax_element(xs.begin(), xs.end());
  double mean = 0.0;
  double sd = 0.0;
  mean_and_pop_std(xs, &mean, &sd);
  const std::string indent(label.size() + 3, ' ');
  oss << label << " - Range: " << fmt_fixed(*mm.first, 1) << " - " << fmt_fixed(*mm.second, 1) << "\n";
  oss << indent << "Mean: " << fmt_fixed(mean, 1) << " +/- " << fmt_fixed(sd, 1) << "\n";
}

} // namespace

std::string analysis_result_to_json(const AnalysisResult& r) {
  std::ostringstream out;
  out.imbue(std::locale::classic());

  out << "{\n";
  out << "  \"Dataset\": \"" << json_escape(r.dataset) << "\",\n";
  out << "  \"Model\": \"" << model_kind_name(r.model) << "\",\n";
  out << "  \"Target\": " << format_double_exact(r.target) << ",\n";
  out << "  \"NTrials\": " << r.n_trials << ",\n";
  out << "  \"OverallAccuracy\": " << format_double_exact(r.overall_accuracy) << ",\n";
  out << "  \"StimulusMin\": " << format_double_exact(r.stimulus_min) << ",\n";
  out << "  \"StimulusMax\": " << format_double_exact(r.stimulus_max) << ",\n";
  out << "  \"SimpleThreshold\": " << format_double_exact(r.simple_threshold.value) << ",\n";
  out << "  \"SimpleThresholdMethod\": \"" << threshold_method_name(r.simple_threshold.method) << "\",\n";
  out << "  \"FitStatus\": \"" << fit_status_name(r.fit_status) << "\",\n";
  out << "  \"FitMessage\": \"" << json_escape(r.fit_message) << "\",\n";
  out << "  \"RSquared\": " << (r.fit ? format_double_exact(r.fit->r_squared) : std::string("null")) << ",\n";
  out << "  \"FittedThreshold\": " << format_double_exact(r.fitted_threshold()) << ",\n";

  out << "  \"Parameters\": ";
  if (r.fit) {
    out << "{";
    for (size_t i = 0; i < r.fit->parameters.size(); ++i) {
      if (i) out << ", ";
      out << "\"" << json_escape(r.fit->parameter_names[i]) << "\": "
          << format_double_exact(r.fit->parameters[i]);
    }
    out << "},\n";
  } else {
    out << "null,\n";
  }

  out << "  \"Levels\": [";
  for (size_t i = 0; i < r.levels.size(); ++i) {
    const PerformanceLevel& lv = r.levels[i];
    out << (i ? ",\n    " : "\n    ");
    out << "{\"Intensity\": " << format_double_exact(lv.intensity)
        << ", \"ProportionCorrect\": " << format_double_exact(lv.proportion_correct)
        << ", \"TrialCount\": " << lv.trial_count << "}";
  }
  out << (r.levels.empty() ? "],\n" : "\n  ],\n");

  out << "  \"Sessions\": [";
  for (size_t i = 0; i < r.sessions.size(); ++i) {
    const SessionInfo& s = r.sessions[i];
    out << (i ? ",\n    " : "\n    ");
    out << "{\"File\": \"" << json_escape(s.filename) << "\", \"Timestamp\": ";
    if (s.timestamp.empty()) {
      out << "null";
    } else {
      out << "\"" << json_escape(s.timestamp) << "\"";
    }
    out << ", \"NTrials\": " << s.trial_count
        << ", \"Accuracy\": " << format_double_exact(s.accuracy) << "}";
  }
  out << (r.sessions.empty() ? "]\n" : "\n  ]\n");
  out << "}\n";
  return out.str();
}

void write_analysis_json(const std::string& path, const AnalysisResult& r) {
  if (!write_text_file(path, analysis_result_to_json(r))) {
    throw std::runtime_error("Failed to write analysis JSON: " + path);
  }
}

AnalysisSummary parse_analysis_summary_json(const std::string& json) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  AnalysisSummary s;
  s.dataset = json_find_string_value(json, "Dataset");
  s.model = json_find_string_value(json, "Model");
  s.target = json_find_double_value(json, "Target", nan);
  const int n = json_find_int_value(json, "NTrials", 0);
  s.n_trials = (n > 0) ? static_cast<size_t>(n) : 0;
  s.overall_accuracy = json_find_double_value(json, "OverallAccuracy", nan);
  s.stimulus_min = json_find_double_value(json, "StimulusMin", nan);
  s.stimulus_max = json_find_double_value(json, "StimulusMax", nan);
  s.simple_threshold = json_find_double_value(json, "SimpleThreshold", nan);
  s.simple_threshold_method = json_find_string_value(json, "SimpleThresholdMethod");
  s.fit_status = json_find_string_value(json, "FitStatus");
  s.fit_message = json_find_string_value(json, "FitMessage");
  s.r_squared = json_find_double_value(json, "RSquared", nan);
  s.fitted_threshold = json_find_double_value(json, "FittedThreshold", nan);
  return s;
}

AnalysisSummary read_analysis_summary(const std::string& path) {
  return parse_analysis_summary_json(read_text_file(path));
}

void write_levels_csv(const std::string& path, const std::vector<PerformanceLevel>& levels) {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << "intensity,proportion_correct,trial_count\n";
  for (const auto& lv : levels) {
    out << format_double_exact(lv.intensity) << "," << format_double_exact(lv.proportion_correct) << ","
        << lv.trial_count << "\n";
  }
  if (!write_text_file(path, out.str())) {
    throw std::runtime_error("Failed to write levels CSV: " + path);
  }
}

std::string format_dataset_report(const AnalysisResult& r) {
  std::ostringstream oss;
  const std::string pct = target_percent_label(r.target);

  oss << "=== Analyzing " << r.dataset << " ===\n";
  oss << "Sessions: " << r.sessions.size() << "\n";
  oss << "Total trials: " << r.n_trials << "\n";
  oss << "Overall accuracy: " << fmt_fixed(r.overall_accuracy, 3) << "\n";
  oss << "Stimulus range: " << fmt_fixed(r.stimulus_min, 1) << " to " << fmt_fixed(r.stimulus_max, 1) << "\n";
  oss << "Levels (>= min trials): " << r.levels.size() << "\n";

  oss << "\nSimple threshold estimate (" << pct << "): ";
  if (r.simple_threshold.determined()) {
    oss << fmt_fixed(r.simple_threshold.value, 1) << " ("
        << threshold_method_name(r.simple_threshold.method) << ")\n";
  } else {
    oss << "could not determine (fewer than " << kMinLevelsForInterpolation << " levels)\n";
  }

  oss << "\nPsychometric curve fitting (" << model_kind_name(r.model) << "):\n";
  if (!r.fit) {
    oss << "Fit failed";
    if (!r.fit_message.empty()) oss << ": " << r.fit_message;
    oss << "\n";
    return oss.str();
  }

  const FitResult& f = *r.fit;
  oss << "R-squared: " << fmt_fixed(f.r_squared, 3) << "\n";
  oss << "Parameters:";
  for (size_t i = 0; i < f.parameters.size(); ++i) {
    oss << (i ? ", " : " ") << f.parameter_names[i] << "=";
    // Slope parameters are small; show more digits.
    const int digits = (r.model == ModelKind::Logistic && i == 1) ? 4 : 3;
    oss << fmt_fixed(f.parameters[i], digits);
    const double se = f.parameter_stderr(i);
    if (std::isfinite(se)) oss << " (se " << fmt_fixed(se, digits) << ")";
  }
  oss << "\n";
  oss << "Curve-fitted threshold (" << pct << "): ";
  if (f.threshold_determined()) {
    oss << fmt_fixed(f.threshold, 1) << "\n";
  } else {
    oss << "could not determine (curve may not reach " << pct << ")\n";
  }
  return oss.str();
}

std::string format_threshold_summary(const std::vector<AnalysisResult>& results) {
  std::ostringstream oss;
  const std::string rule(80, '=');
  const double target = results.empty() ? kStaircaseTarget : results.front().target;

  oss << rule << "\n";
  oss << "THRESHOLD SUMMARY (" << target_percent_label(target) << " correct level)\n";
  oss << rule << "\n";

  if (results.empty()) {
    oss << "No valid thresholds found!\n";
    return oss.str();
  }

  oss << pad_right("Dataset", 12) << pad_right("Simple Est.", 13) << pad_right("Fitted Est.", 13)
      << pad_right("R^2", 9) << "N Trials\n";
  oss << std::string(70, '-') << "\n";

  std::vector<double> simple;
  std::vector<std::string> simple_names;
  std::vector<double> fitted;
  for (const auto& r : results) {
    const double st = r.simple_threshold.value;
    const double ft = r.fitted_threshold();
    const std::string r2 = r.fit ? fmt_fixed(r.fit->r_squared, 3) : std::string("N/A");
    oss << pad_right(r.dataset, 12) << pad_right(fmt_fixed(st, 1), 13) << pad_right(fmt_fixed(ft, 1), 13)
        << pad_right(r2, 9) << r.n_trials << "\n";
    if (std::isfinite(st)) {
      simple.push_back(st);
      simple_names.push_back(r.dataset);
    }
    if (std::isfinite(ft)) fitted.push_back(ft);
  }

  oss << "\nThreshold comparison:\n";
  if (simple.size() > 1) append_range_block(oss, "Simple estimates", simple);
  if (fitted.size() > 1) append_range_block(oss, "Fitted estimates", fitted);

  if (simple.size() > 1 && simple.front() != 0.0) {
    oss << "\nRelative threshold ratios (using simple estimates):\n";
    for (size_t i = 1; i < simple.size(); ++i) {
      oss << simple_names[i] << " vs " << simple_names[0] << ": " << fmt_fixed(simple[i] / simple[0], 2) << "x\n";
    }
  }
  return oss.str();
}

} // namespace psyfit
