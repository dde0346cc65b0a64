#include "psyfit/session_loader.hpp"

#include "psyfit/dataset_analyzer.hpp"
#include "psyfit/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace psyfit {

namespace {

static bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

static bool is_leap_year(int y) {
  return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

static int days_in_month(int y, int m) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && is_leap_year(y)) return 29;
  return kDays[m - 1];
}

static std::string two_digits(int v) {
  std::string s = std::to_string(v);
  if (s.size() < 2) s = "0" + s;
  return s;
}

static std::string basename_of(const std::string& path) {
  const size_t pos = path.find_last_of("/\\");
  return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

static int find_column(const std::vector<std::string>& header, const std::string& name) {
  const std::string key = to_lower(name);
  for (size_t i = 0; i < header.size(); ++i) {
    if (to_lower(trim(header[i])) == key) return static_cast<int>(i);
  }
  return -1;
}

} // namespace

bool parse_session_timestamp(const std::string& filename, std::string* out_iso) {
  std::string base = basename_of(filename);
  if (!starts_with(base, kSessionFilePrefix)) return false;
  base = base.substr(std::string(kSessionFilePrefix).size());

  const size_t dot = base.find('.');
  if (dot != std::string::npos) base = base.substr(0, dot);

  // YYYYMMDD_HHMMSS, optionally followed by "_<suffix>"
  if (base.size() < 15 || base[8] != '_') return false;
  if (base.size() > 15 && base[15] != '_') return false;
  const std::string date = base.substr(0, 8);
  const std::string time = base.substr(9, 6);
  if (!all_digits(date) || !all_digits(time)) return false;

  const int year = std::stoi(date.substr(0, 4));
  const int month = std::stoi(date.substr(4, 2));
  const int day = std::stoi(date.substr(6, 2));
  const int hour = std::stoi(time.substr(0, 2));
  const int minute = std::stoi(time.substr(2, 2));
  const int second = std::stoi(time.substr(4, 2));

  if (month < 1 || month > 12) return false;
  if (day < 1 || day > days_in_month(year, month)) return false;
  if (hour > 23 || minute > 59 || second > 59) return false;

  if (out_iso) {
    *out_iso = date.substr(0, 4) + "-" + two_digits(month) + "-" + two_digits(day) + "T" +
               two_digits(hour) + ":" + two_digits(minute) + ":" + two_digits(second);
  }
  return true;
}

std::vector<SessionFile> list_session_files(const std::string& dataset_root, size_t num_recent) {
  const std::filesystem::path root = std::filesystem::u8path(dataset_root);
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    throw std::runtime_error("Dataset directory not found: " + dataset_root);
  }

  std::vector<SessionFile> out;
  std::filesystem::directory_iterator it(root, ec);
  if (ec) {
    throw std::runtime_error("Failed to list dataset directory: " + dataset_root + " (" + ec.message() + ")");
  }
  for (const auto& entry : it) {
    std::error_code fec;
    if (!entry.is_regular_file(fec)) continue;
    const std::string fname = entry.path().filename().u8string();
    if (!starts_with(fname, kSessionFilePrefix)) continue;
    if (!ends_with(to_lower(fname), ".csv")) continue;

    SessionFile sf;
    if (!parse_session_timestamp(fname, &sf.timestamp)) continue;
    sf.path = entry.path().u8string();
    sf.filename = fname;
    out.push_back(sf);
  }

  // ISO timestamps sort lexicographically; file name breaks ties.
  std::sort(out.begin(), out.end(), [](const SessionFile& a, const SessionFile& b) {
    if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
    return a.filename > b.filename;
  });

  if (num_recent > 0 && out.size() > num_recent) out.resize(num_recent);
  return out;
}

TrialTable read_trial_csv(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open session CSV: " + path);

  std::string line;
  bool have_header = false;
  while (std::getline(f, line)) {
    if (!trim(line).empty()) {
      have_header = true;
      break;
    }
  }
  if (!have_header) throw std::runtime_error("Session CSV is empty: " + path);

  line = strip_utf8_bom(line);
  if (!line.empty() && line.back() == '\r') line.pop_back();
  const std::vector<std::string> header = split_csv_row(line, ',');

  const int col_trial = find_column(header, "trial");
  const int col_x = find_column(header, "cmpPx");
  const int col_correct = find_column(header, "correct");
  if (col_trial < 0 || col_x < 0 || col_correct < 0) {
    throw std::runtime_error("Session CSV is missing required columns (trial, cmpPx, correct): " + path);
  }
  const size_t need = static_cast<size_t>(std::max(col_trial, std::max(col_x, col_correct))) + 1;

  TrialTable out;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;

    std::vector<std::string> row;
    try {
      row = split_csv_row(line, ',');
    } catch (const std::runtime_error&) {
      ++out.rows_skipped;
      continue;
    }
    if (row.size() < need) {
      ++out.rows_skipped;
      continue;
    }

    double trial_no = 0.0;
    if (!try_parse_double(row[static_cast<size_t>(col_trial)], &trial_no)) {
      ++out.summary_rows;
      continue;
    }
    Trial t;
    if (!try_parse_double(row[static_cast<size_t>(col_x)], &t.stimulus_intensity) ||
        !std::isfinite(t.stimulus_intensity) ||
        !try_parse_bool(row[static_cast<size_t>(col_correct)], &t.correct)) {
      ++out.rows_skipped;
      continue;
    }
    out.trials.push_back(t);
  }
  return out;
}

Dataset load_dataset(const std::string& name, const std::string& dataset_root, size_t num_recent) {
  Dataset ds;
  ds.name = name;

  const std::vector<SessionFile> files = list_session_files(dataset_root, num_recent);
  if (files.empty()) {
    ds.warnings.push_back("No session files found in " + dataset_root);
    return ds;
  }

  for (const auto& sf : files) {
    TrialTable table;
    try {
      table = read_trial_csv(sf.path);
    } catch (const std::exception& e) {
      ds.warnings.push_back(sf.filename + ": " + e.what());
      continue;
    }
    if (table.rows_skipped > 0) {
      ds.warnings.push_back(sf.filename + ": skipped " + std::to_string(table.rows_skipped) +
                            " malformed row(s)");
    }
    if (table.trials.empty()) {
      ds.warnings.push_back(sf.filename + ": no usable trials");
      continue;
    }

    Session s;
    s.info = summarize_session(sf.filename, sf.timestamp, table.trials);
    s.trials = std::move(table.trials);
    ds.sessions.push_back(std::move(s));
  }
  return ds;
}

} // namespace psyfit
