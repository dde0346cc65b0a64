#pragma once

#include "psyfit/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace psyfit {

// Session files written by the experiment are named
//
//   2AFC_P_YYYYMMDD_HHMMSS.csv
//
// (local time at session start).
constexpr const char* kSessionFilePrefix = "2AFC_P_";

// Parse the session start time from a session file name.
//
// Expected form: 2AFC_P_YYYYMMDD_HHMMSS[_suffix].ext, e.g.
// "2AFC_P_20251020_003915.csv" or "2AFC_P_20251020_003915_retry.csv".
// Any directory prefix is ignored, as is the extension. Calendar fields are
// validated (month 1-12, day within month, hour < 24, ...).
//
// On success writes "YYYY-MM-DDTHH:MM:SS" to *out_iso (if non-null) and returns
// true.
bool parse_session_timestamp(const std::string& filename, std::string* out_iso);

struct SessionFile {
  std::string path;       // full path (dataset_root joined with the file name)
  std::string filename;   // file name only
  std::string timestamp;  // ISO-8601 from parse_session_timestamp()
};

// List the session files of one dataset directory (non-recursive).
//
// Only regular files starting with kSessionFilePrefix, ending with ".csv"
// (case-insensitive) and carrying a valid timestamp are returned, sorted newest
// first. When num_recent > 0 the list is truncated to the num_recent newest
// sessions.
//
// Throws std::runtime_error if dataset_root is not a readable directory.
std::vector<SessionFile> list_session_files(const std::string& dataset_root, size_t num_recent = 0);

struct TrialTable {
  std::vector<Trial> trials;

  // Rows with an empty or non-numeric trial cell, such as the trailing
  // ",,,,,,,,JND_px,<value>" summary row the experiment appends.
  size_t summary_rows{0};

  // Trial rows that could not be used (non-numeric intensity, unrecognised
  // correctness value, too few columns, broken quoting).
  size_t rows_skipped{0};
};

// Read the trials of one session CSV.
//
// The header must contain the columns "trial", "cmpPx" and "correct"
// (case-insensitive, in any order; a UTF-8 BOM is tolerated). Other columns
// (stdSide, response, rtMs, ...) are ignored.
//
// Throws std::runtime_error if the file cannot be opened or a required column
// is missing.
TrialTable read_trial_csv(const std::string& path);

// Load the num_recent newest sessions (all if 0) of one dataset directory.
//
// Per-file problems (unreadable file, missing columns, skipped rows, no usable
// trials) are recorded in Dataset::warnings and never abort the load. Sessions
// with no usable trials are dropped.
//
// Throws std::runtime_error only if dataset_root itself cannot be listed.
Dataset load_dataset(const std::string& name, const std::string& dataset_root, size_t num_recent = 0);

} // namespace psyfit
