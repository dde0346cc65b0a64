#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace psyfit {

// One 2AFC trial as recorded by the experiment.
//
// stimulus_intensity is the comparison stimulus value shown on this trial
// (cmpPx in the session CSV files). The record is validated at the loading
// boundary; analysis code only reads it.
struct Trial {
  double stimulus_intensity{0.0};
  bool correct{false};
};

// Performance at one distinct stimulus intensity.
//
// Produced by aggregate_levels(). Within one aggregation intensities are unique
// and levels are ordered by ascending intensity.
struct PerformanceLevel {
  double intensity{0.0};
  double proportion_correct{0.0};  // in [0,1]
  size_t trial_count{0};
};

// Descriptive metadata for one recorded session (one CSV file).
//
// Only used for reporting; it never takes part in fitting.
struct SessionInfo {
  std::string filename;
  std::string timestamp;  // ISO-8601 local time "YYYY-MM-DDTHH:MM:SS"; may be empty
  size_t trial_count{0};
  double accuracy{0.0};
};

// Trials of one session together with its metadata.
struct Session {
  SessionInfo info;
  std::vector<Trial> trials;
};

// A logical dataset: sessions that share one experimental condition
// (e.g. one texture) and are analyzed together.
struct Dataset {
  std::string name;
  std::vector<Session> sessions;

  // Non-fatal problems encountered while loading (unreadable files, skipped
  // rows, ...). Filled by load_dataset(); reported by the CLI.
  std::vector<std::string> warnings;

  size_t n_trials() const {
    size_t n = 0;
    for (const auto& s : sessions) n += s.trials.size();
    return n;
  }
};

} // namespace psyfit
