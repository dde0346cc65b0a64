#pragma once

#include "psyfit/dataset_analyzer.hpp"

#include <string>
#include <vector>

namespace psyfit {

struct PlotOptions {
  int panel_width_px{420};
  int panel_height_px{360};
  int columns{3};  // panels per row

  int margin_left_px{60};
  int margin_right_px{16};
  int margin_top_px{56};
  int margin_bottom_px{48};

  // Samples of the fitted curve across the observed intensity range.
  int curve_samples{100};

  std::string title{"Psychometric curves for 2AFC task"};
};

// Render one SVG document with a panel per dataset.
//
// Each panel shows the observed levels (circle area grows with trial count),
// the fitted curve when present, the fitted (red, dashed) and simple (orange)
// threshold markers, and horizontal guides at chance (0.5) and the target.
// The y axis is fixed to [0.4, 1.05]. Datasets without any level are skipped.
std::string render_psychometric_svg(const std::vector<AnalysisResult>& results,
                                    const PlotOptions& opt = PlotOptions{});

// Throws std::runtime_error on write failure.
void write_psychometric_svg(const std::string& path,
                            const std::vector<AnalysisResult>& results,
                            const PlotOptions& opt = PlotOptions{});

} // namespace psyfit
