#include "psyfit/psychometric_plot.hpp"

#include "psyfit/svg_utils.hpp"
#include "psyfit/utils.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace psyfit {

namespace {

constexpr double kYMin = 0.4;
constexpr double kYMax = 1.05;

static std::vector<std::string> palette() {
  return {
    "#1f77b4", "#d62728", "#2ca02c", "#9467bd", "#ff7f0e",
    "#8c564b", "#e377c2", "#7f7f7f", "#bcbd22", "#17becf"
  };
}

static std::string fmt(double v, int digits) {
  if (!std::isfinite(v)) return "N/A";
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::fixed << std::setprecision(digits) << v;
  return oss.str();
}

struct Panel {
  double x0{0.0};  // plot area in pixels
  double x1{0.0};
  double y0{0.0};
  double y1{0.0};
  double lo{0.0};  // data range on the x axis
  double hi{1.0};

  double to_x(double v) const { return x0 + (v - lo) / (hi - lo) * (x1 - x0); }
  double to_y(double p) const {
    const double c = std::min(kYMax, std::max(kYMin, p));
    return y1 - (c - kYMin) / (kYMax - kYMin) * (y1 - y0);
  }
};

static void vline(std::ostringstream& f, const Panel& pn, double x, const std::string& color,
                  const std::string& dash) {
  f << "<line x1=\"" << svg_num(pn.to_x(x)) << "\" y1=\"" << svg_num(pn.y0)
    << "\" x2=\"" << svg_num(pn.to_x(x)) << "\" y2=\"" << svg_num(pn.y1)
    << "\" stroke=\"" << color << "\" stroke-width=\"1.5\" opacity=\"0.8\"";
  if (!dash.empty()) f << " stroke-dasharray=\"" << dash << "\"";
  f << "/>\n";
}

static void hline(std::ostringstream& f, const Panel& pn, double p, const std::string& color) {
  f << "<line x1=\"" << svg_num(pn.x0) << "\" y1=\"" << svg_num(pn.to_y(p))
    << "\" x2=\"" << svg_num(pn.x1) << "\" y2=\"" << svg_num(pn.to_y(p))
    << "\" stroke=\"" << color << "\" stroke-width=\"1\" stroke-dasharray=\"2,3\" opacity=\"0.7\"/>\n";
}

static void render_panel(std::ostringstream& f,
                         const AnalysisResult& r,
                         const std::string& color,
                         double ox,
                         double oy,
                         const PlotOptions& opt) {
  Panel pn;
  pn.x0 = ox + opt.margin_left_px;
  pn.x1 = ox + opt.panel_width_px - opt.margin_right_px;
  pn.y0 = oy + opt.margin_top_px;
  pn.y1 = oy + opt.panel_height_px - opt.margin_bottom_px;

  const double data_lo = r.levels.front().intensity;
  const double data_hi = r.levels.back().intensity;
  double lo = data_lo;
  double hi = data_hi;
  // Extrapolated thresholds may fall outside the observed range.
  for (double t : {r.simple_threshold.value, r.fitted_threshold()}) {
    if (std::isfinite(t)) {
      lo = std::min(lo, t);
      hi = std::max(hi, t);
    }
  }
  double pad = 0.05 * (hi - lo);
  if (!(pad > 0.0)) pad = std::max(1.0, 0.1 * std::fabs(lo));
  pn.lo = lo - pad;
  pn.hi = hi + pad;

  // Frame + grid
  f << "<rect x=\"" << svg_num(pn.x0) << "\" y=\"" << svg_num(pn.y0) << "\" width=\""
    << svg_num(pn.x1 - pn.x0) << "\" height=\"" << svg_num(pn.y1 - pn.y0)
    << "\" fill=\"none\" stroke=\"#999\" stroke-width=\"1\"/>\n";

  f << "<g stroke=\"#e6e6e6\" stroke-width=\"1\">\n";
  for (int k = 0; k <= 6; ++k) {
    const double p = kYMin + 0.1 * k;
    f << "<line x1=\"" << svg_num(pn.x0) << "\" y1=\"" << svg_num(pn.to_y(p)) << "\" x2=\"" << svg_num(pn.x1)
      << "\" y2=\"" << svg_num(pn.to_y(p)) << "\"/>\n";
  }
  const double step = nice_tick_step(pn.hi - pn.lo, 5);
  const double t0 = std::ceil(pn.lo / step) * step;
  std::vector<double> xticks;
  for (double t = t0; t <= pn.hi + 1e-9 * step; t += step) xticks.push_back(t);
  for (double t : xticks) {
    f << "<line x1=\"" << svg_num(pn.to_x(t)) << "\" y1=\"" << svg_num(pn.y0) << "\" x2=\""
      << svg_num(pn.to_x(t)) << "\" y2=\"" << svg_num(pn.y1) << "\"/>\n";
  }
  f << "</g>\n";

  // Tick labels
  f << "<g font-family=\"sans-serif\" font-size=\"10\" fill=\"#444\">\n";
  for (int k = 0; k <= 6; ++k) {
    const double p = kYMin + 0.1 * k;
    f << "<text x=\"" << svg_num(pn.x0 - 4) << "\" y=\"" << svg_num(pn.to_y(p) + 3)
      << "\" text-anchor=\"end\">" << fmt(p, 1) << "</text>\n";
  }
  const int xdigits = (step >= 1.0) ? 0 : static_cast<int>(std::ceil(-std::log10(step)));
  for (double t : xticks) {
    f << "<text x=\"" << svg_num(pn.to_x(t)) << "\" y=\"" << svg_num(pn.y1 + 14)
      << "\" text-anchor=\"middle\">" << fmt(t, xdigits) << "</text>\n";
  }
  f << "</g>\n";

  // Axis labels
  f << "<text x=\"" << svg_num(0.5 * (pn.x0 + pn.x1)) << "\" y=\"" << svg_num(pn.y1 + 34)
    << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"11\" fill=\"#111\">"
    << "Stimulus intensity (cmpPx)</text>\n";
  const double ylab_x = ox + 16;
  const double ylab_y = 0.5 * (pn.y0 + pn.y1);
  f << "<text x=\"" << svg_num(ylab_x) << "\" y=\"" << svg_num(ylab_y) << "\" transform=\"rotate(-90 "
    << svg_num(ylab_x) << " " << svg_num(ylab_y)
    << ")\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"11\" fill=\"#111\">"
    << "Proportion correct</text>\n";

  // Guides: chance and target
  hline(f, pn, 0.5, "#888888");
  hline(f, pn, r.target, "#cc0000");

  // Fitted curve
  if (r.fit) {
    const int n = std::max(2, opt.curve_samples);
    f << "<polyline fill=\"none\" stroke=\"" << color << "\" stroke-width=\"2\" points=\"";
    bool first = true;
    for (int i = 0; i < n; ++i) {
      const double x = data_lo + (data_hi - data_lo) * static_cast<double>(i) / static_cast<double>(n - 1);
      const double y = r.fit->predict(x);
      if (!std::isfinite(y)) continue;
      if (!first) f << ' ';
      f << svg_num(pn.to_x(x)) << ',' << svg_num(pn.to_y(y));
      first = false;
    }
    f << "\"/>\n";
  }

  // Threshold markers
  if (std::isfinite(r.fitted_threshold())) vline(f, pn, r.fitted_threshold(), "#d62728", "6,4");
  if (r.simple_threshold.determined()) vline(f, pn, r.simple_threshold.value, "#ff8c00", "");

  // Observed levels; radius grows with the trial count.
  size_t nmin = r.levels.front().trial_count;
  size_t nmax = nmin;
  for (const auto& lv : r.levels) {
    nmin = std::min(nmin, lv.trial_count);
    nmax = std::max(nmax, lv.trial_count);
  }
  f << "<g fill=\"" << color << "\" fill-opacity=\"0.7\" stroke=\"#000\" stroke-width=\"1\">\n";
  for (const auto& lv : r.levels) {
    const double u = static_cast<double>(lv.trial_count - nmin) / static_cast<double>(nmax - nmin + 1);
    const double radius = 4.0 + 6.0 * u;
    f << "<circle cx=\"" << svg_num(pn.to_x(lv.intensity)) << "\" cy=\"" << svg_num(pn.to_y(lv.proportion_correct))
      << "\" r=\"" << svg_num(radius) << "\"><title>" << fmt(lv.intensity, 1) << ": "
      << fmt(lv.proportion_correct, 3) << " (n=" << lv.trial_count << ")</title></circle>\n";
  }
  f << "</g>\n";

  // Title
  const std::string sub = r.fit ? ("R^2 = " + fmt(r.fit->r_squared, 3)) : std::string("Fit failed");
  f << "<text x=\"" << svg_num(0.5 * (pn.x0 + pn.x1)) << "\" y=\"" << svg_num(oy + 22)
    << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"13\" font-weight=\"bold\" fill=\"#111\">"
    << svg_escape(r.dataset) << "</text>\n";
  f << "<text x=\"" << svg_num(0.5 * (pn.x0 + pn.x1)) << "\" y=\"" << svg_num(oy + 40)
    << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"11\" fill=\"#333\">"
    << svg_escape(sub) << "</text>\n";

  // Summary box
  const double bx = pn.x0 + 6;
  const double by = pn.y0 + 6;
  f << "<rect x=\"" << svg_num(bx) << "\" y=\"" << svg_num(by)
    << "\" width=\"130\" height=\"46\" rx=\"4\" fill=\"#f5deb3\" fill-opacity=\"0.8\" stroke=\"#c8b08a\"/>\n";
  f << "<text font-family=\"sans-serif\" font-size=\"10\" fill=\"#111\">\n";
  f << "<tspan x=\"" << svg_num(bx + 6) << "\" y=\"" << svg_num(by + 13) << "\">Trials: " << r.n_trials
    << "</tspan>\n";
  f << "<tspan x=\"" << svg_num(bx + 6) << "\" y=\"" << svg_num(by + 26)
    << "\">Accuracy: " << fmt(r.overall_accuracy, 3) << "</tspan>\n";
  f << "<tspan x=\"" << svg_num(bx + 6) << "\" y=\"" << svg_num(by + 39)
    << "\">Simple thresh: " << fmt(r.simple_threshold.value, 1) << "</tspan>\n";
  f << "</text>\n";
}

} // namespace

std::string render_psychometric_svg(const std::vector<AnalysisResult>& results, const PlotOptions& opt) {
  if (opt.panel_width_px <= opt.margin_left_px + opt.margin_right_px ||
      opt.panel_height_px <= opt.margin_top_px + opt.margin_bottom_px) {
    throw std::runtime_error("render_psychometric_svg: panel size too small for margins");
  }

  std::vector<const AnalysisResult*> valid;
  for (const auto& r : results) {
    if (!r.levels.empty()) valid.push_back(&r);
  }

  const int header_px = 44;
  const int n = static_cast<int>(valid.size());
  const int cols = std::max(1, std::min(std::max(1, opt.columns), n));
  const int rows = std::max(1, (n + cols - 1) / cols);
  const int width = cols * opt.panel_width_px;
  const int height = header_px + rows * opt.panel_height_px;

  std::ostringstream f;
  f.imbue(std::locale::classic());
  f << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  f << "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" "
    << "width=\"" << width << "\" height=\"" << height << "\" "
    << "viewBox=\"0 0 " << width << " " << height << "\">\n";
  f << "<rect x=\"0\" y=\"0\" width=\"" << width << "\" height=\"" << height << "\" fill=\"white\"/>\n";

  f << "<text x=\"" << (width / 2) << "\" y=\"20\" text-anchor=\"middle\" font-family=\"sans-serif\" "
    << "font-size=\"15\" font-weight=\"bold\" fill=\"#111\">" << svg_escape(opt.title) << "</text>\n";
  if (!valid.empty()) {
    f << "<text x=\"" << (width / 2) << "\" y=\"36\" text-anchor=\"middle\" font-family=\"sans-serif\" "
      << "font-size=\"11\" fill=\"#333\">Threshold at " << fmt(valid.front()->target * 100.0, 1)
      << "% correct</text>\n";
  }

  if (valid.empty()) {
    f << "<text x=\"" << (width / 2) << "\" y=\"" << (header_px + opt.panel_height_px / 2)
      << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"12\" fill=\"#555\">"
      << "No valid results to plot</text>\n";
  }

  const auto colors = palette();
  for (int i = 0; i < n; ++i) {
    const double ox = static_cast<double>((i % cols) * opt.panel_width_px);
    const double oy = static_cast<double>(header_px + (i / cols) * opt.panel_height_px);
    f << "<g id=\"panel-" << i << "\">\n";
    render_panel(f, *valid[static_cast<size_t>(i)], colors[static_cast<size_t>(i) % colors.size()], ox, oy, opt);
    f << "</g>\n";
  }

  f << "</svg>\n";
  return f.str();
}

void write_psychometric_svg(const std::string& path,
                            const std::vector<AnalysisResult>& results,
                            const PlotOptions& opt) {
  if (!write_text_file(path, render_psychometric_svg(results, opt))) {
    throw std::runtime_error("Failed to write SVG: " + path);
  }
}

} // namespace psyfit
