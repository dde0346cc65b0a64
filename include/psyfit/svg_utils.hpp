#pragma once

#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>

namespace psyfit {

// Minimal helpers for generating SVG/XML safely (dependency-free).

// Escape text for XML element bodies / attributes.
inline std::string svg_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&apos;"; break;
      default: out.push_back(c); break;
    }
  }
  return out;
}

// Coordinate formatting: fixed, 2 decimals, classic locale.
inline std::string svg_num(double v) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::fixed << std::setprecision(2) << v;
  return oss.str();
}

// A "nice" axis tick step (1, 2 or 5 times a power of ten) giving roughly
// target_ticks intervals over span.
inline double nice_tick_step(double span, int target_ticks = 5) {
  if (!(span > 0.0) || !std::isfinite(span) || target_ticks < 1) return 1.0;
  const double raw = span / static_cast<double>(target_ticks);
  const double mag = std::pow(10.0, std::floor(std::log10(raw)));
  const double norm = raw / mag;
  double step = 10.0;
  if (norm <= 1.0) {
    step = 1.0;
  } else if (norm <= 2.0) {
    step = 2.0;
  } else if (norm <= 5.0) {
    step = 5.0;
  }
  return step * mag;
}

} // namespace psyfit
