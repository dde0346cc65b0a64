#include "psyfit/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace psyfit {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string strip_utf8_bom(std::string s) {
  if (s.size() >= 3 &&
      static_cast<unsigned char>(s[0]) == 0xEF &&
      static_cast<unsigned char>(s[1]) == 0xBB &&
      static_cast<unsigned char>(s[2]) == 0xBF) {
    return s.substr(3);
  }
  return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    out.push_back(item);
  }
  // getline() drops a trailing empty field.
  if (!s.empty() && s.back() == delim) out.emplace_back("");
  return out;
}

std::vector<std::string> split_csv_row(const std::string& row, char delim) {
  std::vector<std::string> out;
  std::string field;
  field.reserve(row.size());

  bool in_quotes = false;
  bool after_closing_quote = false;

  for (size_t i = 0; i < row.size(); ++i) {
    const char c = row[i];

    // getline() strips '\n' but not the '\r' of Windows line endings.
    if (!in_quotes && c == '\r') continue;

    if (in_quotes) {
      if (c == '"') {
        if ((i + 1) < row.size() && row[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
          after_closing_quote = true;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (after_closing_quote) {
      if (c == delim) {
        out.push_back(field);
        field.clear();
        after_closing_quote = false;
        continue;
      }
      if (is_space(c)) continue;
      after_closing_quote = false;
      field.push_back(c);
      continue;
    }

    if (c == delim) {
      out.push_back(field);
      field.clear();
      continue;
    }

    if (c == '"' && trim(field).empty()) {
      field.clear();
      in_quotes = true;
      continue;
    }

    field.push_back(c);
  }

  if (in_quotes) {
    throw std::runtime_error("split_csv_row: unterminated quoted field");
  }

  out.push_back(field);
  return out;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int to_int(const std::string& s) {
  try {
    const std::string t = trim(s);
    size_t idx = 0;
    const int v = std::stoi(t, &idx, 10);
    if (idx != t.size()) throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse int from '" + s + "': " + e.what());
  }
}

namespace {

static bool parse_double_classic(const std::string& x, double* out) {
  std::istringstream iss(x);
  iss.imbue(std::locale::classic());
  double v = 0.0;
  iss >> v;
  if (!iss) return false;
  iss >> std::ws;
  if (!iss.eof()) return false;
  *out = v;
  return true;
}

} // namespace

bool try_parse_double(const std::string& s, double* out) {
  if (!out) return false;
  const std::string t = trim(s);
  if (t.empty()) return false;

  double v = 0.0;
  if (parse_double_classic(t, &v)) {
    *out = v;
    return true;
  }

  // Decimal comma ("0,5") from some locale-specific exports.
  if (t.find('.') == std::string::npos) {
    const size_t cpos = t.find(',');
    if (cpos != std::string::npos && t.find(',', cpos + 1) == std::string::npos) {
      std::string tc = t;
      tc[cpos] = '.';
      if (parse_double_classic(tc, &v)) {
        *out = v;
        return true;
      }
    }
  }
  return false;
}

double to_double(const std::string& s) {
  double v = 0.0;
  if (!try_parse_double(s, &v)) {
    throw std::runtime_error("Failed to parse double from '" + s + "'");
  }
  return v;
}

bool try_parse_bool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string t = to_lower(trim(s));
  if (t == "true" || t == "1" || t == "yes" || t == "y" || t == "t") {
    *out = true;
    return true;
  }
  if (t == "false" || t == "0" || t == "no" || t == "n" || t == "f") {
    *out = false;
    return true;
  }
  return false;
}

bool normalize_rel_path_safe(const std::string& raw, std::string* out_norm) {
  if (!out_norm) return false;
  out_norm->clear();

  std::string s = trim(raw);
  if (s.empty()) return false;
  if (s.find('\0') != std::string::npos) return false;

  std::replace(s.begin(), s.end(), '\\', '/');
  if (s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) != 0 && s[1] == ':') {
    return false;
  }

  std::string norm;
  for (const auto& part : split(s, '/')) {
    if (part.empty() || part == ".") continue;
    if (part == "..") return false;
    if (!norm.empty()) norm.push_back('/');
    norm += part;
  }
  if (norm.empty()) return false;

  *out_norm = norm;
  return true;
}

void ensure_directory(const std::string& path) {
  std::filesystem::create_directories(std::filesystem::u8path(path));
}

bool write_text_file(const std::string& path, const std::string& content) {
  const std::filesystem::path p = std::filesystem::u8path(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path(), ec);
  }

  std::ofstream out(p, std::ios::binary);
  if (!out) return false;
  if (!content.empty()) out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  return static_cast<bool>(out);
}

std::string read_text_file(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open file: " + path);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

namespace {

static bool localtime_safe(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return out && localtime_s(out, &t) == 0;
#else
  return out && localtime_r(&t, out) != nullptr;
#endif
}

static bool gmtime_safe(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return out && gmtime_s(out, &t) == 0;
#else
  return out && gmtime_r(&t, out) != nullptr;
#endif
}

static long utc_offset_seconds(std::time_t t) {
  std::tm local_tm{};
  std::tm gm_tm{};
  if (!localtime_safe(t, &local_tm) || !gmtime_safe(t, &gm_tm)) return 0;

  // mktime() interprets both broken-down times as local time, so their
  // difference is the UTC offset (including DST) for this instant.
  std::tm gm_as_local = gm_tm;
  gm_as_local.tm_isdst = -1;

  const std::time_t local_tt = std::mktime(&local_tm);
  const std::time_t gm_local_tt = std::mktime(&gm_as_local);
  if (local_tt == static_cast<std::time_t>(-1) || gm_local_tt == static_cast<std::time_t>(-1)) return 0;
  return static_cast<long>(std::difftime(local_tt, gm_local_tt));
}

static std::string format_utc_offset(long offset_seconds) {
  char sign = '+';
  if (offset_seconds < 0) {
    sign = '-';
    offset_seconds = -offset_seconds;
  }
  const long total_minutes = offset_seconds / 60;
  std::ostringstream oss;
  oss << sign
      << std::setw(2) << std::setfill('0') << (total_minutes / 60)
      << ":"
      << std::setw(2) << std::setfill('0') << (total_minutes % 60);
  return oss.str();
}

} // namespace

std::string now_string_local() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  if (!localtime_safe(t, &tm)) return std::string();

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
      << format_utc_offset(utc_offset_seconds(t));
  return oss.str();
}

std::string now_string_utc() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  if (!gmtime_safe(t, &tm)) return std::string();

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string format_double_exact(double v) {
  if (!std::isfinite(v)) return "null";
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
  return oss.str();
}

std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase;
  for (unsigned char uc : s) {
    const char c = static_cast<char>(uc);
    switch (c) {
      case '"': oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (uc < 0x20) {
          oss << "\\u" << std::setw(4) << std::setfill('0') << static_cast<int>(uc);
          oss << std::setw(0) << std::setfill(' ');
        } else {
          oss << c;
        }
        break;
    }
  }
  return oss.str();
}

namespace {

static void json_skip_ws(const std::string& s, size_t* i) {
  while (i && *i < s.size() && is_space(s[*i])) ++(*i);
}

static bool json_parse_hex4(const std::string& s, size_t pos, unsigned* out) {
  if (pos + 4 > s.size()) return false;
  unsigned v = 0;
  for (size_t k = 0; k < 4; ++k) {
    const char c = s[pos + k];
    v <<= 4;
    if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
    else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(10 + (c - 'a'));
    else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(10 + (c - 'A'));
    else return false;
  }
  *out = v;
  return true;
}

static void json_append_utf8(unsigned cp, std::string* out) {
  if (cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu)) cp = 0xFFFDu;

  if (cp <= 0x7Fu) {
    out->push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out->push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
    out->push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out->push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
    out->push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out->push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out->push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
    out->push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out->push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out->push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

static bool json_parse_string(const std::string& s, size_t* i, std::string* out) {
  if (!i || *i >= s.size() || s[*i] != '"') return false;
  ++(*i);
  std::string r;

  while (*i < s.size()) {
    const char c = s[*i];
    ++(*i);

    if (c == '"') {
      if (out) *out = r;
      return true;
    }
    if (c != '\\') {
      r.push_back(c);
      continue;
    }

    if (*i >= s.size()) return false;
    const char e = s[*i];
    ++(*i);
    switch (e) {
      case '"': r.push_back('"'); break;
      case '\\': r.push_back('\\'); break;
      case '/': r.push_back('/'); break;
      case 'b': r.push_back('\b'); break;
      case 'f': r.push_back('\f'); break;
      case 'n': r.push_back('\n'); break;
      case 'r': r.push_back('\r'); break;
      case 't': r.push_back('\t'); break;
      case 'u': {
        unsigned cp = 0;
        if (!json_parse_hex4(s, *i, &cp)) return false;
        *i += 4;
        if (cp >= 0xD800u && cp <= 0xDBFFu) {
          unsigned low = 0;
          if ((*i + 6) <= s.size() && s[*i] == '\\' && s[*i + 1] == 'u' &&
              json_parse_hex4(s, *i + 2, &low) && low >= 0xDC00u && low <= 0xDFFFu) {
            *i += 6;
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
          } else {
            cp = 0xFFFDu;
          }
        }
        json_append_utf8(cp, &r);
        break;
      }
      default:
        r.push_back(e);
        break;
    }
  }
  return false;
}

// Position of the value of a top-level member, skipping keys that occur in
// nested objects or inside string values.
static bool json_find_value_pos_top_level(const std::string& s,
                                          const std::string& key,
                                          size_t* out_pos) {
  int depth = 0;
  size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];

    if (c == '"') {
      const size_t token_start = i;
      std::string tok;
      if (!json_parse_string(s, &i, &tok)) {
        i = token_start + 1;
        continue;
      }
      if (depth == 1 && tok == key) {
        size_t j = i;
        json_skip_ws(s, &j);
        if (j < s.size() && s[j] == ':') {
          ++j;
          json_skip_ws(s, &j);
          if (out_pos) *out_pos = j;
          return true;
        }
      }
      continue;
    }

    if (c == '{' || c == '[') {
      ++depth;
    } else if (c == '}' || c == ']') {
      if (depth > 0) --depth;
    }
    ++i;
  }
  return false;
}

static std::string json_scalar_token_at(const std::string& s, size_t i) {
  size_t j = i;
  while (j < s.size() && s[j] != ',' && s[j] != '}' && s[j] != ']' && !is_space(s[j])) ++j;
  return s.substr(i, j - i);
}

} // namespace

std::string json_find_string_value(const std::string& s, const std::string& key) {
  size_t pos = 0;
  if (!json_find_value_pos_top_level(s, key, &pos)) return {};
  if (pos >= s.size() || s[pos] != '"') return {};
  std::string out;
  if (!json_parse_string(s, &pos, &out)) return {};
  return out;
}

int json_find_int_value(const std::string& s, const std::string& key, int default_value) {
  size_t pos = 0;
  if (!json_find_value_pos_top_level(s, key, &pos) || pos >= s.size()) return default_value;

  std::string num;
  if (s[pos] == '"') {
    if (!json_parse_string(s, &pos, &num)) return default_value;
  } else {
    num = json_scalar_token_at(s, pos);
  }
  try {
    return to_int(num);
  } catch (const std::exception&) {
    return default_value;
  }
}

double json_find_double_value(const std::string& s, const std::string& key, double default_value) {
  size_t pos = 0;
  if (!json_find_value_pos_top_level(s, key, &pos) || pos >= s.size()) return default_value;

  const std::string tok = json_scalar_token_at(s, pos);
  if (tok == "null") return std::numeric_limits<double>::quiet_NaN();

  double v = 0.0;
  if (!parse_double_classic(tok, &v)) return default_value;
  return v;
}

} // namespace psyfit
