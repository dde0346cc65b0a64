#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace psyfit {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
// Session CSV files written on Windows may start with a BOM, which would
// otherwise end up inside the first header cell.
std::string strip_utf8_bom(std::string s);

std::vector<std::string> split(const std::string& s, char delim);

// Split a single CSV row into fields.
//
// Supports the common RFC-4180 behaviors:
//  - fields may be quoted with double quotes
//  - delimiters inside quoted fields are preserved
//  - escaped quotes inside quoted fields are written as "" and are unescaped
//
// Rows must be single-line (no embedded newlines inside quoted fields).
// Throws std::runtime_error on an unterminated quoted field.
std::vector<std::string> split_csv_row(const std::string& row, char delim);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Strict numeric parsing helpers.
//
// These functions trim leading/trailing whitespace and then require that the
// entire remaining string is a valid number (no trailing "abc" fragments).
// Numbers are parsed with the classic "C" locale. to_double() also accepts a
// single decimal comma ("0,5") when no '.' is present.
//
// Both throw std::runtime_error on failure.
int to_int(const std::string& s);
double to_double(const std::string& s);

// Non-throwing variants. Return false and leave *out untouched on failure.
bool try_parse_double(const std::string& s, double* out);

// Parse a boolean cell as written by the experiment logger.
//
// Accepts (case-insensitive): true/false, 1/0, yes/no, y/n, t/f.
bool try_parse_bool(const std::string& s, bool* out);

// Normalize a relative output path for run metadata.
//
// Converts '\\' to '/', drops "." segments and leading/trailing slashes.
// Rejects empty paths, ".." segments, drive prefixes ("C:") and embedded NUL
// bytes. Returns false (and clears *out_norm) on rejection.
bool normalize_rel_path_safe(const std::string& raw, std::string* out_norm);

void ensure_directory(const std::string& path);

// Write a text file to disk (UTF-8 bytes).
//
// Parent directories are created. The file is written in binary mode to avoid
// newline translation. Returns false on failure.
bool write_text_file(const std::string& path, const std::string& content);

// Read a whole file. Throws std::runtime_error if it cannot be opened.
std::string read_text_file(const std::string& path);

// Local / UTC timestamps for run metadata.
//
//   now_string_local(): 2026-01-15T13:37:42-05:00
//   now_string_utc():   2026-01-15T18:37:42Z
std::string now_string_local();
std::string now_string_utc();

// Format a double so that parsing it back yields the identical value
// (17 significant digits, classic locale). Non-finite values become "null",
// which is what the JSON writers want.
std::string format_double_exact(double v);

// Escape a string for safe inclusion in JSON string values.
// The returned string does NOT include surrounding quotes.
std::string json_escape(const std::string& s);

// Tiny JSON extractors for {"key": value}-style objects written by this
// project. Only the top-level object (depth 1) is searched and keys occurring
// inside string values are ignored. NOT a general JSON parser.
//
// - json_find_string_value(): empty string if missing or not a string
// - json_find_int_value(): default_value if missing/unparseable
// - json_find_double_value(): default_value if missing/unparseable; JSON null
//   maps to NaN
std::string json_find_string_value(const std::string& s, const std::string& key);
int json_find_int_value(const std::string& s, const std::string& key, int default_value);
double json_find_double_value(const std::string& s, const std::string& key, double default_value);

} // namespace psyfit
