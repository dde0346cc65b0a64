#include "psyfit/run_meta.hpp"
#include "psyfit/utils.hpp"
#include "psyfit/version.hpp"

#include "test_support.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace psyfit;

static size_t count_of(const std::string& s, const std::string& needle) {
  size_t n = 0;
  for (size_t pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + 1)) ++n;
  return n;
}

int main() {
  const std::string dir = std::string("test_run_meta_") + std::string("\xC2\xB5");  // "µ"
  const std::filesystem::path dir_p = std::filesystem::u8path(dir);
  std::error_code ec;
  std::filesystem::remove_all(dir_p, ec);

  const std::string meta = dir + "/threshold_run_meta.json";
  const std::vector<std::string> outs = {
    "bricks004_analysis.json",
    "./bricks004_levels.csv",
    "plots\\psychometric_curves.svg",
    "../escape.txt",
    "/abs/path.json",
    "C:/windows.json",
    "bricks004_analysis.json",  // duplicate
  };
  assert(write_run_meta_json(meta, "psyfit_threshold_cli", dir, "data/bricks004;data/rock062", outs));

  const std::string text = read_text_file(meta);
  assert(json_find_string_value(text, "Tool") == "psyfit_threshold_cli");
  assert(json_find_string_value(text, "PsyfitVersion") == version_string());
  assert(json_find_string_value(text, "CppStandard") == cpp_standard_string());
  assert(json_find_string_value(text, "OutputDir") == dir);
  assert(json_find_string_value(text, "InputPath") == "data/bricks004;data/rock062");
  const std::string utc = json_find_string_value(text, "TimestampUTC");
  assert(!utc.empty() && utc.back() == 'Z');
  assert(!json_find_string_value(text, "TimestampLocal").empty());

  // Outputs are normalized, de-duplicated and kept in order; escaping or
  // drive-qualified entries are dropped.
  const std::string expected_outputs =
    "  \"Outputs\": [\n"
    "    \"bricks004_analysis.json\",\n"
    "    \"bricks004_levels.csv\",\n"
    "    \"plots/psychometric_curves.svg\",\n"
    "    \"abs/path.json\"\n"
    "  ]\n";
  assert(text.find(expected_outputs) != std::string::npos);
  assert(count_of(text, "bricks004_analysis.json") == 1);
  assert(text.find("escape.txt") == std::string::npos);
  assert(text.find("windows.json") == std::string::npos);

  // No input path => null, and an empty output list.
  const std::string meta2 = dir + "/other_run_meta.json";
  assert(write_run_meta_json(meta2, "tool", dir, "", {}));
  const std::string text2 = read_text_file(meta2);
  assert(text2.find("\"InputPath\": null") != std::string::npos);
  assert(text2.find("\"Outputs\": [\n  ]") != std::string::npos);

  std::filesystem::remove_all(dir_p, ec);

  std::cout << "test_run_meta OK\n";
  return 0;
}
