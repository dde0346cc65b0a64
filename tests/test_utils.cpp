#include "psyfit/utils.hpp"

#include "test_support.hpp"
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace psyfit;

template <typename F>
static bool throws_runtime_error(F f) {
  try {
    f();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

int main() {
  // Strings
  {
    assert(trim("  a b \t\r\n") == "a b");
    assert(strip_utf8_bom("\xEF\xBB\xBFtrial") == "trial");
    assert(strip_utf8_bom("trial") == "trial");
    assert(to_lower("CmpPx") == "cmppx");
    assert(starts_with("2AFC_P_x.csv", "2AFC_P_"));
    assert(!starts_with("2AF", "2AFC_P_"));
    assert(ends_with("a.csv", ".csv"));

    const auto parts = split("a,,b,", ',');
    assert(parts.size() == 4);
    assert(parts[1].empty() && parts[3].empty());
  }

  // CSV rows
  {
    const auto row = split_csv_row("1,\"L, left\",520,\"say \"\"hi\"\"\",True\r", ',');
    assert(row.size() == 5);
    assert(row[1] == "L, left");
    assert(row[3] == "say \"hi\"");
    assert(row[4] == "True");

    const auto empty_tail = split_csv_row(",,,,,,,,JND_px,20", ',');
    assert(empty_tail.size() == 10);
    assert(empty_tail[0].empty());
    assert(empty_tail[8] == "JND_px");

    assert(throws_runtime_error([] { (void)split_csv_row("1,\"open", ','); }));
  }

  // Numbers
  {
    assert(to_int(" 42 ") == 42);
    assert(throws_runtime_error([] { (void)to_int("4x"); }));
    assert(to_double("520") == 520.0);
    assert(to_double("0,5") == 0.5);
    assert(to_double("-1.25e2") == -125.0);
    assert(throws_runtime_error([] { (void)to_double("12abc"); }));
    assert(throws_runtime_error([] { (void)to_double(""); }));

    double v = 7.0;
    assert(!try_parse_double("JND_px", &v));
    assert(v == 7.0);
    assert(!try_parse_double("1,2,3", &v));

    bool b = false;
    assert(try_parse_bool("True", &b) && b);
    assert(try_parse_bool(" FALSE ", &b) && !b);
    assert(try_parse_bool("1", &b) && b);
    assert(try_parse_bool("no", &b) && !b);
    assert(!try_parse_bool("maybe", &b));
    assert(!try_parse_bool("", &b));
  }

  // Exact double formatting
  {
    const double vals[] = {0.1, 1.0 / 3.0, 133.0 / 180.0, 492.83333333333331, 1e-300, -0.0};
    for (double x : vals) {
      assert(to_double(format_double_exact(x)) == x);
    }
    assert(format_double_exact(std::numeric_limits<double>::quiet_NaN()) == "null");
    assert(format_double_exact(std::numeric_limits<double>::infinity()) == "null");
    assert(format_double_exact(400.0) == "400");
  }

  // JSON helpers
  {
    assert(json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n");
    assert(json_escape(std::string("\x01", 1)) == "\\u0001");

    const std::string j =
      "{\n"
      "  \"Note\": \"contains \\\"NTrials\\\": 99\",\n"
      "  \"Levels\": [{\"NTrials\": 5}],\n"
      "  \"Nested\": {\"NTrials\": 6},\n"
      "  \"NTrials\": 180,\n"
      "  \"Accuracy\": 0.73888888888888893,\n"
      "  \"Missing\": null,\n"
      "  \"Name\": \"caf\\u00e9 \\uD83D\\uDE00\",\n"
      "  \"Path\": \"b\\/c.csv\"\n"
      "}\n";
    assert(json_find_int_value(j, "NTrials", -1) == 180);
    assert(json_find_double_value(j, "Accuracy", 0.0) == 133.0 / 180.0);
    assert(std::isnan(json_find_double_value(j, "Missing", 1.0)));
    assert(json_find_double_value(j, "Absent", 2.5) == 2.5);
    assert(json_find_string_value(j, "Name") == "caf\xC3\xA9 \xF0\x9F\x98\x80");
    assert(json_find_string_value(j, "NTrials").empty());
    assert(json_find_string_value(j, "Path") == "b/c.csv");
  }

  // Relative output paths
  {
    std::string n;
    assert(normalize_rel_path_safe("a/./b.json", &n) && n == "a/b.json");
    assert(normalize_rel_path_safe("sub\\x.svg", &n) && n == "sub/x.svg");
    assert(!normalize_rel_path_safe("a/../b", &n) && n.empty());
    assert(!normalize_rel_path_safe("D:/x", &n));
    assert(!normalize_rel_path_safe("  ", &n));
  }

  // Files
  {
    const std::string dir = "test_utils_tmp";
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::u8path(dir), ec);

    const std::string path = dir + "/nested/out.txt";
    assert(write_text_file(path, "line1\nline2\n"));
    assert(std::filesystem::exists(std::filesystem::u8path(path)));
    assert(read_text_file(path) == "line1\nline2\n");
    assert(throws_runtime_error([&] { (void)read_text_file(dir + "/missing.txt"); }));

    ensure_directory(dir + "/made");
    assert(std::filesystem::is_directory(std::filesystem::u8path(dir + "/made")));

    std::filesystem::remove_all(std::filesystem::u8path(dir), ec);
  }

  // Timestamps
  {
    const std::string utc = now_string_utc();
    assert(utc.size() == 20 && utc.back() == 'Z' && utc[10] == 'T');
    const std::string local = now_string_local();
    assert(local.size() >= 19 && local[10] == 'T');
  }

  std::cout << "test_utils OK\n";
  return 0;
}
