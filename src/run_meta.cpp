#include "psyfit/run_meta.hpp"

#include "psyfit/utils.hpp"
#include "psyfit/version.hpp"

#include <sstream>
#include <unordered_set>

namespace psyfit {

namespace {

static std::vector<std::string> safe_outputs(const std::vector<std::string>& raw) {
  std::vector<std::string> out;
  out.reserve(raw.size());
  std::unordered_set<std::string> seen;
  for (const auto& o : raw) {
    std::string norm;
    if (!normalize_rel_path_safe(o, &norm)) continue;
    if (seen.insert(norm).second) out.push_back(norm);
  }
  return out;
}

} // namespace

bool write_run_meta_json(const std::string& json_path,
                         const std::string& tool,
                         const std::string& outdir,
                         const std::string& input_path,
                         const std::vector<std::string>& outputs) {
  std::ostringstream out;

  out << "{\n";
  out << "  \"Tool\": \"" << json_escape(tool) << "\",\n";
  out << "  \"PsyfitVersion\": \"" << json_escape(version_string()) << "\",\n";
  out << "  \"BuildType\": \"" << json_escape(build_type_string()) << "\",\n";
  out << "  \"Compiler\": \"" << json_escape(compiler_string()) << "\",\n";
  out << "  \"CppStandard\": \"" << json_escape(cpp_standard_string()) << "\",\n";
  out << "  \"TimestampLocal\": \"" << json_escape(now_string_local()) << "\",\n";
  out << "  \"TimestampUTC\": \"" << json_escape(now_string_utc()) << "\",\n";
  out << "  \"OutputDir\": \"" << json_escape(outdir) << "\",\n";
  out << "  \"InputPath\": ";
  if (input_path.empty()) {
    out << "null";
  } else {
    out << "\"" << json_escape(input_path) << "\"";
  }
  out << ",\n";

  const std::vector<std::string> outs = safe_outputs(outputs);
  out << "  \"Outputs\": [\n";
  for (size_t i = 0; i < outs.size(); ++i) {
    out << "    \"" << json_escape(outs[i]) << "\"";
    if (i + 1 < outs.size()) out << ",";
    out << "\n";
  }
  out << "  ]\n";
  out << "}\n";
  return write_text_file(json_path, out.str());
}

} // namespace psyfit
