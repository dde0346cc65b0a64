#pragma once

#include <string>
#include <vector>

namespace psyfit {

// Write a run metadata sidecar (lightweight JSON emitter).
//
// Keys written (top-level):
//   - Tool
//   - PsyfitVersion
//   - BuildType
//   - Compiler
//   - CppStandard
//   - TimestampLocal
//   - TimestampUTC
//   - OutputDir
//   - InputPath (string or null)
//   - Outputs (array of paths relative to OutputDir)
//
// Outputs are normalized and de-duplicated; entries that would escape
// OutputDir are dropped.
//
// Returns true on success, false on write failure.
bool write_run_meta_json(const std::string& json_path,
                         const std::string& tool,
                         const std::string& outdir,
                         const std::string& input_path,
                         const std::vector<std::string>& outputs);

} // namespace psyfit
