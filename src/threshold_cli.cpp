#include "psyfit/analysis_report.hpp"
#include "psyfit/dataset_analyzer.hpp"
#include "psyfit/psychometric_plot.hpp"
#include "psyfit/run_meta.hpp"
#include "psyfit/session_loader.hpp"
#include "psyfit/utils.hpp"
#include "psyfit/version.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace psyfit;

struct DatasetArg {
  std::string name;
  std::string dir;
};

struct Args {
  std::vector<DatasetArg> datasets;
  std::string outdir{"out_threshold"};

  ModelKind model{ModelKind::Logistic};
  double target{kStaircaseTarget};
  int min_trials{2};

  // Most recent sessions per dataset (0 => all).
  int recent{0};

  bool write_svg{true};
  bool write_json{true};
  bool quiet{false};
};

static void print_help() {
  std::cout
    << "psyfit_threshold_cli (2AFC psychometric threshold estimation)\n\n"
    << "Usage:\n"
    << "  psyfit_threshold_cli --dataset bricks004=data/bricks004 --dataset rock062=data/rock062\n"
    << "  psyfit_threshold_cli --dataset pilot=sessions --model cumulative_normal --recent 3\n\n"
    << "Each dataset directory holds session files named 2AFC_P_YYYYMMDD_HHMMSS.csv.\n\n"
    << "Options:\n"
    << "  --dataset NAME=DIR      Dataset name and directory (repeatable; required)\n"
    << "  --model NAME            logistic|cumulative_normal (default: logistic)\n"
    << "  --target P              Threshold performance level in (0,1) (default: 0.707)\n"
    << "  --min-trials N          Minimum trials per stimulus level (default: 2)\n"
    << "  --recent N              Use only the N most recent sessions per dataset (default: all)\n"
    << "  --outdir DIR            Output directory (default: out_threshold)\n"
    << "  --no-svg                Do not write psychometric_curves.svg\n"
    << "  --no-json               Do not write <dataset>_analysis.json\n"
    << "  --quiet                 Only print the threshold summary table\n"
    << "  --version               Print version and exit\n"
    << "  -h, --help              Show this help\n";
}

static DatasetArg parse_dataset_arg(const std::string& s) {
  const size_t eq = s.find('=');
  if (eq == std::string::npos) {
    throw std::runtime_error("--dataset expects NAME=DIR, got: " + s);
  }
  DatasetArg d;
  d.name = trim(s.substr(0, eq));
  d.dir = trim(s.substr(eq + 1));
  if (d.name.empty() || d.dir.empty()) {
    throw std::runtime_error("--dataset expects NAME=DIR, got: " + s);
  }
  return d;
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "psyfit_threshold_cli " << version_string() << "\n";
      std::exit(0);
    } else if (arg == "--dataset" && i + 1 < argc) {
      a.datasets.push_back(parse_dataset_arg(argv[++i]));
    } else if (arg == "--model" && i + 1 < argc) {
      a.model = parse_model_kind(argv[++i]);
    } else if (arg == "--target" && i + 1 < argc) {
      a.target = to_double(argv[++i]);
    } else if (arg == "--min-trials" && i + 1 < argc) {
      a.min_trials = to_int(argv[++i]);
    } else if (arg == "--recent" && i + 1 < argc) {
      a.recent = to_int(argv[++i]);
    } else if (arg == "--outdir" && i + 1 < argc) {
      a.outdir = argv[++i];
    } else if (arg == "--no-svg") {
      a.write_svg = false;
    } else if (arg == "--no-json") {
      a.write_json = false;
    } else if (arg == "--quiet") {
      a.quiet = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

// Dataset names end up in file names.
static std::string file_stem_for(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    const unsigned char u = static_cast<unsigned char>(c);
    out.push_back((std::isalnum(u) != 0 || c == '-' || c == '_' || c == '.') ? c : '_');
  }
  return out;
}

int main(int argc, char** argv) {
  try {
    Args args = parse_args(argc, argv);
    if (args.datasets.empty()) {
      print_help();
      throw std::runtime_error("at least one --dataset is required");
    }
    if (!(args.target > 0.0 && args.target < 1.0)) throw std::runtime_error("--target must be in (0,1)");
    if (args.min_trials < 1) throw std::runtime_error("--min-trials must be >= 1");
    if (args.recent < 0) throw std::runtime_error("--recent must be >= 0");

    ensure_directory(args.outdir);

    AnalysisOptions aopt;
    aopt.model = args.model;
    aopt.target = args.target;
    aopt.min_trials_per_level = static_cast<size_t>(args.min_trials);

    if (!args.quiet) {
      std::cout << "2AFC psychometric threshold analysis\n";
      std::cout << "====================================\n";
    }

    std::vector<AnalysisResult> results;
    std::vector<std::string> outputs;
    std::string input_paths;

    for (const auto& d : args.datasets) {
      if (!input_paths.empty()) input_paths += ";";
      input_paths += d.dir;

      Dataset ds;
      try {
        ds = load_dataset(d.name, d.dir, static_cast<size_t>(args.recent));
      } catch (const std::runtime_error& e) {
        std::cerr << "Warning: " << d.name << ": " << e.what() << "\n";
        continue;
      }
      for (const auto& w : ds.warnings) {
        std::cerr << "Warning: " << d.name << ": " << w << "\n";
      }
      if (ds.n_trials() == 0) {
        std::cerr << "Warning: " << d.name << ": no trials loaded; skipping\n";
        continue;
      }
      if (!args.quiet) {
        std::cout << "Loaded " << ds.sessions.size() << " session(s) from " << d.name << "\n";
      }

      AnalysisResult r;
      std::vector<std::string> written;
      try {
        r = analyze_dataset(ds, aopt);
        if (!args.quiet) std::cout << "\n" << format_dataset_report(r);

        const std::string stem = file_stem_for(r.dataset);
        if (args.write_json) {
          const std::string name = stem + "_analysis.json";
          write_analysis_json(args.outdir + "/" + name, r);
          written.push_back(name);
        }
        const std::string name = stem + "_levels.csv";
        write_levels_csv(args.outdir + "/" + name, r.levels);
        written.push_back(name);
      } catch (const std::exception& e) {
        std::cerr << "Warning: " << d.name << ": analysis failed: " << e.what() << "\n";
        continue;
      }
      outputs.insert(outputs.end(), written.begin(), written.end());
      results.push_back(std::move(r));
    }

    if (results.empty()) throw std::runtime_error("No data loaded");

    std::cout << "\n" << format_threshold_summary(results);

    if (args.write_svg) {
      const std::string name = "psychometric_curves.svg";
      write_psychometric_svg(args.outdir + "/" + name, results);
      outputs.push_back(name);
      if (!args.quiet) std::cout << "\nWrote: " << args.outdir << "/" << name << "\n";
    }

    const std::string meta = args.outdir + "/threshold_run_meta.json";
    if (!write_run_meta_json(meta, "psyfit_threshold_cli", args.outdir, input_paths, outputs)) {
      throw std::runtime_error("Failed to write run metadata: " + meta);
    }
    if (!args.quiet) std::cout << "Wrote: " << meta << "\n";

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
