#include "fepsp/errors.hpp"
#include "fepsp/pipeline.hpp"
#include "fepsp/results_io.hpp"
#include "fepsp/smoothing.hpp"
#include "fepsp/sweep_reader.hpp"
#include "fepsp/utils.hpp"
#include "fepsp/version.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <optional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace fepsp;

namespace {

struct Args {
  std::vector<std::string> inputs;
  std::string outdir{"out_fepsp"};
  std::vector<double> intensities;
  int repetitions{0};
  double fs_hz{0.0};
  int jobs{1};

  // Transforms in command-line order.
  std::vector<TransformSpec> transforms;

  // Features (enabled by their window/lag flags).
  bool fiber_volley{false};
  bool epsp{false};
  bool pop_spike{false};
  ParamMap fv_params;
  ParamMap epsp_params;
  ParamMap ps_params;
  std::string fv_smooth;
  std::string epsp_smooth;
  std::string ps_smooth;

  std::string smooth{"none"};
};

// Outcome of one recording, filled on a worker thread and reported on the
// main thread.
struct RecordingOutcome {
  std::string input;
  std::string outdir;
  bool ok{false};
  std::string error;
  RecordingContext ctx;
  std::vector<std::string> outputs;
};

static void print_help() {
  std::cout
      << "fepsp_analyze_cli\n\n"
      << "Extract fiber volley, fEPSP and population spike measures from evoked field potential sweeps.\n\n"
      << "Usage:\n"
      << "  fepsp_analyze_cli --input <sweeps.csv> [--input <more.csv> ...] --intensities a,b,c --reps N [options]\n\n"
      << "Input:\n"
      << "  --input <file>               Delimited text: time column (s, or time_ms) + one column per sweep.\n"
      << "                               Repeat to process several recordings.\n"
      << "  --intensities <a,b,c>        Stimulus intensity of each sweep block, in acquisition order.\n"
      << "  --reps <N>                   Sweeps per stimulus intensity.\n"
      << "  --fs <Hz>                    Sampling rate override (0 = infer from time column).\n\n"
      << "Transforms (applied in the order given):\n"
      << "  --baseline <LO> <HI>         Subtract the mean voltage in [LO,HI) ms from each sweep.\n"
      << "  --crop <LO> <HI>             Remove samples in [LO,HI) ms and re-zero time.\n"
      << "  --template-subtract <LO> <HI>\n"
      << "                               Subtract a scaled per-intensity artifact template fit in [LO,HI) ms.\n"
      << "  --average                    Average sweeps at this point (otherwise after all transforms).\n\n"
      << "Features:\n"
      << "  --fv-window <LO> <HI>        Fiber volley search window in ms.\n"
      << "  --epsp-window <LO> <HI>      fEPSP search window in ms.\n"
      << "  --fit-distance <N>           Samples on each side of the slope midpoint (default 4).\n"
      << "  --ps-lag <ms>                Population spike search span after the fEPSP minimum.\n"
      << "  --ps-prominence <mV>         Minimum population spike prominence (required with --ps-lag).\n"
      << "  --ps-threshold <mV/ms>       Enable the rise-and-flatten fallback detector.\n"
      << "  --ps-amplitude <MODE>        baseline (default) or direct.\n\n"
      << "Smoothing (none | moving_average:W | savgol:W:P | butterworth_lowpass:HZ[:ORDER]):\n"
      << "  --smooth <SPEC>              Default smoothing for all features (default none).\n"
      << "  --fv-smooth <SPEC>           Fiber volley smoothing.\n"
      << "  --epsp-smooth <SPEC>         fEPSP smoothing.\n"
      << "  --ps-smooth <SPEC>           Population spike smoothing.\n\n"
      << "Output:\n"
      << "  --outdir <dir>               Output directory (default out_fepsp).\n"
      << "  --jobs <N>                   Recordings processed in parallel (default 1; 0 = all cores).\n\n"
      << "Other:\n"
      << "  --version                    Print version.\n"
      << "  -h, --help                   Show help.\n";
}

static bool is_flag(const std::string& a, const char* s1, const char* s2 = nullptr) {
  if (a == s1) return true;
  if (s2 && a == s2) return true;
  return false;
}

static std::string require_value(int& i, int argc, char** argv, const std::string& flag) {
  if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
  return std::string(argv[++i]);
}

// "--flag LO HI" -> "LO,HI" (validated as numbers).
static std::string require_window(int& i, int argc, char** argv, const std::string& flag) {
  const std::string lo = require_value(i, argc, argv, flag);
  const std::string hi = require_value(i, argc, argv, flag);
  (void)to_double(lo);
  (void)to_double(hi);
  return trim(lo) + "," + trim(hi);
}

static std::optional<SmoothingSpec> optional_smoothing(const std::string& text) {
  if (text.empty()) return std::nullopt;
  return parse_smoothing_spec(text);
}

static PipelineConfig build_config(const Args& args) {
  PipelineConfig cfg;
  cfg.transforms = args.transforms;
  cfg.default_smoothing = parse_smoothing_spec(args.smooth);

  // Fixed dependency order: pop_spike reads epsp, epsp reads fiber_volley.
  if (args.fiber_volley) {
    cfg.features.push_back({"fiber_volley", args.fv_params, optional_smoothing(args.fv_smooth)});
  }
  if (args.epsp) {
    cfg.features.push_back({"epsp", args.epsp_params, optional_smoothing(args.epsp_smooth)});
  }
  if (args.pop_spike) {
    cfg.features.push_back({"pop_spike", args.ps_params, optional_smoothing(args.ps_smooth)});
  }
  return cfg;
}

static std::string recording_outdir(const Args& args, const std::string& input) {
  if (args.inputs.size() == 1) return args.outdir;
  const std::filesystem::path p = std::filesystem::u8path(input);
  return args.outdir + "/" + p.stem().u8string();
}

static void process_recording(const Args& args, const PipelineConfig& cfg, RecordingOutcome* out) {
  try {
    RecordingContext ctx = read_sweep_file(out->input, args.intensities, args.repetitions, args.fs_hz);
    ctx = run_pipeline(std::move(ctx), cfg);

    ensure_directory(out->outdir);
    write_sweeps_csv(out->outdir + "/sweeps.csv", ctx.sweeps);
    out->outputs.push_back("sweeps.csv");
    write_averaged_csv(out->outdir + "/averaged.csv", ctx.averaged);
    out->outputs.push_back("averaged.csv");
    for (const auto& kv : ctx.results) {
      const std::string name = kv.first + ".csv";
      write_feature_csv(out->outdir + "/" + name, kv.second);
      out->outputs.push_back(name);
    }
    write_results_json(out->outdir + "/results.json", ctx, "fepsp_analyze_cli");
    out->outputs.push_back("results.json");

    out->ctx = std::move(ctx);
    out->ok = true;
  } catch (const Error& e) {
    out->error = std::string("[") + error_kind_name(e.kind()) + "] " + e.what();
  } catch (const std::exception& e) {
    out->error = e.what();
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    Args args;

    if (argc <= 1) {
      print_help();
      return 1;
    }

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];

      if (is_flag(a, "-h", "--help")) {
        print_help();
        return 0;
      } else if (a == "--version") {
        std::cout << "fepsp " << version_string() << "\n";
        return 0;
      } else if (is_flag(a, "--input", "-i")) {
        args.inputs.push_back(require_value(i, argc, argv, a));
      } else if (a == "--outdir") {
        args.outdir = require_value(i, argc, argv, a);
      } else if (a == "--intensities") {
        args.intensities = parse_double_list(require_value(i, argc, argv, a));
      } else if (a == "--reps") {
        args.repetitions = to_int(require_value(i, argc, argv, a));
      } else if (a == "--fs") {
        args.fs_hz = to_double(require_value(i, argc, argv, a));
      } else if (a == "--jobs") {
        args.jobs = to_int(require_value(i, argc, argv, a));
      } else if (a == "--baseline") {
        args.transforms.push_back({"baseline_correction", {{"window_ms", require_window(i, argc, argv, a)}}});
      } else if (a == "--crop") {
        args.transforms.push_back({"crop_stim_artifact", {{"window_ms", require_window(i, argc, argv, a)}}});
      } else if (a == "--template-subtract") {
        args.transforms.push_back(
            {"template_subtract_stim_artifact", {{"window_ms", require_window(i, argc, argv, a)}}});
      } else if (a == "--average") {
        args.transforms.push_back({"average_sweeps", {}});
      } else if (a == "--fv-window") {
        args.fv_params["window_ms"] = require_window(i, argc, argv, a);
        args.fiber_volley = true;
      } else if (a == "--epsp-window") {
        args.epsp_params["window_ms"] = require_window(i, argc, argv, a);
        args.epsp = true;
      } else if (a == "--fit-distance") {
        args.epsp_params["fit_distance"] = require_value(i, argc, argv, a);
      } else if (a == "--ps-lag") {
        args.ps_params["lag_ms"] = require_value(i, argc, argv, a);
        args.pop_spike = true;
      } else if (a == "--ps-prominence") {
        args.ps_params["prominence"] = require_value(i, argc, argv, a);
      } else if (a == "--ps-threshold") {
        args.ps_params["threshold"] = require_value(i, argc, argv, a);
      } else if (a == "--ps-amplitude") {
        args.ps_params["amplitude"] = require_value(i, argc, argv, a);
      } else if (a == "--smooth") {
        args.smooth = require_value(i, argc, argv, a);
      } else if (a == "--fv-smooth") {
        args.fv_smooth = require_value(i, argc, argv, a);
      } else if (a == "--epsp-smooth") {
        args.epsp_smooth = require_value(i, argc, argv, a);
      } else if (a == "--ps-smooth") {
        args.ps_smooth = require_value(i, argc, argv, a);
      } else {
        throw std::runtime_error("Unknown argument: " + a);
      }
    }

    if (args.inputs.empty()) throw std::runtime_error("Missing --input");
    if (args.intensities.empty()) throw std::runtime_error("Missing --intensities");
    if (args.repetitions < 1) throw std::runtime_error("--reps must be >= 1");
    if (args.jobs < 0) throw std::runtime_error("--jobs must be >= 0");

    // Configuration errors are reported once, before any recording is read.
    const PipelineConfig cfg = build_config(args);
    validate_pipeline_config(cfg);

    std::vector<RecordingOutcome> outcomes(args.inputs.size());
    for (size_t k = 0; k < outcomes.size(); ++k) {
      outcomes[k].input = args.inputs[k];
      outcomes[k].outdir = recording_outdir(args, args.inputs[k]);
    }

    size_t n_workers = (args.jobs == 0) ? std::thread::hardware_concurrency()
                                        : static_cast<size_t>(args.jobs);
    n_workers = std::max<size_t>(1, std::min(n_workers, outcomes.size()));

    std::atomic<size_t> next{0};
    auto worker = [&]() {
      for (;;) {
        const size_t k = next.fetch_add(1);
        if (k >= outcomes.size()) return;
        process_recording(args, cfg, &outcomes[k]);
      }
    };
    if (n_workers == 1) {
      worker();
    } else {
      std::vector<std::thread> pool;
      pool.reserve(n_workers);
      for (size_t w = 0; w < n_workers; ++w) pool.emplace_back(worker);
      for (auto& t : pool) t.join();
    }

    size_t n_failed = 0;
    for (const auto& o : outcomes) {
      if (!o.ok) {
        ++n_failed;
        std::cerr << "Error: " << o.input << ": " << o.error << "\n";
        continue;
      }
      for (const auto& note : o.ctx.notes) {
        std::cerr << "Warning: " << o.input << ": " << note << "\n";
      }
      std::cout << o.input << ": " << o.ctx.sweeps.n_sweeps() << " sweeps, "
                << o.ctx.averaged.traces.size() << " intensities, fs=" << o.ctx.fs_hz << " Hz\n";
      for (const auto& name : o.outputs) {
        std::cout << "  Wrote " << o.outdir << "/" << name << "\n";
      }
    }

    if (n_failed > 0) {
      std::cerr << "Error: " << n_failed << " of " << outcomes.size() << " recordings failed\n";
      return 2;
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
