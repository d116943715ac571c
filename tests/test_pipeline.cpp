#include "test_support.hpp"

#include "fepsp/averaging.hpp"
#include "fepsp/errors.hpp"
#include "fepsp/pipeline.hpp"
#include "fepsp/sweep_reader.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

using namespace fepsp;

static const double kFs = 10000.0;

// Three repetitions at each of two intensities. Each sweep carries a DC
// offset that baseline correction must remove.
static RecordingContext synthetic_recording() {
  const std::vector<double> intensities = {1.0, 2.0};
  const int reps = 3;
  std::vector<RawSweep> raw;
  for (double stim : intensities) {
    for (int r = 0; r < reps; ++r) {
      RawSweep s;
      const double offset = 0.1 * static_cast<double>(r + 1);
      for (int i = 0; i <= 100; ++i) {
        const double t_ms = static_cast<double>(i) / kFs * 1000.0;
        const double trough = -0.5 * std::exp(-(t_ms - 2.0) * (t_ms - 2.0) / (2.0 * 0.2 * 0.2));
        const double spike = 0.3 * std::exp(-(t_ms - 4.0) * (t_ms - 4.0) / (2.0 * 0.3 * 0.3));
        s.time.push_back(static_cast<double>(i) / kFs);
        s.voltage.push_back(offset + stim * (trough + spike));
      }
      raw.push_back(s);
    }
  }
  RecordingContext ctx;
  ctx.sweeps = build_sweep_table(raw, intensities, reps);
  ctx.fs_hz = kFs;
  return ctx;
}

static PipelineConfig full_config() {
  PipelineConfig cfg;
  cfg.transforms.push_back({"baseline_correction", {{"window_ms", "0,1"}}});
  cfg.features.push_back({"fiber_volley", {{"window_ms", "1.5,3"}}, std::nullopt});
  cfg.features.push_back({"epsp", {{"window_ms", "1.5,3.5"}}, std::nullopt});
  cfg.features.push_back({"pop_spike", {{"lag_ms", "4"}, {"prominence", "0.1"}}, std::nullopt});
  return cfg;
}

template <typename F>
static bool throws_kind(F&& f, ErrorKind kind) {
  try {
    f();
  } catch (const Error& e) {
    return e.kind() == kind;
  }
  return false;
}

static void test_end_to_end() {
  const RecordingContext ctx = run_pipeline(synthetic_recording(), full_config());

  assert(ctx.notes.empty());
  assert(ctx.averaged.traces.size() == 2);
  assert(ctx.averaged.traces[0].n_sweeps == 3);
  assert(ctx.results.size() == 3);
  assert(ctx.metadata.at("smoothing.epsp") == "none");

  const FeatureTable* fv = ctx.find_result("fiber_volley");
  const FeatureTable* epsp = ctx.find_result("epsp");
  const FeatureTable* ps = ctx.find_result("pop_spike");
  assert(fv && epsp && ps);

  for (double stim : {1.0, 2.0}) {
    const std::vector<double>* fv_row = fv->find_row(stim);
    const std::vector<double>* epsp_row = epsp->find_row(stim);
    const std::vector<double>* ps_row = ps->find_row(stim);
    assert(fv_row && epsp_row && ps_row);

    assert(std::fabs(fv->value(*fv_row, "fv_amp") - 0.5 * stim) < 1e-3);
    assert(std::fabs(fv->value(*fv_row, "fv_s") - 0.002) < 1e-9);
    assert(std::fabs(epsp->value(*epsp_row, "epsp_v") + 0.5 * stim) < 1e-3);
    assert(epsp->value(*epsp_row, "epsp_slope_ms") < 0.0);
    assert(ps->value(*ps_row, "ps_amp") > 0.0);
    assert(std::fabs(ps->value(*ps_row, "ps_s") - 0.004) < 1e-9);
  }

  // Baseline correction removed the per-sweep offset.
  for (const auto& s : ctx.sweeps.sweeps) assert(std::fabs(s.voltage[0]) < 1e-6);
}

static void test_missing_dependency_is_a_note() {
  PipelineConfig cfg;
  cfg.features.push_back({"fiber_volley", {{"window_ms", "1.5,3"}}, std::nullopt});
  cfg.features.push_back({"pop_spike", {{"lag_ms", "4"}, {"prominence", "0.1"}}, std::nullopt});

  const RecordingContext ctx = run_pipeline(synthetic_recording(), cfg);
  assert(ctx.find_result("fiber_volley") != nullptr);
  assert(ctx.find_result("pop_spike") == nullptr);
  assert(ctx.notes.size() == 1);
}

static void test_configuration_errors() {
  PipelineConfig unknown = full_config();
  unknown.features.push_back({"spike_width", {}, std::nullopt});
  assert(throws_kind([&]() { run_pipeline(synthetic_recording(), unknown); }, ErrorKind::UnknownComponent));

  PipelineConfig bad_transform;
  bad_transform.transforms.push_back({"detrend", {}});
  assert(throws_kind([&]() { run_pipeline(synthetic_recording(), bad_transform); },
                     ErrorKind::UnknownComponent));

  PipelineConfig missing;
  missing.features.push_back({"epsp", {}, std::nullopt});
  assert(throws_kind([&]() { validate_pipeline_config(missing); }, ErrorKind::MissingParameter));

  // pop_spike has no default prominence.
  PipelineConfig no_prominence = full_config();
  no_prominence.features[2].params.erase("prominence");
  assert(throws_kind([&]() { validate_pipeline_config(no_prominence); }, ErrorKind::MissingParameter));
  assert(throws_kind([&]() { run_pipeline(synthetic_recording(), no_prominence); },
                     ErrorKind::MissingParameter));

  RecordingContext empty;
  empty.fs_hz = kFs;
  assert(throws_kind([&]() { run_pipeline(empty, full_config()); }, ErrorKind::InvalidState));
}

static void test_smoothing_resolution_and_averaging_order() {
  PipelineConfig cfg = full_config();
  SmoothingSpec ma;
  ma.method = SmoothingMethod::MovingAverage;
  ma.window_size = 3;
  cfg.default_smoothing = ma;
  SmoothingSpec sg;
  sg.method = SmoothingMethod::Savgol;
  sg.window_size = 7;
  sg.polyorder = 2;
  cfg.features[1].smoothing = sg;

  // Averaging first, then a crop: the averaged table follows the cropped sweeps.
  cfg.transforms.push_back({"average_sweeps", {}});
  cfg.transforms.push_back({"crop_stim_artifact", {{"window_ms", "0,0.5"}}});

  const RecordingContext ctx = run_pipeline(synthetic_recording(), cfg);
  assert(ctx.metadata.at("smoothing.fiber_volley") == "moving_average:3");
  assert(ctx.metadata.at("smoothing.epsp") == "savgol:7:2");
  assert(ctx.averaged.traces[0].time.size() == ctx.sweeps.sweeps[0].n_samples());
  assert(ctx.averaged.traces[0].time.size() == 96);
}

static void test_loader_shape() {
  std::vector<RawSweep> raw(5);
  for (auto& s : raw) {
    s.time = {0.0, 0.0001};
    s.voltage = {0.0, 0.0};
  }
  assert(throws_kind([&]() { build_sweep_table(raw, {1.0, 2.0}, 3); }, ErrorKind::ShapeMismatch));

  raw.emplace_back(raw.front());
  const SweepTable t = build_sweep_table(raw, {10.0, 20.0}, 3);
  assert(t.n_sweeps() == 6);
  assert(t.sweeps[4].stim_intensity == 20.0);
  assert(t.sweeps[4].sweep_id == 2);
  assert(t.sweeps[4].source_index == 4);

  // Intensities must be finite and distinct.
  const double nan = std::nan("");
  assert(throws_kind([&]() { build_sweep_table(raw, {nan, 1.0}, 3); }, ErrorKind::InvalidParameter));
  assert(throws_kind([&]() { build_sweep_table(raw, {1.0, std::numeric_limits<double>::infinity()}, 3); }, ErrorKind::InvalidParameter));
  assert(throws_kind([&]() { build_sweep_table(raw, {1.0, 1.0}, 3); }, ErrorKind::InvalidParameter));

  // Time must be strictly increasing within every sweep.
  std::vector<RawSweep> repeated = raw;
  repeated[2].time = {0.0, 0.0001, 0.0001};
  repeated[2].voltage = {0.0, 0.0, 0.0};
  assert(throws_kind([&]() { build_sweep_table(repeated, {10.0, 20.0}, 3); }, ErrorKind::DataInconsistency));
  repeated[2].time = {0.0, 0.0002, 0.0001};
  assert(throws_kind([&]() { build_sweep_table(repeated, {10.0, 20.0}, 3); }, ErrorKind::DataInconsistency));

  // A hand-built table with a NaN intensity is rejected instead of averaged.
  SweepTable bad = t;
  bad.sweeps[0].stim_intensity = nan;
  assert(throws_kind([&]() { average_sweeps(bad); }, ErrorKind::InvalidParameter));
}

int main() {
  test_end_to_end();
  test_missing_dependency_is_a_note();
  test_configuration_errors();
  test_smoothing_resolution_and_averaging_order();
  test_loader_shape();
  std::cout << "test_pipeline OK\n";
  return 0;
}
