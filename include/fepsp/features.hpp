#pragma once

#include "fepsp/params.hpp"
#include "fepsp/smoothing.hpp"
#include "fepsp/types.hpp"

#include <string>

namespace fepsp {

// Feature extraction over the averaged traces.
//
// Every feature smooths each stimulus intensity's mean trace once with its
// resolved SmoothingSpec, then produces one FeatureTable row per intensity.
// Detection failures for one intensity (no trough, no spike, empty window)
// yield NaN cells rather than errors.

enum class FeatureKind {
  FiberVolley,
  Epsp,
  PopSpike,
};

// Registry names: "fiber_volley", "epsp", "pop_spike".
std::string feature_kind_name(FeatureKind kind);
bool parse_feature_kind(const std::string& s, FeatureKind* out_kind);

// How the population spike amplitude is measured.
//
// BaselineInterpolated: |apex - baseline(apex time)| where the baseline is the
//   straight line from the epsp minimum to the first trough after the apex
//   (else the last window sample). If the apex is the last window sample there
//   is no anchor: the amplitude equals DirectDifference and ps_baseline_v
//   reports epsp_v.
// DirectDifference: |epsp_v - apex|.
enum class PopSpikeAmplitude {
  BaselineInterpolated,
  DirectDifference,
};

std::string pop_spike_amplitude_name(PopSpikeAmplitude mode);
// Accepts "baseline" / "baseline_interpolated" and "direct" / "direct_difference".
bool parse_pop_spike_amplitude(const std::string& s, PopSpikeAmplitude* out_mode);

struct FiberVolleyParams {
  WindowMs window;
};

struct EpspParams {
  WindowMs window;
  int fit_distance{4};  // samples on each side of the slope midpoint
};

struct PopSpikeParams {
  double lag_ms{0.0};
  double prominence{0.0};  // mV
  // Flattening threshold for the fallback detector, in mV/ms. It is scaled
  // by 1000 before the comparison with the derivative (mV/s), so a threshold
  // written against the raw mV/s derivative must be divided by 1000 here.
  // Only used when has_threshold.
  double threshold{0.0};
  bool has_threshold{false};
  PopSpikeAmplitude amplitude{PopSpikeAmplitude::BaselineInterpolated};
};

// Parameter records from a ParamMap.
//
// Throws Error(MissingParameter) for absent required parameters
// (fiber_volley: window_ms; epsp: window_ms; pop_spike: lag_ms, prominence)
// and Error(InvalidParameter) for malformed or out-of-range values.
FiberVolleyParams fiber_volley_params(const ParamMap& params);
EpspParams epsp_params(const ParamMap& params);
PopSpikeParams pop_spike_params(const ParamMap& params);

// Columns: stim_intensity, fv_amp, fv_s, fv_v
FeatureTable compute_fiber_volley(const AveragedTable& averaged,
                                  double fs_hz,
                                  const FiberVolleyParams& params,
                                  const SmoothingSpec& smoothing);

// Columns: stim_intensity, epsp_s, epsp_v, slope_mid_s, slope_mid_v,
//          epsp_slope (mV/s), epsp_slope_ms (mV/ms), r_squared,
//          slope_to_fv_amplitude
//
// fiber_volley may be nullptr; slope_to_fv_amplitude is then NaN.
FeatureTable compute_epsp(const AveragedTable& averaged,
                          double fs_hz,
                          const EpspParams& params,
                          const SmoothingSpec& smoothing,
                          const FeatureTable* fiber_volley);

// Columns: stim_intensity, ps_amp, ps_s, ps_v, ps_baseline_v
//
// Throws Error(MissingDependency) if epsp is nullptr or empty.
FeatureTable compute_pop_spike(const AveragedTable& averaged,
                               double fs_hz,
                               const PopSpikeParams& params,
                               const SmoothingSpec& smoothing,
                               const FeatureTable* epsp);

// One configured feature: a closed set of kinds, each carrying its own
// parameter record. Only the record matching kind is meaningful.
struct Feature {
  FeatureKind kind{FeatureKind::FiberVolley};
  SmoothingSpec smoothing;

  FiberVolleyParams fiber_volley;
  EpspParams epsp;
  PopSpikeParams pop_spike;

  std::string name() const { return feature_kind_name(kind); }

  // Reads the averaged table and any upstream results from ctx.
  FeatureTable compute(const RecordingContext& ctx) const;
};

} // namespace fepsp
