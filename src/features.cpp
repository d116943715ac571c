#include "fepsp/features.hpp"

#include "fepsp/errors.hpp"
#include "fepsp/numeric.hpp"
#include "fepsp/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace fepsp {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Index (relative to the slice) of the best candidate: highest prominence,
// ties broken by the larger value of `rank` at that index.
size_t pick_most_prominent(const PeakSet& peaks, const std::vector<double>& rank) {
  size_t best = 0;
  for (size_t k = 1; k < peaks.indices.size(); ++k) {
    const double p = peaks.prominences[k];
    const double pb = peaks.prominences[best];
    if (p > pb || (p == pb && rank[peaks.indices[k]] > rank[peaks.indices[best]])) {
      best = k;
    }
  }
  return peaks.indices[best];
}

std::vector<double> slice(const std::vector<double>& v, size_t start, size_t stop) {
  return std::vector<double>(v.begin() + static_cast<std::ptrdiff_t>(start),
                             v.begin() + static_cast<std::ptrdiff_t>(stop));
}

} // namespace

std::string feature_kind_name(FeatureKind kind) {
  switch (kind) {
    case FeatureKind::FiberVolley:
      return "fiber_volley";
    case FeatureKind::Epsp:
      return "epsp";
    case FeatureKind::PopSpike:
      return "pop_spike";
    default:
      return "unknown";
  }
}

bool parse_feature_kind(const std::string& s_in, FeatureKind* out_kind) {
  if (!out_kind) return false;
  const std::string s = to_lower(trim(s_in));
  if (s == "fiber_volley") {
    *out_kind = FeatureKind::FiberVolley;
    return true;
  }
  if (s == "epsp") {
    *out_kind = FeatureKind::Epsp;
    return true;
  }
  if (s == "pop_spike") {
    *out_kind = FeatureKind::PopSpike;
    return true;
  }
  return false;
}

std::string pop_spike_amplitude_name(PopSpikeAmplitude mode) {
  switch (mode) {
    case PopSpikeAmplitude::BaselineInterpolated:
      return "baseline";
    case PopSpikeAmplitude::DirectDifference:
      return "direct";
    default:
      return "unknown";
  }
}

bool parse_pop_spike_amplitude(const std::string& s_in, PopSpikeAmplitude* out_mode) {
  if (!out_mode) return false;
  const std::string s = to_lower(trim(s_in));
  if (s == "baseline" || s == "baseline_interpolated") {
    *out_mode = PopSpikeAmplitude::BaselineInterpolated;
    return true;
  }
  if (s == "direct" || s == "direct_difference") {
    *out_mode = PopSpikeAmplitude::DirectDifference;
    return true;
  }
  return false;
}

FiberVolleyParams fiber_volley_params(const ParamMap& params) {
  FiberVolleyParams p;
  p.window = param_window(params, "window_ms", "fiber_volley");
  if (p.window.end_ms < p.window.start_ms) {
    throw Error(ErrorKind::InvalidParameter, "fiber_volley: window_ms end must be >= start");
  }
  return p;
}

EpspParams epsp_params(const ParamMap& params) {
  EpspParams p;
  p.window = param_window(params, "window_ms", "epsp");
  if (p.window.end_ms < p.window.start_ms) {
    throw Error(ErrorKind::InvalidParameter, "epsp: window_ms end must be >= start");
  }
  p.fit_distance = param_int_or(params, "fit_distance", p.fit_distance, "epsp");
  if (p.fit_distance < 1) {
    throw Error(ErrorKind::InvalidParameter, "epsp: fit_distance must be >= 1");
  }
  return p;
}

PopSpikeParams pop_spike_params(const ParamMap& params) {
  PopSpikeParams p;
  p.lag_ms = param_double(params, "lag_ms", "pop_spike");
  p.prominence = param_double(params, "prominence", "pop_spike");
  if (!(p.lag_ms > 0.0)) {
    throw Error(ErrorKind::InvalidParameter, "pop_spike: lag_ms must be > 0");
  }
  if (!(p.prominence >= 0.0)) {
    throw Error(ErrorKind::InvalidParameter, "pop_spike: prominence must be >= 0");
  }
  if (has_param(params, "threshold")) {
    p.threshold = param_double(params, "threshold", "pop_spike");
    if (!(p.threshold > 0.0)) {
      throw Error(ErrorKind::InvalidParameter, "pop_spike: threshold must be > 0");
    }
    p.has_threshold = true;
  }
  const std::string amp = param_string_or(params, "amplitude", "baseline");
  if (!parse_pop_spike_amplitude(amp, &p.amplitude)) {
    throw Error(ErrorKind::InvalidParameter, "pop_spike: unknown amplitude mode '" + amp + "'");
  }
  return p;
}

FeatureTable compute_fiber_volley(const AveragedTable& averaged,
                                  double fs_hz,
                                  const FiberVolleyParams& params,
                                  const SmoothingSpec& smoothing) {
  FeatureTable out;
  out.columns = {"stim_intensity", "fv_amp", "fv_s", "fv_v"};

  for (const auto& tr : averaged.traces) {
    const std::vector<double>& x = tr.time;
    const std::vector<double> y = apply_smoothing(tr.mean, smoothing, fs_hz);

    const size_t start = time_to_index(x, params.window.start_sec());
    const size_t stop = std::max(start, time_to_index(x, params.window.end_sec()));

    // The fiber volley is negative-going: look for peaks of -y.
    std::vector<double> neg = slice(y, start, stop);
    for (double& v : neg) v = -v;

    double fv_amp = kNaN;
    double fv_s = kNaN;
    double fv_v = kNaN;
    const PeakSet troughs = find_peaks(neg);
    if (!troughs.indices.empty()) {
      const size_t idx = start + pick_most_prominent(troughs, neg);
      fv_s = x[idx];
      fv_v = y[idx];
      if (std::isfinite(fv_v)) fv_amp = std::fabs(fv_v);
    }

    out.rows.push_back({tr.stim_intensity, fv_amp, fv_s, fv_v});
  }
  return out;
}

FeatureTable compute_epsp(const AveragedTable& averaged,
                          double fs_hz,
                          const EpspParams& params,
                          const SmoothingSpec& smoothing,
                          const FeatureTable* fiber_volley) {
  FeatureTable out;
  out.columns = {"stim_intensity", "epsp_s", "epsp_v", "slope_mid_s", "slope_mid_v",
                 "epsp_slope", "epsp_slope_ms", "r_squared", "slope_to_fv_amplitude"};

  for (const auto& tr : averaged.traces) {
    const std::vector<double>& x = tr.time;
    const std::vector<double> y = apply_smoothing(tr.mean, smoothing, fs_hz);
    const size_t n = y.size();

    const size_t start = time_to_index(x, params.window.start_sec());
    const size_t stop = time_to_index(x, params.window.end_sec());
    if (stop <= start) {
      out.rows.push_back({tr.stim_intensity, kNaN, kNaN, kNaN, kNaN, kNaN, kNaN, kNaN, kNaN});
      continue;
    }

    const std::vector<double> dy = gradient(y, x);

    // Minimum and steepest descent are located independently.
    size_t i_min = start;
    size_t i_mid = start;
    for (size_t i = start + 1; i < stop; ++i) {
      if (y[i] < y[i_min]) i_min = i;
      if (dy[i] < dy[i_mid]) i_mid = i;
    }

    const size_t fd = static_cast<size_t>(params.fit_distance);
    const size_t lo = (i_mid > fd) ? i_mid - fd : 0;
    const size_t hi = std::min(n - 1, i_mid + fd);
    std::vector<double> xs;
    std::vector<double> ys;
    for (size_t i = lo; i <= hi; ++i) {
      xs.push_back(x[i] - x[i_mid]);
      ys.push_back(y[i]);
    }
    const LinearFit fit = linear_fit(xs, ys);
    const double slope_ms = fit.slope / 1000.0;

    double ratio = kNaN;
    if (fiber_volley) {
      const std::vector<double>* fv_row = fiber_volley->find_row(tr.stim_intensity);
      if (fv_row) {
        const double fv_amp = fiber_volley->value(*fv_row, "fv_amp");
        if (std::isfinite(fv_amp) && fv_amp != 0.0 && std::isfinite(slope_ms) && slope_ms != 0.0) {
          ratio = slope_ms / fv_amp;
        }
      }
    }

    out.rows.push_back({tr.stim_intensity, x[i_min], y[i_min], x[i_mid], y[i_mid],
                        fit.slope, slope_ms, fit.r_squared, ratio});
  }
  return out;
}

FeatureTable compute_pop_spike(const AveragedTable& averaged,
                               double fs_hz,
                               const PopSpikeParams& params,
                               const SmoothingSpec& smoothing,
                               const FeatureTable* epsp) {
  if (!epsp || epsp->empty()) {
    throw Error(ErrorKind::MissingDependency, "pop_spike: the epsp result is required");
  }

  FeatureTable out;
  out.columns = {"stim_intensity", "ps_amp", "ps_s", "ps_v", "ps_baseline_v"};

  for (const auto& tr : averaged.traces) {
    const std::vector<double>* epsp_row = epsp->find_row(tr.stim_intensity);
    const double epsp_s = epsp_row ? epsp->value(*epsp_row, "epsp_s") : kNaN;
    const double epsp_v = epsp_row ? epsp->value(*epsp_row, "epsp_v") : kNaN;
    if (!std::isfinite(epsp_s) || !std::isfinite(epsp_v)) {
      out.rows.push_back({tr.stim_intensity, kNaN, kNaN, kNaN, kNaN});
      continue;
    }

    const std::vector<double>& x = tr.time;
    const std::vector<double> y = apply_smoothing(tr.mean, smoothing, fs_hz);
    const std::vector<double> dy = gradient(y, x);

    const size_t start = time_to_index(x, epsp_s);
    const size_t stop = std::max(start, time_to_index(x, epsp_s + params.lag_ms / 1000.0));
    const std::vector<double> y_w = slice(y, start, stop);
    const std::vector<double> dy_w = slice(dy, start, stop);

    bool found = false;
    size_t apex = 0;

    // Primary: a positive peak clearing the prominence requirement.
    const PeakSet peaks = find_peaks(y_w, params.prominence);
    if (!peaks.indices.empty()) {
      apex = start + pick_most_prominent(peaks, y_w);
      found = true;
    } else if (params.has_threshold && !dy_w.empty()) {
      // Fallback: steepest rise, then the first flattening below threshold.
      size_t rise = 0;
      for (size_t j = 1; j < dy_w.size(); ++j) {
        if (dy_w[j] > dy_w[rise]) rise = j;
      }
      if (dy_w[rise] > 0.0) {
        const double threshold_per_s = params.threshold * 1000.0;
        size_t flat = dy_w.size();
        for (size_t j = rise + 1; j < dy_w.size(); ++j) {
          if (std::fabs(dy_w[j]) < threshold_per_s) {
            flat = j;
            break;
          }
        }
        if (flat < dy_w.size()) {
          size_t top = rise;
          for (size_t j = rise; j <= flat; ++j) {
            if (y_w[j] > y_w[top]) top = j;
          }
          if (y_w[top] - y_w[rise] >= params.prominence) {
            apex = start + top;
            found = true;
          }
        }
      }
    }

    if (!found) {
      out.rows.push_back({tr.stim_intensity, kNaN, kNaN, kNaN, kNaN});
      continue;
    }

    const double ps_s = x[apex];
    const double ps_v = y[apex];
    double base_v = epsp_v;

    if (params.amplitude == PopSpikeAmplitude::BaselineInterpolated) {
      // Return-to-baseline anchor: first trough after the apex inside the
      // window, else the last window sample.
      size_t anchor = apex;
      if (apex + 1 < stop) {
        std::vector<double> tail = slice(y, apex, stop);
        for (double& v : tail) v = -v;
        const PeakSet troughs = find_peaks(tail);
        anchor = troughs.indices.empty() ? stop - 1 : apex + troughs.indices.front();
      }
      const double dt = x[anchor] - epsp_s;
      if (anchor > apex && dt > 0.0) {
        base_v = epsp_v + (y[anchor] - epsp_v) * (ps_s - epsp_s) / dt;
      }
    }

    const double ps_amp = std::fabs(ps_v - base_v);
    out.rows.push_back({tr.stim_intensity, ps_amp, ps_s, ps_v, base_v});
  }
  return out;
}

FeatureTable Feature::compute(const RecordingContext& ctx) const {
  switch (kind) {
    case FeatureKind::FiberVolley:
      return compute_fiber_volley(ctx.averaged, ctx.fs_hz, fiber_volley, smoothing);
    case FeatureKind::Epsp:
      return compute_epsp(ctx.averaged, ctx.fs_hz, epsp, smoothing, ctx.find_result("fiber_volley"));
    case FeatureKind::PopSpike:
      return compute_pop_spike(ctx.averaged, ctx.fs_hz, pop_spike, smoothing, ctx.find_result("epsp"));
  }
  throw Error(ErrorKind::UnknownComponent, "Feature::compute: unknown feature kind");
}

} // namespace fepsp
