#include "fepsp/transforms.hpp"

#include "fepsp/errors.hpp"
#include "fepsp/numeric.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <utility>

namespace fepsp {

namespace {

constexpr double kTemplateEnergyFloor = 1e-20;

void validate_window(const WindowMs& w, const char* what) {
  if (!std::isfinite(w.start_ms) || !std::isfinite(w.end_ms)) {
    throw Error(ErrorKind::InvalidParameter, std::string(what) + ": window must be finite");
  }
  if (w.end_ms < w.start_ms) {
    throw Error(ErrorKind::InvalidParameter, std::string(what) + ": window end must be >= start");
  }
}

std::string sweep_label(const Sweep& s) {
  std::ostringstream oss;
  oss << "stim_intensity=" << s.stim_intensity << " sweep=" << s.sweep_id;
  return oss.str();
}

} // namespace

bool same_time_grid(const std::vector<double>& a, const std::vector<double>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!(std::fabs(a[i] - b[i]) <= 1e-8 + 1e-5 * std::fabs(b[i]))) return false;
  }
  return true;
}

SweepTable baseline_correction(const SweepTable& in, const WindowMs& window) {
  validate_window(window, "baseline_correction");

  SweepTable out = in;
  for (auto& s : out.sweeps) {
    const size_t start = time_to_index(s.time, window.start_sec());
    const size_t stop = time_to_index(s.time, window.end_sec());
    if (stop <= start) {
      throw Error(ErrorKind::InvalidParameter,
                  "baseline_correction: window holds no samples (" + sweep_label(s) + ")");
    }

    double sum = 0.0;
    for (size_t i = start; i < stop; ++i) sum += s.voltage[i];
    const double baseline = sum / static_cast<double>(stop - start);

    for (double& v : s.voltage) v -= baseline;
  }
  return out;
}

SweepTable crop_stim_artifact(const SweepTable& in, const WindowMs& window) {
  validate_window(window, "crop_stim_artifact");

  SweepTable out = in;
  for (auto& s : out.sweeps) {
    const size_t start = time_to_index(s.time, window.start_sec());
    const size_t stop = time_to_index(s.time, window.end_sec());
    const size_t n_removed = stop - start;
    if (n_removed >= s.n_samples()) {
      throw Error(ErrorKind::InvalidParameter,
                  "crop_stim_artifact: window removes every sample (" + sweep_label(s) + ")");
    }

    std::vector<double> t;
    std::vector<double> v;
    t.reserve(s.n_samples() - n_removed);
    v.reserve(s.n_samples() - n_removed);
    for (size_t i = 0; i < s.n_samples(); ++i) {
      if (i >= start && i < stop) continue;
      t.push_back(s.time[i]);
      v.push_back(s.voltage[i]);
    }

    const double t0 = t.front();
    for (double& x : t) x -= t0;

    s.time = std::move(t);
    s.voltage = std::move(v);
  }
  return out;
}

SweepTable template_subtract_stim_artifact(const SweepTable& in,
                                           const WindowMs& window,
                                           std::vector<double>* skipped_intensities) {
  validate_window(window, "template_subtract_stim_artifact");

  SweepTable out = in;
  for (const auto& s : out.sweeps) {
    if (!std::isfinite(s.stim_intensity)) {
      throw Error(ErrorKind::InvalidParameter,
                  "template_subtract_stim_artifact: stim_intensity must be finite");
    }
  }
  for (double stim : out.intensities()) {
    const std::vector<size_t> group = out.group_indices(stim);
    const std::vector<double>& t = out.sweeps[group.front()].time;

    for (size_t gi : group) {
      if (!same_time_grid(out.sweeps[gi].time, t)) {
        throw Error(ErrorKind::DataInconsistency,
                    "template_subtract_stim_artifact: time grid mismatch between sweep and template (" +
                        sweep_label(out.sweeps[gi]) + ")");
      }
    }

    std::vector<double> tmpl(t.size(), 0.0);
    for (size_t gi : group) {
      const auto& v = out.sweeps[gi].voltage;
      for (size_t i = 0; i < tmpl.size(); ++i) tmpl[i] += v[i];
    }
    for (double& x : tmpl) x /= static_cast<double>(group.size());

    const size_t start = time_to_index(t, window.start_sec());
    const size_t stop = time_to_index(t, window.end_sec());

    double denom = 0.0;
    for (size_t i = start; i < stop; ++i) denom += tmpl[i] * tmpl[i];
    if (denom <= kTemplateEnergyFloor) {
      if (skipped_intensities) skipped_intensities->push_back(stim);
      continue;
    }

    for (size_t gi : group) {
      auto& y = out.sweeps[gi].voltage;
      double num = 0.0;
      for (size_t i = start; i < stop; ++i) num += y[i] * tmpl[i];
      const double a = num / denom;
      for (size_t i = start; i < stop; ++i) y[i] -= a * tmpl[i];
    }
  }
  return out;
}

} // namespace fepsp
