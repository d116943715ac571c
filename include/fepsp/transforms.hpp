#pragma once

#include "fepsp/types.hpp"

#include <vector>

namespace fepsp {

// Trace-level transforms applied to the per-sweep table before averaging.
//
// Each transform reads a SweepTable and returns a new one; the input is never
// modified. Windows are converted to sample ranges [start, stop) with
// time_to_index() on every sweep's own time axis.
//
// The order in which transforms are applied matters (artifact removal before
// averaging, baseline correction before artifact removal) but is left to the
// caller.

// Subtract, per sweep, the mean voltage inside window.
// Throws Error(InvalidParameter) if the window holds no samples of a sweep.
SweepTable baseline_correction(const SweepTable& in, const WindowMs& window);

// Remove, per sweep, every sample with time in [start, end) and shift the
// time axis so the first remaining sample is at exactly 0.
// Throws Error(InvalidParameter) if the window would remove a whole sweep.
SweepTable crop_stim_artifact(const SweepTable& in, const WindowMs& window);

// Per stimulus intensity, build a template (sample-wise mean over all sweeps
// of that intensity) and remove from each sweep the least-squares scaled
// template inside window:
//
//   a = (y . T) / (T . T)   over the window
//   y[window] -= a * T[window]
//
// Groups whose template energy in the window is <= 1e-20 are returned
// unchanged; their intensities are appended to *skipped_intensities.
//
// Throws Error(DataInconsistency) if a sweep's time grid differs from the
// template grid.
SweepTable template_subtract_stim_artifact(const SweepTable& in,
                                           const WindowMs& window,
                                           std::vector<double>* skipped_intensities = nullptr);

// True if both time vectors have the same length and agree sample by sample
// within |a-b| <= 1e-8 + 1e-5*|b|.
bool same_time_grid(const std::vector<double>& a, const std::vector<double>& b);

} // namespace fepsp
