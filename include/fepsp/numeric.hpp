#pragma once

#include <cstddef>
#include <vector>

namespace fepsp {

// Stateless numeric primitives shared by the transforms and features.
//
// All functions take whole traces (std::vector<double>) and return new
// vectors; none of them keeps state between calls.

// Derivative dy/dx with the same length as the input.
//
// Interior points use second-order central differences that account for
// non-uniform spacing; the two boundary points use one-sided differences.
// Traces with fewer than two samples yield zeros.
std::vector<double> gradient(const std::vector<double>& y, const std::vector<double>& x);

// Uniform (boxcar) smoothing with nearest-value edge extension.
//
// window is clamped to [1, y.size()]. Even windows are centred one sample to
// the right of odd ones (same convention as scipy.ndimage.uniform_filter1d).
std::vector<double> moving_average(const std::vector<double>& y, size_t window);

// Savitzky-Golay smoothing.
//
// Requirements (InvalidParameter otherwise):
// - window is odd
// - window > polyorder
// - y.size() >= window
//
// The first/last window/2 samples are taken from a polynomial fit of the
// first/last full window.
std::vector<double> savgol(const std::vector<double>& y, size_t window, int polyorder);

// Zero-phase Butterworth low-pass (forward-backward filtering).
//
// Throws InvalidParameter if fs_hz is absent (not finite or <= 0), if
// cutoff_hz is not inside (0, fs/2), or if order < 1.
std::vector<double> butterworth_lowpass(const std::vector<double>& y,
                                        double cutoff_hz,
                                        double fs_hz,
                                        int order = 3);

struct PeakSet {
  std::vector<size_t> indices;      // ascending
  std::vector<double> prominences;  // same length as indices
};

// Local maxima of y (endpoints excluded; flat tops reported at their middle
// sample) together with their topographic prominence.
//
// If min_prominence > 0, peaks with a smaller prominence are dropped.
PeakSet find_peaks(const std::vector<double>& y, double min_prominence = 0.0);

// Prominence of a single local maximum at index peak.
double peak_prominence(const std::vector<double>& y, size_t peak);

struct LinearFit {
  double slope{0.0};
  double intercept{0.0};
  double r_squared{0.0};  // NaN if y has zero variance
};

// Ordinary least squares y = slope*x + intercept.
//
// Fewer than two points or a constant x gives NaN for every field.
LinearFit linear_fit(const std::vector<double>& x, const std::vector<double>& y);

// Trapezoidal area under y(x).
double auc(const std::vector<double>& x, const std::vector<double>& y);

// First index whose time is >= t (lower bound). Returns time.size() when every
// sample lies before t.
//
// All millisecond windows are mapped to sample ranges with this function so
// that slicing stays stable under floating-point timestamp jitter.
size_t time_to_index(const std::vector<double>& time, double t);

} // namespace fepsp
