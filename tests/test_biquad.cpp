#include "test_support.hpp"

#include "fepsp/biquad.hpp"
#include "fepsp/errors.hpp"
#include "fepsp/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

using namespace fepsp;

static double rms(const std::vector<double>& x, size_t start, size_t stop) {
  double s2 = 0.0;
  for (size_t i = start; i < stop; ++i) s2 += x[i] * x[i];
  return std::sqrt(s2 / static_cast<double>(stop - start));
}

static std::vector<double> sine(double fs_hz, double f_hz, size_t n, double amp = 1.0) {
  std::vector<double> x(n);
  const double w = 2.0 * 3.141592653589793238462643383279502884 * f_hz;
  for (size_t i = 0; i < n; ++i) x[i] = amp * std::sin(w * static_cast<double>(i) / fs_hz);
  return x;
}

int main() {
  const double fs = 10000.0;

  for (int order : {1, 2, 3, 4, 5}) {
    const auto stages = design_butterworth_lowpass(fs, 500.0, order);
    assert(stages.size() == static_cast<size_t>((order + 1) / 2));
    for (const auto& c : stages) assert(std::fabs(c.dc_gain() - 1.0) < 1e-9);
  }

  // A constant passes through filtfilt unchanged (steady-state priming).
  std::vector<double> dc(200, 2.5);
  filtfilt_inplace(&dc, design_butterworth_lowpass(fs, 300.0, 3));
  for (double v : dc) assert(std::fabs(v - 2.5) < 1e-6);

  // Pass band kept, stop band attenuated.
  const size_t n = 4000;
  const std::vector<double> lo = butterworth_lowpass(sine(fs, 50.0, n), 500.0, fs, 3);
  const std::vector<double> hi = butterworth_lowpass(sine(fs, 3000.0, n), 500.0, fs, 3);
  const double r_lo = rms(lo, 500, n - 500);
  const double r_hi = rms(hi, 500, n - 500);
  if (!(r_lo > 0.65 && r_lo < 0.75)) {
    std::cerr << "Butterworth pass band rms unexpected: " << r_lo << "\n";
    return 1;
  }
  if (!(r_hi < 0.01)) {
    std::cerr << "Butterworth stop band insufficient attenuation: rms=" << r_hi << "\n";
    return 1;
  }

  // Zero phase: the filtered pass band sine stays aligned with the input.
  const std::vector<double> ref = sine(fs, 50.0, n);
  double max_err = 0.0;
  for (size_t i = 500; i < n - 500; ++i) max_err = std::max(max_err, std::fabs(lo[i] - ref[i]));
  assert(max_err < 1e-3);

  bool threw = false;
  try {
    (void)design_butterworth_lowpass(fs, 6000.0, 3);
  } catch (const Error& e) {
    threw = (e.kind() == ErrorKind::InvalidParameter);
  }
  assert(threw);

  std::cout << "test_biquad OK\n";
  return 0;
}
