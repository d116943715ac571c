#pragma once

#include <cstddef>
#include <vector>

namespace fepsp {

// Normalized biquad coefficients for Direct Form II Transposed:
//
//   y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
//
// with a0 assumed to be 1.0 (i.e., b* and a* already divided by a0).
// First-order sections are stored with b2 = a2 = 0.
struct BiquadCoeffs {
  double b0{1.0};
  double b1{0.0};
  double b2{0.0};
  double a1{0.0};
  double a2{0.0};

  // Gain at DC, (b0+b1+b2)/(1+a1+a2).
  double dc_gain() const;
};

class Biquad {
public:
  Biquad() = default;
  explicit Biquad(const BiquadCoeffs& c);

  void set_coeffs(const BiquadCoeffs& c);
  const BiquadCoeffs& coeffs() const { return c_; }

  void reset();

  // Set the internal state to the steady state reached after an infinitely
  // long constant input x. Returns the corresponding constant output.
  double prime(double x);

  // Process one sample.
  double process(double x);

private:
  BiquadCoeffs c_{};
  double z1_{0.0};
  double z2_{0.0};
};

// A small cascade of biquad filters.
class BiquadChain {
public:
  BiquadChain() = default;
  explicit BiquadChain(const std::vector<BiquadCoeffs>& stages);

  void add_stage(const BiquadCoeffs& c);
  void reset();
  void prime(double x);

  size_t n_stages() const { return stages_.size(); }
  bool empty() const { return stages_.empty(); }

  double process(double x);
  void process_inplace(std::vector<double>* x);

private:
  std::vector<Biquad> stages_;
};

// RBJ cookbook low-pass section (bilinear transform prewarped at f0).
BiquadCoeffs design_lowpass(double fs_hz, double f0_hz, double Q);

// First-order low-pass section (bilinear transform prewarped at f0).
BiquadCoeffs design_lowpass_first_order(double fs_hz, double f0_hz);

// Digital Butterworth low-pass of the given order as a cascade of sections:
// order/2 second-order sections with the Butterworth pole Q values, plus one
// first-order section when the order is odd.
std::vector<BiquadCoeffs> design_butterworth_lowpass(double fs_hz, double cutoff_hz, int order);

// Forward-backward filtering ("filtfilt"-style) using a cascade of biquads.
//
// - Applies the cascade forward, then reverses the signal and applies the same
//   cascade again, giving zero phase distortion.
// - Pads both ends by odd reflection (2*x[0] - x[k]) and starts each pass from
//   the steady state of the first padded sample to reduce edge transients.
//
// padlen:
// - If 0, a conservative default based on #stages is used.
void filtfilt_inplace(std::vector<double>* x,
                      const std::vector<BiquadCoeffs>& stages,
                      size_t padlen = 0);

} // namespace fepsp
