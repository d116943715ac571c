#pragma once

#include <cmath>
#include <cstddef>
#include <limits>

namespace fepsp {

// Numerically-stable running mean/variance accumulator (Welford's algorithm).
//
// Notes:
// - add(x) ignores non-finite values, so n() counts finite samples only.
// - variance_sample() uses (n-1) in the denominator and returns NaN if n < 2.
// - sem() is stddev_sample() / sqrt(n), the standard error of the mean.
class RunningStats {
public:
  void add(double x) {
    if (!std::isfinite(x)) return;
    ++n_;
    const double delta = x - mean_;
    mean_ += delta / static_cast<double>(n_);
    const double delta2 = x - mean_;
    m2_ += delta * delta2;
  }

  size_t n() const { return n_; }
  double mean() const { return (n_ == 0) ? std::numeric_limits<double>::quiet_NaN() : mean_; }

  double variance_sample() const {
    if (n_ < 2) return std::numeric_limits<double>::quiet_NaN();
    return m2_ / static_cast<double>(n_ - 1);
  }

  double stddev_sample() const {
    const double v = variance_sample();
    return std::isfinite(v) ? std::sqrt(v) : v;
  }

  double sem() const {
    const double s = stddev_sample();
    return std::isfinite(s) ? s / std::sqrt(static_cast<double>(n_)) : s;
  }

private:
  size_t n_{0};
  double mean_{0.0};
  double m2_{0.0};
};

} // namespace fepsp
