#include "fepsp/numeric.hpp"

#include "fepsp/biquad.hpp"
#include "fepsp/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <utility>

namespace fepsp {

std::vector<double> gradient(const std::vector<double>& y, const std::vector<double>& x) {
  if (y.size() != x.size()) {
    throw Error(ErrorKind::InvalidParameter, "gradient: x and y must have the same length");
  }
  const size_t n = y.size();
  std::vector<double> dy(n, 0.0);
  if (n < 2) return dy;

  dy[0] = (y[1] - y[0]) / (x[1] - x[0]);
  dy[n - 1] = (y[n - 1] - y[n - 2]) / (x[n - 1] - x[n - 2]);

  for (size_t i = 1; i + 1 < n; ++i) {
    const double hs = x[i] - x[i - 1];
    const double hd = x[i + 1] - x[i];
    const double num = hs * hs * y[i + 1] + (hd * hd - hs * hs) * y[i] - hd * hd * y[i - 1];
    dy[i] = num / (hs * hd * (hd + hs));
  }
  return dy;
}

std::vector<double> moving_average(const std::vector<double>& y, size_t window) {
  const size_t n = y.size();
  if (n == 0) return {};
  window = std::max<size_t>(1, std::min(window, n));

  const long long w = static_cast<long long>(window);
  const long long left = w / 2;
  const long long last = static_cast<long long>(n) - 1;

  std::vector<double> out(n, 0.0);
  for (long long i = 0; i <= last; ++i) {
    double s = 0.0;
    for (long long k = 0; k < w; ++k) {
      const long long j = std::min(last, std::max(0LL, i - left + k));
      s += y[static_cast<size_t>(j)];
    }
    out[static_cast<size_t>(i)] = s / static_cast<double>(w);
  }
  return out;
}

namespace {

std::vector<double> solve_linear_system_gauss(std::vector<double> A, std::vector<double> b, int n) {
  // A is row-major n*n. b length n.
  auto idx = [n](int r, int c) { return r * n + c; };

  for (int i = 0; i < n; ++i) {
    int piv = i;
    double best = std::abs(A[idx(i, i)]);
    for (int r = i + 1; r < n; ++r) {
      const double v = std::abs(A[idx(r, i)]);
      if (v > best) {
        best = v;
        piv = r;
      }
    }

    if (best < 1e-14) {
      throw Error(ErrorKind::InvalidParameter, "savgol: polynomial fit is singular");
    }

    if (piv != i) {
      for (int c = i; c < n; ++c) {
        std::swap(A[idx(i, c)], A[idx(piv, c)]);
      }
      std::swap(b[i], b[piv]);
    }

    const double diag = A[idx(i, i)];
    for (int r = i + 1; r < n; ++r) {
      const double f = A[idx(r, i)] / diag;
      if (f == 0.0) continue;
      A[idx(r, i)] = 0.0;
      for (int c = i + 1; c < n; ++c) {
        A[idx(r, c)] -= f * A[idx(i, c)];
      }
      b[r] -= f * b[i];
    }
  }

  std::vector<double> x(static_cast<size_t>(n), 0.0);
  for (int i = n - 1; i >= 0; --i) {
    double s = b[i];
    for (int c = i + 1; c < n; ++c) s -= A[idx(i, c)] * x[c];
    x[i] = s / A[idx(i, i)];
  }
  return x;
}

// Least-squares polynomial fit on a window of abscissae u.
// Holds the normal matrix so several right-hand sides can reuse it.
class WindowPolyFit {
public:
  WindowPolyFit(std::vector<double> u, int order) : u_(std::move(u)), m_(order + 1) {
    gram_.assign(static_cast<size_t>(m_ * m_), 0.0);
    for (double v : u_) {
      const std::vector<double> p = powers(v);
      for (int r = 0; r < m_; ++r) {
        for (int c = 0; c < m_; ++c) {
          gram_[static_cast<size_t>(r * m_ + c)] += p[r] * p[c];
        }
      }
    }
  }

  // Coefficients c[0..order] fitted to ys.
  std::vector<double> fit(const std::vector<double>& ys) const {
    std::vector<double> rhs(static_cast<size_t>(m_), 0.0);
    for (size_t j = 0; j < u_.size(); ++j) {
      const std::vector<double> p = powers(u_[j]);
      for (int r = 0; r < m_; ++r) rhs[r] += p[r] * ys[j];
    }
    return solve_linear_system_gauss(gram_, rhs, m_);
  }

  // Weights h such that sum_j h[j]*ys[j] is the fit evaluated at u = 0.
  std::vector<double> centre_weights() const {
    std::vector<double> e0(static_cast<size_t>(m_), 0.0);
    e0[0] = 1.0;
    const std::vector<double> z = solve_linear_system_gauss(gram_, e0, m_);
    std::vector<double> h(u_.size(), 0.0);
    for (size_t j = 0; j < u_.size(); ++j) {
      const std::vector<double> p = powers(u_[j]);
      for (int k = 0; k < m_; ++k) h[j] += z[k] * p[k];
    }
    return h;
  }

  double eval(const std::vector<double>& coeffs, double u) const {
    double v = 0.0;
    for (int k = m_ - 1; k >= 0; --k) v = v * u + coeffs[k];
    return v;
  }

private:
  std::vector<double> powers(double v) const {
    std::vector<double> p(static_cast<size_t>(m_), 1.0);
    for (int k = 1; k < m_; ++k) p[k] = p[k - 1] * v;
    return p;
  }

  std::vector<double> u_;
  int m_{1};
  std::vector<double> gram_;
};

} // namespace

std::vector<double> savgol(const std::vector<double>& y, size_t window, int polyorder) {
  if (polyorder < 0) {
    throw Error(ErrorKind::InvalidParameter, "savgol: polyorder must be >= 0");
  }
  if (window % 2 == 0) {
    throw Error(ErrorKind::InvalidParameter,
                "savgol: window must be odd (got " + std::to_string(window) + ")");
  }
  if (window <= static_cast<size_t>(polyorder)) {
    throw Error(ErrorKind::InvalidParameter,
                "savgol: window must be > polyorder (got window=" + std::to_string(window) +
                    ", polyorder=" + std::to_string(polyorder) + ")");
  }
  const size_t n = y.size();
  if (n < window) {
    throw Error(ErrorKind::InvalidParameter,
                "savgol: trace has " + std::to_string(n) + " samples, fewer than window=" +
                    std::to_string(window));
  }

  const size_t half = window / 2;
  // Scale abscissae to [-1, 1] to keep the normal matrix well conditioned.
  const double scale = (half > 0) ? static_cast<double>(half) : 1.0;
  std::vector<double> u(window);
  for (size_t j = 0; j < window; ++j) {
    u[j] = (static_cast<double>(j) - static_cast<double>(half)) / scale;
  }
  const WindowPolyFit fit(u, polyorder);
  const std::vector<double> h = fit.centre_weights();

  std::vector<double> out(n, 0.0);
  for (size_t i = half; i + half < n; ++i) {
    double s = 0.0;
    for (size_t j = 0; j < window; ++j) s += h[j] * y[i - half + j];
    out[i] = s;
  }

  if (half == 0) return out;

  const std::vector<double> head(y.begin(), y.begin() + static_cast<std::ptrdiff_t>(window));
  const std::vector<double> c_head = fit.fit(head);
  for (size_t i = 0; i < half; ++i) out[i] = fit.eval(c_head, u[i]);

  const std::vector<double> tail(y.end() - static_cast<std::ptrdiff_t>(window), y.end());
  const std::vector<double> c_tail = fit.fit(tail);
  for (size_t k = 0; k < half; ++k) {
    out[n - half + k] = fit.eval(c_tail, u[window - half + k]);
  }
  return out;
}

std::vector<double> butterworth_lowpass(const std::vector<double>& y,
                                        double cutoff_hz,
                                        double fs_hz,
                                        int order) {
  if (!std::isfinite(fs_hz) || fs_hz <= 0.0) {
    throw Error(ErrorKind::InvalidParameter,
                "butterworth_lowpass: a sampling rate is required");
  }
  const std::vector<BiquadCoeffs> stages = design_butterworth_lowpass(fs_hz, cutoff_hz, order);
  std::vector<double> out = y;
  filtfilt_inplace(&out, stages);
  return out;
}

double peak_prominence(const std::vector<double>& y, size_t peak) {
  const size_t n = y.size();
  if (peak >= n) return std::numeric_limits<double>::quiet_NaN();
  const double h = y[peak];

  // Walk left until a strictly higher sample (or the border), tracking the minimum.
  double left_min = h;
  for (size_t i = peak + 1; i-- > 0;) {
    if (y[i] > h) break;
    left_min = std::min(left_min, y[i]);
  }

  double right_min = h;
  for (size_t i = peak; i < n; ++i) {
    if (y[i] > h) break;
    right_min = std::min(right_min, y[i]);
  }

  return h - std::max(left_min, right_min);
}

PeakSet find_peaks(const std::vector<double>& y, double min_prominence) {
  PeakSet out;
  const size_t n = y.size();
  if (n < 3) return out;

  size_t i = 1;
  const size_t i_max = n - 1;
  while (i < i_max) {
    if (y[i - 1] < y[i]) {
      size_t ahead = i + 1;
      while (ahead < i_max && y[ahead] == y[i]) ++ahead;
      if (y[ahead] < y[i]) {
        const size_t peak = (i + ahead - 1) / 2;
        const double prom = peak_prominence(y, peak);
        if (!(min_prominence > 0.0) || prom >= min_prominence) {
          out.indices.push_back(peak);
          out.prominences.push_back(prom);
        }
        i = ahead;
      }
    }
    ++i;
  }
  return out;
}

LinearFit linear_fit(const std::vector<double>& x, const std::vector<double>& y) {
  if (x.size() != y.size()) {
    throw Error(ErrorKind::InvalidParameter, "linear_fit: x and y must have the same length");
  }
  const double nan = std::numeric_limits<double>::quiet_NaN();
  LinearFit fit{nan, nan, nan};
  const size_t n = x.size();
  if (n < 2) return fit;

  double mx = 0.0;
  double my = 0.0;
  for (size_t i = 0; i < n; ++i) {
    mx += x[i];
    my += y[i];
  }
  mx /= static_cast<double>(n);
  my /= static_cast<double>(n);

  double sxx = 0.0;
  double sxy = 0.0;
  double ss_tot = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const double dx = x[i] - mx;
    const double dy = y[i] - my;
    sxx += dx * dx;
    sxy += dx * dy;
    ss_tot += dy * dy;
  }
  if (!(sxx > 0.0)) return fit;

  fit.slope = sxy / sxx;
  fit.intercept = my - fit.slope * mx;

  double ss_res = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const double r = y[i] - (fit.slope * x[i] + fit.intercept);
    ss_res += r * r;
  }
  fit.r_squared = (ss_tot > 0.0) ? 1.0 - ss_res / ss_tot : nan;
  return fit;
}

double auc(const std::vector<double>& x, const std::vector<double>& y) {
  if (x.size() != y.size()) {
    throw Error(ErrorKind::InvalidParameter, "auc: x and y must have the same length");
  }
  double s = 0.0;
  for (size_t i = 1; i < x.size(); ++i) {
    s += 0.5 * (y[i] + y[i - 1]) * (x[i] - x[i - 1]);
  }
  return s;
}

size_t time_to_index(const std::vector<double>& time, double t) {
  return static_cast<size_t>(std::lower_bound(time.begin(), time.end(), t) - time.begin());
}

} // namespace fepsp
