#include "fepsp/smoothing.hpp"

#include "fepsp/errors.hpp"
#include "fepsp/numeric.hpp"
#include "fepsp/utils.hpp"

#include <cmath>
#include <sstream>

namespace fepsp {

std::string smoothing_method_name(SmoothingMethod method) {
  switch (method) {
    case SmoothingMethod::None:
      return "none";
    case SmoothingMethod::MovingAverage:
      return "moving_average";
    case SmoothingMethod::Savgol:
      return "savgol";
    case SmoothingMethod::ButterworthLowpass:
      return "butterworth_lowpass";
    default:
      return "unknown";
  }
}

bool parse_smoothing_method(const std::string& s_in, SmoothingMethod* out_method) {
  if (!out_method) return false;
  const std::string s = to_lower(trim(s_in));
  if (s.empty()) return false;

  if (s == "none" || s == "off") {
    *out_method = SmoothingMethod::None;
    return true;
  }
  if (s == "moving_average" || s == "ma") {
    *out_method = SmoothingMethod::MovingAverage;
    return true;
  }
  if (s == "savgol" || s == "savitzky_golay") {
    *out_method = SmoothingMethod::Savgol;
    return true;
  }
  if (s == "butterworth_lowpass" || s == "butter_lowpass" || s == "butter") {
    *out_method = SmoothingMethod::ButterworthLowpass;
    return true;
  }
  return false;
}

SmoothingSpec parse_smoothing_spec(const std::string& text) {
  const std::vector<std::string> parts = split(trim(text), ':');
  SmoothingSpec spec;
  if (parts.empty() || !parse_smoothing_method(parts[0], &spec.method)) {
    throw Error(ErrorKind::InvalidParameter, "Unknown smoothing method: '" + text + "'");
  }

  auto expect_fields = [&](size_t lo, size_t hi) {
    if (parts.size() < lo || parts.size() > hi) {
      throw Error(ErrorKind::InvalidParameter, "Malformed smoothing spec: '" + text + "'");
    }
  };

  try {
    switch (spec.method) {
      case SmoothingMethod::None:
        expect_fields(1, 1);
        break;
      case SmoothingMethod::MovingAverage:
        expect_fields(2, 2);
        spec.window_size = to_int(parts[1]);
        break;
      case SmoothingMethod::Savgol:
        expect_fields(3, 3);
        spec.window_size = to_int(parts[1]);
        spec.polyorder = to_int(parts[2]);
        break;
      case SmoothingMethod::ButterworthLowpass:
        expect_fields(2, 3);
        spec.cutoff_hz = to_double(parts[1]);
        if (parts.size() == 3) spec.order = to_int(parts[2]);
        break;
    }
  } catch (const Error&) {
    throw;
  } catch (const std::exception& e) {
    throw Error(ErrorKind::InvalidParameter,
                "Malformed smoothing spec '" + text + "': " + e.what());
  }
  return spec;
}

std::string smoothing_spec_to_string(const SmoothingSpec& spec) {
  std::ostringstream oss;
  oss << smoothing_method_name(spec.method);
  switch (spec.method) {
    case SmoothingMethod::MovingAverage:
      oss << ":" << spec.window_size;
      break;
    case SmoothingMethod::Savgol:
      oss << ":" << spec.window_size << ":" << spec.polyorder;
      break;
    case SmoothingMethod::ButterworthLowpass:
      oss << ":" << spec.cutoff_hz << ":" << spec.order;
      break;
    default:
      break;
  }
  return oss.str();
}

SmoothingSpec resolve_smoothing(const std::optional<SmoothingSpec>& local,
                                const SmoothingSpec& pipeline_default) {
  if (local && local->method != SmoothingMethod::None) return *local;
  return pipeline_default;
}

std::vector<double> apply_smoothing(const std::vector<double>& y,
                                    const SmoothingSpec& spec,
                                    double fs_hz) {
  switch (spec.method) {
    case SmoothingMethod::None:
      return y;

    case SmoothingMethod::MovingAverage:
      if (spec.window_size <= 0) {
        throw Error(ErrorKind::InvalidParameter, "moving_average smoothing requires window_size > 0");
      }
      return moving_average(y, static_cast<size_t>(spec.window_size));

    case SmoothingMethod::Savgol: {
      if (spec.window_size <= 0 || spec.polyorder < 0) {
        throw Error(ErrorKind::InvalidParameter,
                    "savgol smoothing requires window_size > 0 and polyorder >= 0");
      }
      int window = spec.window_size;
      if (window % 2 == 0) ++window;
      if (window <= spec.polyorder) {
        throw Error(ErrorKind::InvalidParameter,
                    "savgol requires window_size > polyorder (got window_size=" +
                        std::to_string(window) + ", polyorder=" + std::to_string(spec.polyorder) + ")");
      }
      return savgol(y, static_cast<size_t>(window), spec.polyorder);
    }

    case SmoothingMethod::ButterworthLowpass:
      if (!std::isfinite(fs_hz) || fs_hz <= 0.0) {
        throw Error(ErrorKind::InvalidParameter, "Butterworth smoothing requires a sampling rate");
      }
      if (!(spec.cutoff_hz > 0.0)) {
        throw Error(ErrorKind::InvalidParameter, "Butterworth smoothing requires cutoff_hz > 0");
      }
      return butterworth_lowpass(y, spec.cutoff_hz, fs_hz, spec.order);
  }
  throw Error(ErrorKind::InvalidParameter, "Unknown smoothing method");
}

} // namespace fepsp
