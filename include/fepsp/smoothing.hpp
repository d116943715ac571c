#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fepsp {

enum class SmoothingMethod {
  None,
  MovingAverage,
  Savgol,
  ButterworthLowpass,
};

std::string smoothing_method_name(SmoothingMethod method);

// Accepts: none, moving_average (ma), savgol (savitzky_golay),
// butterworth_lowpass (butter_lowpass, butter). Case-insensitive.
bool parse_smoothing_method(const std::string& s, SmoothingMethod* out_method);

// Smoothing configuration for one feature, or the pipeline-wide default.
//
// Unset numeric fields are 0 (window_size, cutoff_hz) or -1 (polyorder).
struct SmoothingSpec {
  SmoothingMethod method{SmoothingMethod::None};
  int window_size{0};     // moving_average, savgol
  int polyorder{-1};      // savgol
  double cutoff_hz{0.0};  // butterworth_lowpass
  int order{3};           // butterworth_lowpass
};

// Parse the textual form:
//   none
//   moving_average:W
//   savgol:W:P
//   butterworth_lowpass:CUTOFF_HZ[:ORDER]
//
// Throws Error(InvalidParameter) for unknown methods or malformed numbers.
SmoothingSpec parse_smoothing_spec(const std::string& text);

// Inverse of parse_smoothing_spec().
std::string smoothing_spec_to_string(const SmoothingSpec& spec);

// The component's own spec wins only if it is present and its method is not
// none; otherwise the pipeline-wide default applies.
SmoothingSpec resolve_smoothing(const std::optional<SmoothingSpec>& local,
                                const SmoothingSpec& pipeline_default);

// Apply spec to a 1-D trace.
//
// - none: returns y unchanged
// - savgol: an even window is incremented to the next odd value first
// - butterworth_lowpass: fs_hz is required
//
// Throws Error(InvalidParameter) when the spec cannot be applied.
std::vector<double> apply_smoothing(const std::vector<double>& y,
                                    const SmoothingSpec& spec,
                                    double fs_hz);

} // namespace fepsp
