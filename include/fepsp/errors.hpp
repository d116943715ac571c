#pragma once

#include <stdexcept>
#include <string>

namespace fepsp {

// Error categories raised by the analysis core.
//
// - MissingParameter:   a required transform/feature parameter is absent (construction time)
// - InvalidParameter:   out-of-range or incompatible numeric settings (point of use)
// - ShapeMismatch:      sweep count does not equal intensities x repetitions (load time)
// - DataInconsistency:  time grids differ between sweeps that must share one
// - MissingDependency:  a feature's upstream result is absent
// - UnknownComponent:   unrecognized transform/feature name (build time)
// - InvalidState:       an operation was requested on data that cannot support it
//
// Per-intensity detection failures (no peak found, empty window) are never
// errors; they are reported as NaN cells in the feature table.
enum class ErrorKind {
  MissingParameter,
  InvalidParameter,
  ShapeMismatch,
  DataInconsistency,
  MissingDependency,
  UnknownComponent,
  InvalidState,
};

inline std::string error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MissingParameter:
      return "missing_parameter";
    case ErrorKind::InvalidParameter:
      return "invalid_parameter";
    case ErrorKind::ShapeMismatch:
      return "shape_mismatch";
    case ErrorKind::DataInconsistency:
      return "data_inconsistency";
    case ErrorKind::MissingDependency:
      return "missing_dependency";
    case ErrorKind::UnknownComponent:
      return "unknown_component";
    case ErrorKind::InvalidState:
      return "invalid_state";
    default:
      return "unknown";
  }
}

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace fepsp
