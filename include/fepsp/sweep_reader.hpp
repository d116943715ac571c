#pragma once

#include "fepsp/types.hpp"

#include <string>
#include <vector>

namespace fepsp {

// One acquired sweep before stimulus metadata is attached.
struct RawSweep {
  std::vector<double> time;     // seconds
  std::vector<double> voltage;  // mV
};

// Attach stimulus metadata to acquisition-ordered sweeps.
//
// Sweep i gets stim_intensity = intensities[i / repetitions] and
// sweep_id = i % repetitions + 1.
//
// Throws Error(ShapeMismatch) unless
// raw_sweeps.size() == intensities.size() * repetitions, or if a sweep's
// time and voltage lengths differ.
// Throws Error(InvalidParameter) for non-finite or repeated intensities and
// Error(DataInconsistency) if a sweep's time is not strictly increasing.
SweepTable build_sweep_table(const std::vector<RawSweep>& raw_sweeps,
                             const std::vector<double>& intensities,
                             int repetitions);

// Read a delimited text recording (comma, semicolon or tab; detected from the
// first data line).
//
// Layout:
//   time,sweep1,sweep2,...
//   0.0000,0.01,0.02,...
//
// - The header row is optional. A first column named time_ms (or ending in
//   "_ms") is interpreted in milliseconds; otherwise seconds.
// - Lines starting with '#' or '//' are ignored.
// - The sampling rate is inferred from the median time step unless
//   fs_hz_override > 0.
//
// Throws std::runtime_error for I/O and parse failures and Error(ShapeMismatch)
// for ragged rows or a sweep count that does not match intensities/repetitions.
RecordingContext read_sweep_file(const std::string& path,
                                 const std::vector<double>& intensities,
                                 int repetitions,
                                 double fs_hz_override = 0.0);

} // namespace fepsp
