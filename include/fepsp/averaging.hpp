#pragma once

#include "fepsp/types.hpp"

namespace fepsp {

// Collapse the sweeps of each stimulus intensity into one mean trace.
//
// For every (stim_intensity, time) point:
//   mean = average voltage over the sweeps
//   sem  = sample standard deviation (n-1) / sqrt(n), NaN when n == 1
//
// Traces are sorted by stim_intensity. Throws Error(DataInconsistency) if the
// sweeps of one intensity, or the traces of different intensities, do not
// share one time grid.
AveragedTable average_sweeps(const SweepTable& in);

} // namespace fepsp
