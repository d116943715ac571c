#include "fepsp/averaging.hpp"

#include "fepsp/errors.hpp"
#include "fepsp/running_stats.hpp"
#include "fepsp/transforms.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace fepsp {

AveragedTable average_sweeps(const SweepTable& in) {
  AveragedTable out;
  for (const auto& s : in.sweeps) {
    if (!std::isfinite(s.stim_intensity)) {
      throw Error(ErrorKind::InvalidParameter, "average_sweeps: stim_intensity must be finite");
    }
  }
  for (double stim : in.intensities()) {
    const std::vector<size_t> group = in.group_indices(stim);
    const Sweep& first = in.sweeps[group.front()];

    for (size_t gi : group) {
      if (!same_time_grid(in.sweeps[gi].time, first.time)) {
        std::ostringstream oss;
        oss << "average_sweeps: sweep " << in.sweeps[gi].sweep_id << " at stim_intensity=" << stim
            << " does not share the time grid of its group";
        throw Error(ErrorKind::DataInconsistency, oss.str());
      }
    }

    AveragedTrace tr;
    tr.stim_intensity = stim;
    tr.n_sweeps = group.size();
    tr.time = first.time;
    tr.mean.resize(tr.time.size());
    tr.sem.resize(tr.time.size());

    for (size_t i = 0; i < tr.time.size(); ++i) {
      RunningStats rs;
      for (size_t gi : group) rs.add(in.sweeps[gi].voltage[i]);
      tr.mean[i] = rs.mean();
      tr.sem[i] = rs.sem();
    }

    if (!out.traces.empty() && !same_time_grid(tr.time, out.traces.front().time)) {
      std::ostringstream oss;
      oss << "average_sweeps: stim_intensity=" << stim
          << " does not share the time grid of stim_intensity=" << out.traces.front().stim_intensity;
      throw Error(ErrorKind::DataInconsistency, oss.str());
    }

    out.traces.push_back(std::move(tr));
  }
  return out;
}

} // namespace fepsp
