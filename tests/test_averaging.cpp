#include "test_support.hpp"

#include "fepsp/averaging.hpp"
#include "fepsp/errors.hpp"
#include "fepsp/running_stats.hpp"

#include <cmath>
#include <iostream>
#include <vector>

using namespace fepsp;

static Sweep constant_sweep(double stim, int id, double v, size_t n = 5) {
  Sweep s;
  s.stim_intensity = stim;
  s.sweep_id = id;
  for (size_t i = 0; i < n; ++i) {
    s.time.push_back(static_cast<double>(i) * 1e-4);
    s.voltage.push_back(v);
  }
  return s;
}

int main() {
  {
    RunningStats rs;
    rs.add(1.0);
    rs.add(std::nan(""));
    rs.add(3.0);
    assert(rs.n() == 2);
    assert(std::fabs(rs.mean() - 2.0) < 1e-12);
  }

  SweepTable t;
  t.sweeps.push_back(constant_sweep(20.0, 1, 1.0));
  t.sweeps.push_back(constant_sweep(10.0, 1, -4.0));
  t.sweeps.push_back(constant_sweep(20.0, 2, 2.0));
  t.sweeps.push_back(constant_sweep(20.0, 3, 3.0));

  const AveragedTable avg = average_sweeps(t);
  assert(avg.traces.size() == 2);
  assert(avg.traces[0].stim_intensity == 10.0);
  assert(avg.traces[1].stim_intensity == 20.0);

  const AveragedTrace* tr = avg.find(20.0);
  assert(tr != nullptr);
  assert(tr->n_sweeps == 3);
  for (size_t i = 0; i < tr->time.size(); ++i) {
    assert(std::fabs(tr->mean[i] - 2.0) < 1e-12);
    assert(std::fabs(tr->sem[i] - 1.0 / std::sqrt(3.0)) < 1e-12);
  }

  // A single sweep has an undefined standard error.
  assert(std::isnan(avg.find(10.0)->sem[0]));

  // Mismatched grids inside a group are rejected.
  SweepTable bad = t;
  bad.sweeps.push_back(constant_sweep(20.0, 4, 0.0, 4));
  bool threw = false;
  try {
    (void)average_sweeps(bad);
  } catch (const Error& e) {
    threw = (e.kind() == ErrorKind::DataInconsistency);
  }
  assert(threw);

  std::cout << "test_averaging OK\n";
  return 0;
}
