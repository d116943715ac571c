#include "test_support.hpp"

#include "fepsp/errors.hpp"
#include "fepsp/transforms.hpp"

#include <cmath>
#include <iostream>
#include <vector>

using namespace fepsp;

static const double kFs = 10000.0;

static Sweep make_sweep(double stim, int id, size_t n, double offset, double slope) {
  Sweep s;
  s.stim_intensity = stim;
  s.sweep_id = id;
  for (size_t i = 0; i < n; ++i) {
    s.time.push_back(static_cast<double>(i) / kFs);
    s.voltage.push_back(offset + slope * static_cast<double>(i));
  }
  return s;
}

static WindowMs window(double lo, double hi) {
  WindowMs w;
  w.start_ms = lo;
  w.end_ms = hi;
  return w;
}

template <typename F>
static bool throws_kind(F&& f, ErrorKind kind) {
  try {
    f();
  } catch (const Error& e) {
    return e.kind() == kind;
  }
  return false;
}

static void test_baseline() {
  SweepTable t;
  t.sweeps.push_back(make_sweep(1.0, 1, 100, 0.3, 0.0));
  t.sweeps.push_back(make_sweep(1.0, 2, 100, -0.2, 0.01));

  const SweepTable out = baseline_correction(t, window(0.0, 0.5));
  assert(std::fabs(out.sweeps[0].voltage[50]) < 1e-12);
  // Mean of samples 0..4 of the ramp is -0.2 + 0.02.
  assert(std::fabs(out.sweeps[1].voltage[0] - (-0.02)) < 1e-12);
  // Input is untouched.
  assert(t.sweeps[0].voltage[0] == 0.3);

  assert(throws_kind([&]() { baseline_correction(t, window(50.0, 60.0)); }, ErrorKind::InvalidParameter));
  assert(throws_kind([&]() { baseline_correction(t, window(2.0, 1.0)); }, ErrorKind::InvalidParameter));
}

static void test_crop() {
  SweepTable t;
  t.sweeps.push_back(make_sweep(1.0, 1, 100, 0.0, 1.0));

  // Cropping from the origin re-zeroes time at the first kept sample.
  const SweepTable from_zero = crop_stim_artifact(t, window(0.0, 1.0));
  assert(from_zero.sweeps[0].n_samples() == 90);
  assert(from_zero.sweeps[0].time[0] == 0.0);
  assert(from_zero.sweeps[0].voltage[0] == 10.0);

  // A window away from the origin is idempotent.
  const SweepTable once = crop_stim_artifact(t, window(1.0, 2.0));
  const SweepTable twice = crop_stim_artifact(once, window(1.0, 2.0));
  assert(once.sweeps[0].n_samples() == 90);
  assert(once.sweeps[0].time == twice.sweeps[0].time);
  assert(once.sweeps[0].voltage == twice.sweeps[0].voltage);
  assert(once.sweeps[0].voltage[10] == 20.0);

  assert(throws_kind([&]() { crop_stim_artifact(t, window(0.0, 100.0)); }, ErrorKind::InvalidParameter));
}

static void test_template_subtract() {
  // Identical artifacts in the window are removed exactly.
  SweepTable t;
  for (int id = 1; id <= 3; ++id) {
    Sweep s = make_sweep(2.0, id, 50, 0.0, 0.0);
    for (size_t i = 0; i < 10; ++i) s.voltage[i] = 1.0 - 0.1 * static_cast<double>(i);
    s.voltage[30] = 0.5;
    t.sweeps.push_back(s);
  }
  std::vector<double> skipped;
  const SweepTable out = template_subtract_stim_artifact(t, window(0.0, 1.0), &skipped);
  assert(skipped.empty());
  for (const auto& s : out.sweeps) {
    for (size_t i = 0; i < 10; ++i) assert(std::fabs(s.voltage[i]) < 1e-12);
    assert(s.voltage[30] == 0.5);
  }

  // Zero template energy: the group is left unchanged and reported.
  SweepTable flat;
  flat.sweeps.push_back(make_sweep(5.0, 1, 50, 0.0, 0.0));
  flat.sweeps.push_back(make_sweep(5.0, 2, 50, 0.0, 0.0));
  flat.sweeps[0].voltage[40] = 3.0;
  skipped.clear();
  const SweepTable same = template_subtract_stim_artifact(flat, window(0.0, 1.0), &skipped);
  assert(skipped.size() == 1 && skipped[0] == 5.0);
  assert(same.sweeps[0].voltage == flat.sweeps[0].voltage);

  // Sweeps of one intensity must share a time grid.
  SweepTable ragged;
  ragged.sweeps.push_back(make_sweep(1.0, 1, 50, 0.0, 0.0));
  ragged.sweeps.push_back(make_sweep(1.0, 2, 40, 0.0, 0.0));
  assert(throws_kind([&]() { template_subtract_stim_artifact(ragged, window(0.0, 1.0)); },
                     ErrorKind::DataInconsistency));

  SweepTable unlabeled;
  unlabeled.sweeps.push_back(make_sweep(std::nan(""), 1, 50, 0.0, 0.0));
  assert(throws_kind([&]() { template_subtract_stim_artifact(unlabeled, window(0.0, 1.0)); },
                     ErrorKind::InvalidParameter));
}

int main() {
  test_baseline();
  test_crop();
  test_template_subtract();
  std::cout << "test_transforms OK\n";
  return 0;
}
