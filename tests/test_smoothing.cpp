#include "test_support.hpp"

#include "fepsp/errors.hpp"
#include "fepsp/smoothing.hpp"

#include <cmath>
#include <iostream>
#include <optional>
#include <vector>

using namespace fepsp;

template <typename F>
static bool throws_kind(F&& f, ErrorKind kind) {
  try {
    f();
  } catch (const Error& e) {
    return e.kind() == kind;
  }
  return false;
}

static void test_parse() {
  SmoothingMethod m;
  assert(parse_smoothing_method("Savitzky_Golay", &m) && m == SmoothingMethod::Savgol);
  assert(parse_smoothing_method("ma", &m) && m == SmoothingMethod::MovingAverage);
  assert(!parse_smoothing_method("gaussian", &m));

  const SmoothingSpec sg = parse_smoothing_spec("savgol:11:3");
  assert(sg.method == SmoothingMethod::Savgol);
  assert(sg.window_size == 11);
  assert(sg.polyorder == 3);
  assert(smoothing_spec_to_string(sg) == "savgol:11:3");

  const SmoothingSpec bw = parse_smoothing_spec("butterworth_lowpass:800");
  assert(bw.method == SmoothingMethod::ButterworthLowpass);
  assert(bw.cutoff_hz == 800.0);
  assert(bw.order == 3);

  assert(parse_smoothing_spec("none").method == SmoothingMethod::None);
  assert(throws_kind([]() { parse_smoothing_spec("gaussian:3"); }, ErrorKind::InvalidParameter));
  assert(throws_kind([]() { parse_smoothing_spec("moving_average"); }, ErrorKind::InvalidParameter));
  assert(throws_kind([]() { parse_smoothing_spec("savgol:11:x"); }, ErrorKind::InvalidParameter));
}

static void test_resolution() {
  SmoothingSpec def;
  def.method = SmoothingMethod::MovingAverage;
  def.window_size = 5;

  SmoothingSpec local;
  local.method = SmoothingMethod::Savgol;
  local.window_size = 7;
  local.polyorder = 2;

  assert(resolve_smoothing(local, def).method == SmoothingMethod::Savgol);
  assert(resolve_smoothing(std::nullopt, def).method == SmoothingMethod::MovingAverage);

  // A local "none" does not disable the default.
  SmoothingSpec none;
  assert(resolve_smoothing(none, def).method == SmoothingMethod::MovingAverage);
}

static void test_apply() {
  std::vector<double> y;
  for (int i = 0; i < 40; ++i) y.push_back(std::sin(0.2 * static_cast<double>(i)));

  SmoothingSpec none;
  assert(apply_smoothing(y, none, 0.0) == y);

  // Even savgol windows are bumped to the next odd size.
  SmoothingSpec sg;
  sg.method = SmoothingMethod::Savgol;
  sg.window_size = 6;
  sg.polyorder = 2;
  assert(apply_smoothing(y, sg, 0.0).size() == y.size());

  sg.window_size = 2;
  sg.polyorder = 3;
  assert(throws_kind([&]() { apply_smoothing(y, sg, 0.0); }, ErrorKind::InvalidParameter));

  SmoothingSpec bw;
  bw.method = SmoothingMethod::ButterworthLowpass;
  bw.cutoff_hz = 100.0;
  assert(throws_kind([&]() { apply_smoothing(y, bw, 0.0); }, ErrorKind::InvalidParameter));
  assert(apply_smoothing(y, bw, 1000.0).size() == y.size());

  SmoothingSpec ma;
  ma.method = SmoothingMethod::MovingAverage;
  ma.window_size = 0;
  assert(throws_kind([&]() { apply_smoothing(y, ma, 0.0); }, ErrorKind::InvalidParameter));
}

int main() {
  test_parse();
  test_resolution();
  test_apply();
  std::cout << "test_smoothing OK\n";
  return 0;
}
