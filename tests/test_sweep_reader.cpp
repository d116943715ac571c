#include "test_support.hpp"

#include "fepsp/errors.hpp"
#include "fepsp/sweep_reader.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace fepsp;

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

int main() {
  // 1) Seconds-based time column; fs inferred; four sweeps = 2 intensities x 2 reps.
  const std::string path1 = "tmp_sweeps_seconds.csv";
  {
    std::ofstream out(path1);
    out << "# exported by acquisition software\n";
    out << "time,s1,s2,s3,s4\n";
    out << "0.0000,1.0,2.0,3.0,4.0\n";
    out << "0.0001,1.1,2.1,3.1,4.1\n";
    out << "0.0002,1.2,2.2,3.2,4.2\n";
  }
  {
    const RecordingContext ctx = read_sweep_file(path1, {25.0, 50.0}, 2);
    assert(approx(ctx.fs_hz, 10000.0, 1e-6));
    assert(ctx.sweeps.n_sweeps() == 4);
    assert(ctx.sweeps.sweeps[0].stim_intensity == 25.0);
    assert(ctx.sweeps.sweeps[1].sweep_id == 2);
    assert(ctx.sweeps.sweeps[2].stim_intensity == 50.0);
    assert(approx(ctx.sweeps.sweeps[3].voltage[2], 4.2));
    assert(approx(ctx.sweeps.sweeps[3].time[1], 0.0001));
    assert(ctx.metadata.at("source") == path1);
  }

  // Sweep count must match intensities x repetitions.
  {
    bool threw = false;
    try {
      (void)read_sweep_file(path1, {25.0, 50.0}, 3);
    } catch (const Error& e) {
      threw = (e.kind() == ErrorKind::ShapeMismatch);
    }
    assert(threw);
  }
  std::remove(path1.c_str());

  // 2) Semicolon-delimited, millisecond time column, fs override.
  const std::string path2 = "tmp_sweeps_ms.csv";
  {
    std::ofstream out(path2);
    out << "time_ms;a;b\n";
    out << "0.0;0.5;0.6\n";
    out << "0.1;0.4;0.7\n";
  }
  {
    const RecordingContext ctx = read_sweep_file(path2, {1.0}, 2);
    assert(approx(ctx.sweeps.sweeps[0].time[1], 0.0001));
    assert(approx(ctx.fs_hz, 10000.0, 1e-6));

    const RecordingContext forced = read_sweep_file(path2, {1.0}, 2, 20000.0);
    assert(forced.fs_hz == 20000.0);
  }
  std::remove(path2.c_str());

  // 3) Headerless tab-delimited data; ragged rows are rejected.
  const std::string path3 = "tmp_sweeps_ragged.tsv";
  {
    std::ofstream out(path3);
    out << "0.0\t1.0\t2.0\n";
    out << "0.0001\t1.0\n";
  }
  {
    bool threw = false;
    try {
      (void)read_sweep_file(path3, {1.0, 2.0}, 1);
    } catch (const Error& e) {
      threw = (e.kind() == ErrorKind::ShapeMismatch);
    }
    assert(threw);
  }
  std::remove(path3.c_str());

  // 4) Missing file.
  {
    bool threw = false;
    try {
      (void)read_sweep_file("does_not_exist_fepsp.csv", {1.0}, 1);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "test_sweep_reader OK\n";
  return 0;
}
