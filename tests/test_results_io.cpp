#include "test_support.hpp"

#include "fepsp/results_io.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

using namespace fepsp;

static std::string read_all(const std::string& path) {
  std::ifstream f(path);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

int main() {
  const double nan = std::numeric_limits<double>::quiet_NaN();

  assert(csv_escape("plain") == "plain");
  assert(csv_escape("a,b") == "\"a,b\"");
  assert(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");

  const std::string dir = "tmp_results_io";

  FeatureTable t;
  t.columns = {"stim_intensity", "fv_amp"};
  t.rows.push_back({1.0, 0.5});
  t.rows.push_back({2.0, nan});

  write_feature_csv(dir + "/fiber_volley.csv", t);
  assert(read_all(dir + "/fiber_volley.csv") == "stim_intensity,fv_amp\n1,0.5\n2,\n");

  SweepTable sweeps;
  Sweep s;
  s.stim_intensity = 3.0;
  s.sweep_id = 1;
  s.time = {0.0, 0.5};
  s.voltage = {-1.0, 2.0};
  sweeps.sweeps.push_back(s);
  write_sweeps_csv(dir + "/sweeps.csv", sweeps);
  assert(read_all(dir + "/sweeps.csv") == "time,voltage,stim_intensity,sweep_id\n0,-1,3,1\n0.5,2,3,1\n");

  AveragedTable avg;
  AveragedTrace tr;
  tr.stim_intensity = 3.0;
  tr.n_sweeps = 1;
  tr.time = {0.0};
  tr.mean = {1.5};
  tr.sem = {nan};
  avg.traces.push_back(tr);
  write_averaged_csv(dir + "/averaged.csv", avg);
  assert(read_all(dir + "/averaged.csv") == "stim_intensity,n_sweeps,time,mean,sem\n3,1,0,1.5,\n");

  RecordingContext ctx;
  ctx.fs_hz = 10000.0;
  ctx.metadata["source"] = "rec \"A\".csv";
  ctx.notes.push_back("skipped feature pop_spike");
  ctx.add_result("fiber_volley", t);
  write_results_json(dir + "/results.json", ctx, "fepsp_analyze_cli");
  const std::string json = read_all(dir + "/results.json");
  assert(json.find("\"SamplingFrequencyHz\": 10000") != std::string::npos);
  assert(json.find("\"source\": \"rec \\\"A\\\".csv\"") != std::string::npos);
  assert(json.find("{\"stim_intensity\": 2, \"fv_amp\": null}") != std::string::npos);
  assert(json.find("\"skipped feature pop_spike\"") != std::string::npos);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  std::cout << "test_results_io OK\n";
  return 0;
}
