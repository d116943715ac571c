#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace fepsp {

// Time window in milliseconds, relative to the sweep's time origin.
// Converted to sample indices only through time_to_index().
struct WindowMs {
  double start_ms{0.0};
  double end_ms{0.0};

  double start_sec() const { return start_ms / 1000.0; }
  double end_sec() const { return end_ms / 1000.0; }
};

// One (time, voltage) observation, used when flattening a SweepTable.
struct RawSample {
  double time{0.0};      // seconds
  double voltage{0.0};   // mV
  double stim_intensity{0.0};
  int sweep_id{0};       // 1..repetitions within one stim_intensity
};

// One stimulus-response trace.
//
// time is strictly increasing. After crop_stim_artifact() the first sample is
// at exactly t = 0.
struct Sweep {
  double stim_intensity{0.0};
  int sweep_id{0};
  size_t source_index{0};  // position of the sweep in the acquisition file
  std::vector<double> time;
  std::vector<double> voltage;

  size_t n_samples() const { return time.size(); }
};

// Sweeps ordered by (stim_intensity, sweep_id).
struct SweepTable {
  std::vector<Sweep> sweeps;

  size_t n_sweeps() const { return sweeps.size(); }
  bool empty() const { return sweeps.empty(); }

  // Distinct intensities in ascending order.
  std::vector<double> intensities() const;

  // Indices into sweeps[] for every sweep recorded at stim_intensity.
  std::vector<size_t> group_indices(double stim_intensity) const;

  // Flattened (stim_intensity, sweep_id, time)-ordered rows.
  std::vector<RawSample> rows() const;

  // Restore the (stim_intensity, sweep_id) ordering.
  void sort();
};

// Across-sweep mean and standard error of one stimulus intensity.
struct AveragedTrace {
  double stim_intensity{0.0};
  size_t n_sweeps{0};
  std::vector<double> time;
  std::vector<double> mean;
  std::vector<double> sem;
};

// One trace per intensity, sorted by intensity. All traces share one time grid.
struct AveragedTable {
  std::vector<AveragedTrace> traces;

  bool empty() const { return traces.empty(); }
  const AveragedTrace* find(double stim_intensity) const;
};

// Per-intensity feature measurements.
//
// columns[0] is always "stim_intensity". Missing detections are NaN.
struct FeatureTable {
  std::vector<std::string> columns;
  std::vector<std::vector<double>> rows;

  bool empty() const { return rows.empty(); }

  // Returns columns.size() if the column does not exist.
  size_t column_index(const std::string& name) const;

  // Returns nullptr when no row has this stim_intensity.
  const std::vector<double>* find_row(double stim_intensity) const;

  // NaN if the column does not exist.
  double value(const std::vector<double>& row, const std::string& column) const;
};

// Everything associated with one recording for the duration of a run.
struct RecordingContext {
  SweepTable sweeps;
  AveragedTable averaged;
  double fs_hz{0.0};
  std::map<std::string, std::string> metadata;
  std::map<std::string, FeatureTable> results;

  // Non-fatal conditions noticed by a stage (e.g. a skipped template group).
  std::vector<std::string> notes;

  void add_result(const std::string& feature_name, FeatureTable table);
  const FeatureTable* find_result(const std::string& feature_name) const;
};

} // namespace fepsp
