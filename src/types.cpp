#include "fepsp/types.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace fepsp {

std::vector<double> SweepTable::intensities() const {
  std::vector<double> out;
  for (const auto& s : sweeps) out.push_back(s.stim_intensity);
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

std::vector<size_t> SweepTable::group_indices(double stim_intensity) const {
  std::vector<size_t> out;
  for (size_t i = 0; i < sweeps.size(); ++i) {
    if (sweeps[i].stim_intensity == stim_intensity) out.push_back(i);
  }
  return out;
}

std::vector<RawSample> SweepTable::rows() const {
  SweepTable sorted = *this;
  sorted.sort();

  std::vector<RawSample> out;
  for (const auto& s : sorted.sweeps) {
    for (size_t i = 0; i < s.n_samples(); ++i) {
      RawSample r;
      r.time = s.time[i];
      r.voltage = s.voltage[i];
      r.stim_intensity = s.stim_intensity;
      r.sweep_id = s.sweep_id;
      out.push_back(r);
    }
  }
  return out;
}

void SweepTable::sort() {
  std::stable_sort(sweeps.begin(), sweeps.end(), [](const Sweep& a, const Sweep& b) {
    if (a.stim_intensity != b.stim_intensity) return a.stim_intensity < b.stim_intensity;
    return a.sweep_id < b.sweep_id;
  });
}

const AveragedTrace* AveragedTable::find(double stim_intensity) const {
  for (const auto& t : traces) {
    if (t.stim_intensity == stim_intensity) return &t;
  }
  return nullptr;
}

size_t FeatureTable::column_index(const std::string& name) const {
  for (size_t i = 0; i < columns.size(); ++i) {
    if (columns[i] == name) return i;
  }
  return columns.size();
}

const std::vector<double>* FeatureTable::find_row(double stim_intensity) const {
  for (const auto& r : rows) {
    if (!r.empty() && r[0] == stim_intensity) return &r;
  }
  return nullptr;
}

double FeatureTable::value(const std::vector<double>& row, const std::string& column) const {
  const size_t c = column_index(column);
  if (c >= columns.size() || c >= row.size()) return std::numeric_limits<double>::quiet_NaN();
  return row[c];
}

void RecordingContext::add_result(const std::string& feature_name, FeatureTable table) {
  results[feature_name] = std::move(table);
}

const FeatureTable* RecordingContext::find_result(const std::string& feature_name) const {
  auto it = results.find(feature_name);
  if (it == results.end()) return nullptr;
  return &it->second;
}

} // namespace fepsp
