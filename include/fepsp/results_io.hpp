#pragma once

#include "fepsp/types.hpp"

#include <string>
#include <vector>

namespace fepsp {

// CSV/JSON exports for one analysed recording.
//
// - CSV is comma-delimited; numbers use the classic "C" locale.
// - Missing values (NaN) are written as empty CSV cells and as JSON null.
// - Parent directories are created. I/O failures throw std::runtime_error.

// Escape a string for inclusion in a CSV cell.
std::string csv_escape(const std::string& s);

// Long format: time,voltage,stim_intensity,sweep_id
void write_sweeps_csv(const std::string& path, const SweepTable& sweeps);

// Long format: stim_intensity,n_sweeps,time,mean,sem
void write_averaged_csv(const std::string& path, const AveragedTable& averaged);

void write_feature_csv(const std::string& path, const FeatureTable& table);

// Render the JSON run summary (version, tool, sampling rate, metadata, notes,
// and every feature table as an array of row objects).
std::string results_json(const RecordingContext& ctx, const std::string& tool);

void write_results_json(const std::string& path,
                        const RecordingContext& ctx,
                        const std::string& tool);

} // namespace fepsp
