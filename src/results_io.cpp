#include "fepsp/results_io.hpp"

#include "fepsp/utils.hpp"
#include "fepsp/version.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace fepsp {

namespace {

void write_or_throw(const std::string& path, const std::string& content) {
  if (!write_text_file(path, content)) {
    throw std::runtime_error("Failed to write file: " + path);
  }
}

std::string json_number(double v) {
  if (!std::isfinite(v)) return "null";
  return format_double(v);
}

} // namespace

std::string csv_escape(const std::string& s) {
  bool need_quotes = false;
  for (char c : s) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') {
      need_quotes = true;
      break;
    }
  }
  if (!need_quotes) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void write_sweeps_csv(const std::string& path, const SweepTable& sweeps) {
  std::ostringstream out;
  out << "time,voltage,stim_intensity,sweep_id\n";
  for (const RawSample& r : sweeps.rows()) {
    out << format_double(r.time) << "," << format_double(r.voltage) << ","
        << format_double(r.stim_intensity) << "," << r.sweep_id << "\n";
  }
  write_or_throw(path, out.str());
}

void write_averaged_csv(const std::string& path, const AveragedTable& averaged) {
  std::ostringstream out;
  out << "stim_intensity,n_sweeps,time,mean,sem\n";
  for (const auto& tr : averaged.traces) {
    const std::string stim = format_double(tr.stim_intensity);
    for (size_t i = 0; i < tr.time.size(); ++i) {
      out << stim << "," << tr.n_sweeps << "," << format_double(tr.time[i]) << ","
          << format_double(tr.mean[i]) << "," << format_double(tr.sem[i]) << "\n";
    }
  }
  write_or_throw(path, out.str());
}

void write_feature_csv(const std::string& path, const FeatureTable& table) {
  std::ostringstream out;
  for (size_t c = 0; c < table.columns.size(); ++c) {
    if (c) out << ",";
    out << csv_escape(table.columns[c]);
  }
  out << "\n";
  for (const auto& row : table.rows) {
    for (size_t c = 0; c < row.size(); ++c) {
      if (c) out << ",";
      out << format_double(row[c]);
    }
    out << "\n";
  }
  write_or_throw(path, out.str());
}

std::string results_json(const RecordingContext& ctx, const std::string& tool) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"Tool\": \"" << json_escape(tool) << "\",\n";
  out << "  \"FepspVersion\": \"" << json_escape(version_string()) << "\",\n";
  out << "  \"BuildType\": \"" << json_escape(build_type_string()) << "\",\n";
  out << "  \"Compiler\": \"" << json_escape(compiler_string()) << "\",\n";
  out << "  \"TimestampUTC\": \"" << json_escape(now_string_utc()) << "\",\n";
  out << "  \"SamplingFrequencyHz\": " << json_number(ctx.fs_hz) << ",\n";
  out << "  \"SweepCount\": " << ctx.sweeps.n_sweeps() << ",\n";

  out << "  \"Metadata\": {";
  size_t k = 0;
  for (const auto& kv : ctx.metadata) {
    out << (k++ ? ",\n" : "\n") << "    \"" << json_escape(kv.first) << "\": \""
        << json_escape(kv.second) << "\"";
  }
  out << (k ? "\n  " : "") << "},\n";

  out << "  \"Notes\": [";
  for (size_t i = 0; i < ctx.notes.size(); ++i) {
    out << (i ? ",\n" : "\n") << "    \"" << json_escape(ctx.notes[i]) << "\"";
  }
  out << (ctx.notes.empty() ? "" : "\n  ") << "],\n";

  out << "  \"Results\": {";
  k = 0;
  for (const auto& kv : ctx.results) {
    const FeatureTable& t = kv.second;
    out << (k++ ? ",\n" : "\n") << "    \"" << json_escape(kv.first) << "\": [";
    for (size_t r = 0; r < t.rows.size(); ++r) {
      out << (r ? ",\n" : "\n") << "      {";
      const auto& row = t.rows[r];
      for (size_t c = 0; c < t.columns.size() && c < row.size(); ++c) {
        if (c) out << ", ";
        out << "\"" << json_escape(t.columns[c]) << "\": " << json_number(row[c]);
      }
      out << "}";
    }
    out << (t.rows.empty() ? "" : "\n    ") << "]";
  }
  out << (k ? "\n  " : "") << "}\n";
  out << "}\n";
  return out.str();
}

void write_results_json(const std::string& path,
                        const RecordingContext& ctx,
                        const std::string& tool) {
  write_or_throw(path, results_json(ctx, tool));
}

} // namespace fepsp
