#include "fepsp/sweep_reader.hpp"

#include "fepsp/errors.hpp"
#include "fepsp/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fepsp {

namespace {

size_t count_delim_outside_quotes(const std::string& s, char delim) {
  bool in_quotes = false;
  size_t n = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '"') {
      if (in_quotes && (i + 1) < s.size() && s[i + 1] == '"') {
        ++i;
        continue;
      }
      in_quotes = !in_quotes;
      continue;
    }
    if (!in_quotes && c == delim) ++n;
  }
  return n;
}

char detect_delim(const std::string& line) {
  const size_t n_comma = count_delim_outside_quotes(line, ',');
  const size_t n_semi = count_delim_outside_quotes(line, ';');
  const size_t n_tab = count_delim_outside_quotes(line, '\t');

  char best = ',';
  size_t best_n = n_comma;
  if (n_semi > best_n) {
    best = ';';
    best_n = n_semi;
  }
  if (n_tab > best_n) {
    best = '\t';
  }
  return best;
}

bool is_comment_or_empty(const std::string& t) {
  return t.empty() || starts_with(t, "#") || starts_with(t, "//");
}

bool looks_like_header_row(const std::vector<std::string>& cols) {
  // A numeric first row (including nan/inf tokens) is data.
  for (const auto& c : cols) {
    const std::string low = to_lower(trim(c));
    if (low == "nan" || low == "inf" || low == "-inf" || low == "+inf") continue;
    for (unsigned char ch : c) {
      if (std::isalpha(ch) != 0 && ch != 'e' && ch != 'E') return true;
    }
  }
  return false;
}

double median_inplace(std::vector<double>* v) {
  if (!v || v->empty()) return std::numeric_limits<double>::quiet_NaN();
  std::sort(v->begin(), v->end());
  const size_t n = v->size();
  const size_t mid = n / 2;
  if (n % 2 == 1) return (*v)[mid];
  return 0.5 * ((*v)[mid - 1] + (*v)[mid]);
}

} // namespace

SweepTable build_sweep_table(const std::vector<RawSweep>& raw_sweeps,
                             const std::vector<double>& intensities,
                             int repetitions) {
  if (repetitions < 1) {
    throw Error(ErrorKind::InvalidParameter, "build_sweep_table: repetitions must be >= 1");
  }
  const size_t reps = static_cast<size_t>(repetitions);
  if (raw_sweeps.size() != intensities.size() * reps) {
    std::ostringstream oss;
    oss << "build_sweep_table: " << raw_sweeps.size() << " sweeps but "
        << intensities.size() << " intensities x " << repetitions << " repetitions = "
        << intensities.size() * reps;
    throw Error(ErrorKind::ShapeMismatch, oss.str());
  }

  for (size_t k = 0; k < intensities.size(); ++k) {
    if (!std::isfinite(intensities[k])) {
      throw Error(ErrorKind::InvalidParameter,
                  "build_sweep_table: stimulus intensity " + std::to_string(k) + " is not finite");
    }
    for (size_t j = 0; j < k; ++j) {
      if (intensities[j] == intensities[k]) {
        std::ostringstream oss;
        oss << "build_sweep_table: stimulus intensity " << intensities[k]
            << " is listed more than once";
        throw Error(ErrorKind::InvalidParameter, oss.str());
      }
    }
  }

  SweepTable out;
  out.sweeps.reserve(raw_sweeps.size());
  for (size_t i = 0; i < raw_sweeps.size(); ++i) {
    const RawSweep& r = raw_sweeps[i];
    if (r.time.size() != r.voltage.size()) {
      std::ostringstream oss;
      oss << "build_sweep_table: sweep " << i << " has " << r.time.size()
          << " time points but " << r.voltage.size() << " voltage samples";
      throw Error(ErrorKind::ShapeMismatch, oss.str());
    }
    for (size_t j = 0; j < r.time.size(); ++j) {
      if (!std::isfinite(r.time[j]) || (j > 0 && !(r.time[j] > r.time[j - 1]))) {
        std::ostringstream oss;
        oss << "build_sweep_table: sweep " << i << " time must be finite and strictly increasing"
            << " (sample " << j << ")";
        throw Error(ErrorKind::DataInconsistency, oss.str());
      }
    }
    Sweep s;
    s.stim_intensity = intensities[i / reps];
    s.sweep_id = static_cast<int>(i % reps) + 1;
    s.source_index = i;
    s.time = r.time;
    s.voltage = r.voltage;
    out.sweeps.push_back(std::move(s));
  }
  out.sort();
  return out;
}

RecordingContext read_sweep_file(const std::string& path,
                                 const std::vector<double>& intensities,
                                 int repetitions,
                                 double fs_hz_override) {
  std::ifstream f(path);
  if (!f) throw std::runtime_error("Failed to open sweep file: " + path);

  std::string line;
  char delim = 0;
  bool first = true;
  bool time_in_ms = false;
  size_t n_cols = 0;
  size_t line_no = 0;

  std::vector<double> time;
  std::vector<RawSweep> sweeps;

  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (first) line = strip_utf8_bom(line);
    const std::string t = trim(line);
    if (is_comment_or_empty(t)) continue;

    if (delim == 0) delim = detect_delim(t);
    std::vector<std::string> cols = split_csv_row(t, delim);

    if (first) {
      first = false;
      n_cols = cols.size();
      if (n_cols < 2) {
        throw std::runtime_error("read_sweep_file: expected a time column and at least one sweep column: " + path);
      }
      sweeps.resize(n_cols - 1);
      if (looks_like_header_row(cols)) {
        const std::string tcol = to_lower(trim(cols[0]));
        time_in_ms = (tcol == "time_ms" || tcol == "t_ms" || ends_with(tcol, "_ms"));
        continue;
      }
    }

    if (cols.size() != n_cols) {
      std::ostringstream oss;
      oss << "read_sweep_file: line " << line_no << " has " << cols.size()
          << " columns, expected " << n_cols;
      throw Error(ErrorKind::ShapeMismatch, oss.str());
    }

    double tv = 0.0;
    try {
      tv = to_double(cols[0]);
    } catch (const std::exception& e) {
      throw std::runtime_error("read_sweep_file: line " + std::to_string(line_no) + ": " + e.what());
    }
    time.push_back(time_in_ms ? tv / 1000.0 : tv);
    for (size_t c = 1; c < n_cols; ++c) {
      try {
        sweeps[c - 1].voltage.push_back(to_double(cols[c]));
      } catch (const std::exception& e) {
        throw std::runtime_error("read_sweep_file: line " + std::to_string(line_no) + ": " + e.what());
      }
    }
  }

  if (time.empty()) throw std::runtime_error("read_sweep_file: no samples in " + path);
  for (auto& s : sweeps) s.time = time;

  RecordingContext ctx;
  ctx.sweeps = build_sweep_table(sweeps, intensities, repetitions);
  ctx.metadata["source"] = path;

  if (fs_hz_override > 0.0) {
    ctx.fs_hz = fs_hz_override;
  } else {
    std::vector<double> dts;
    dts.reserve(time.size());
    for (size_t i = 1; i < time.size(); ++i) {
      const double dt = time[i] - time[i - 1];
      if (std::isfinite(dt) && dt > 0.0) dts.push_back(dt);
    }
    const double dt = median_inplace(&dts);
    if (!(dt > 0.0)) {
      throw std::runtime_error("read_sweep_file: could not infer sampling rate from time column (use --fs)");
    }
    ctx.fs_hz = 1.0 / dt;
  }
  return ctx;
}

} // namespace fepsp
