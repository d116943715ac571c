#include "fepsp/params.hpp"

#include "fepsp/errors.hpp"
#include "fepsp/utils.hpp"

#include <vector>

namespace fepsp {

namespace {

const std::string* lookup(const ParamMap& params, const std::string& key) {
  auto it = params.find(key);
  if (it == params.end()) return nullptr;
  return &it->second;
}

Error missing_param(const std::string& key, const std::string& owner) {
  return Error(ErrorKind::MissingParameter, owner + ": missing required parameter '" + key + "'");
}

Error invalid_param(const std::string& key, const std::string& owner, const std::string& why) {
  return Error(ErrorKind::InvalidParameter, owner + ": invalid parameter '" + key + "': " + why);
}

double parse_double_param(const std::string& text, const std::string& key, const std::string& owner) {
  try {
    return to_double(text);
  } catch (const std::exception& e) {
    throw invalid_param(key, owner, e.what());
  }
}

WindowMs parse_window_param(const std::string& text, const std::string& key, const std::string& owner) {
  std::vector<double> v;
  try {
    v = parse_double_list(text);
  } catch (const std::exception& e) {
    throw invalid_param(key, owner, e.what());
  }
  if (v.size() != 2) throw invalid_param(key, owner, "expected START_MS,END_MS");
  WindowMs w;
  w.start_ms = v[0];
  w.end_ms = v[1];
  return w;
}

} // namespace

bool has_param(const ParamMap& params, const std::string& key) {
  return params.find(key) != params.end();
}

double param_double(const ParamMap& params, const std::string& key, const std::string& owner) {
  const std::string* v = lookup(params, key);
  if (!v) throw missing_param(key, owner);
  return parse_double_param(*v, key, owner);
}

int param_int_or(const ParamMap& params, const std::string& key, int def, const std::string& owner) {
  const std::string* v = lookup(params, key);
  if (!v) return def;
  try {
    return to_int(*v);
  } catch (const std::exception& e) {
    throw invalid_param(key, owner, e.what());
  }
}

WindowMs param_window(const ParamMap& params, const std::string& key, const std::string& owner) {
  const std::string* v = lookup(params, key);
  if (!v) throw missing_param(key, owner);
  return parse_window_param(*v, key, owner);
}

WindowMs param_window_or(const ParamMap& params, const std::string& key, const WindowMs& def,
                         const std::string& owner) {
  const std::string* v = lookup(params, key);
  if (!v) return def;
  return parse_window_param(*v, key, owner);
}

std::string param_string_or(const ParamMap& params, const std::string& key, const std::string& def) {
  const std::string* v = lookup(params, key);
  if (!v) return def;
  return trim(*v);
}

} // namespace fepsp
