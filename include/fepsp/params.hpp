#pragma once

#include "fepsp/types.hpp"

#include <map>
#include <string>

namespace fepsp {

// Component parameters as configured by the caller: key -> textual value.
//
// Windows are written as "START_MS,END_MS". Numbers are parsed in the
// classic "C" locale.
using ParamMap = std::map<std::string, std::string>;

bool has_param(const ParamMap& params, const std::string& key);

// Required parameters throw Error(MissingParameter) when absent. Every getter
// throws Error(InvalidParameter) when the value cannot be parsed.
// owner names the component in error messages.
double param_double(const ParamMap& params, const std::string& key, const std::string& owner);
int param_int_or(const ParamMap& params, const std::string& key, int def, const std::string& owner);
WindowMs param_window(const ParamMap& params, const std::string& key, const std::string& owner);
WindowMs param_window_or(const ParamMap& params, const std::string& key, const WindowMs& def,
                         const std::string& owner);
std::string param_string_or(const ParamMap& params, const std::string& key, const std::string& def);

} // namespace fepsp
