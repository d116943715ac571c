#pragma once

#include <string>

namespace fepsp {

// Project version string as defined by CMake's project(VERSION ...).
//
// CMake defines FEPSP_VERSION_STRING for all targets that link against
// fepsp_core.
#ifndef FEPSP_VERSION_STRING
  #define FEPSP_VERSION_STRING "0.0.0"
#endif

inline std::string version_string() {
  return std::string(FEPSP_VERSION_STRING);
}

inline std::string build_type_string() {
#ifdef NDEBUG
  return "Release";
#else
  return "Debug";
#endif
}

inline std::string compiler_string() {
#if defined(__clang__)
  return std::string("Clang ") + std::to_string(__clang_major__) + "." +
         std::to_string(__clang_minor__);
#elif defined(__GNUC__)
  return std::string("GCC ") + std::to_string(__GNUC__) + "." +
         std::to_string(__GNUC_MINOR__);
#elif defined(_MSC_VER)
  return std::string("MSVC ") + std::to_string(_MSC_VER);
#else
  return "unknown";
#endif
}

} // namespace fepsp
