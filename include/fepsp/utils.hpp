#pragma once

#include <string>
#include <vector>

namespace fepsp {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
// Some acquisition exporters emit a BOM, which breaks header parsing otherwise.
std::string strip_utf8_bom(std::string s);

std::vector<std::string> split(const std::string& s, char delim);

// Split a single CSV row into fields.
//
// Supports the common RFC-4180 behaviors (quoted fields, "" escapes) for
// single-line rows. Returned fields are unquoted.
std::vector<std::string> split_csv_row(const std::string& row, char delim);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Strict numeric parsing helpers.
//
// These trim whitespace and then require that the entire remaining string is
// a valid number, parsed in the classic "C" locale. to_double() also accepts
// nan/inf tokens.
int to_int(const std::string& s);
double to_double(const std::string& s);

// Parse a comma-separated list of numbers, e.g. "25,50,75".
std::vector<double> parse_double_list(const std::string& s);

// Format a double in the classic "C" locale with enough digits to round-trip.
// Non-finite values are written as an empty string.
std::string format_double(double v);

void ensure_directory(const std::string& path);

// Write a text file to disk. Parent directories are created.
// Returns true on success, false on failure.
bool write_text_file(const std::string& path, const std::string& content);

// Minimal JSON string escape (quotes, backslashes, control characters).
std::string json_escape(const std::string& s);

std::string now_string_utc();

} // namespace fepsp
