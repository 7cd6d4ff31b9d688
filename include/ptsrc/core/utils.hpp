#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ptsrc::core {

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// Math utilities
double median_of(std::vector<double>& v);
int nint(double v);

// Angles
double rewind(double angle, double ref = 0.0);
double angular_distance(const SkyPos& a, const SkyPos& b);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::vector<std::string> split_whitespace(const std::string& str);
std::optional<double> parse_double(const std::string& s);

} // namespace ptsrc::core
