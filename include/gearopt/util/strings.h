#pragma once

#include <string>
#include <vector>

namespace gearopt {

std::string to_lower(std::string s);

// Joins parts with `sep` ("a; b; c").
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Fixed-point formatting used by reports ("12.35" for (12.3456, 2)).
std::string format_fixed(double v, int decimals);

} // namespace gearopt
