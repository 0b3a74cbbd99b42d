#include "gearopt/util/strings.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace gearopt {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

std::string format_fixed(double v, int decimals) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(std::max(0, decimals)) << v;
  return ss.str();
}

} // namespace gearopt
