#include <bpg/geometry.hpp>

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace bpg {

  std::string
  format_coordinate(double value) {
    double rounded = std::round(value);
    // Past long long range the integral path would overflow the cast.
    if (std::fabs(rounded) < 9.2e18 && std::fabs(value - rounded) < 1e-9) {
      std::ostringstream os;
      os << static_cast<long long>(rounded);
      return os.str();
    }
    std::ostringstream os;
    os.precision(10);
    os << value;
    return os.str();
  }

  double
  parse_coordinate(const std::string& text, double fallback) {
    if (text.empty()) { return fallback; }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || !std::isfinite(value)) { return fallback; }
    return value;
  }

} // namespace bpg
