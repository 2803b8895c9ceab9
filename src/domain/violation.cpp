#include "cgate/domain/violation.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace cgate::domain {

std::string Location::to_string() const {
  std::string out = unit_id;
  if (!field.empty()) {
    out += "." + field;
  }
  if (line.has_value()) {
    out += ":" + std::to_string(line.value());
  }
  return out;
}

std::string format_quantity(double value) {
  if (std::floor(value) == value && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value;
  return oss.str();
}

}  // namespace cgate::domain
