#pragma once

#include "cgate/core/severity.h"

#include <cstddef>
#include <optional>
#include <string>

namespace cgate::domain {

// Location identifies where a finding applies: a unit, optionally a field of that unit,
// optionally a 1-based line within the field. Collection-level findings (quotas) use
// the section name as unit_id and leave field empty.
struct Location {
  std::string unit_id;
  std::string field;
  std::optional<std::size_t> line;

  [[nodiscard]] std::string to_string() const;
  bool operator==(const Location&) const = default;
};

// Measurement is the measured value and the configured limit it was checked against.
struct Measurement {
  double measured{0.0};
  double limit{0.0};

  bool operator==(const Measurement&) const = default;
};

// Violation is the structured result of a failed check.
struct Violation {
  Location location;
  std::string rule_id;
  core::Severity severity{core::Severity::kError};
  std::string message;
  std::optional<Measurement> measurement;

  bool operator==(const Violation&) const = default;
};

// Advisory is a non-blocking observation (e.g. low sub-type diversity).
struct Advisory {
  Location location;
  std::string rule_id;
  std::string message;

  bool operator==(const Advisory&) const = default;
};

// format_quantity renders integral values without a decimal point ("9", not "9.000000")
// and other values with one decimal place.
[[nodiscard]] std::string format_quantity(double value);

}  // namespace cgate::domain
