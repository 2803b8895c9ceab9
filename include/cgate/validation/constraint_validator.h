#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/domain/content_unit.h"
#include "cgate/domain/violation.h"

#include <vector>

namespace cgate::validation {

// validate checks one ContentUnit against the limits declared for its unit type.
//
// Fields are checked in the order the limits table declares them; within a field the
// order is REQ-FIELD, LIMIT-LINES, LIMIT-CHARS (per line, top to bottom),
// LIMIT-TOTAL-CHARS, RANGE-WORDS-MIN, RANGE-WORDS-MAX, LIMIT-DURATION, MARKER-MIN.
// A field that is absent or blank is only checked for presence.
//
// Limits are inclusive: a value equal to its limit passes. Every violation carries the
// measured value and the limit. REQ-FIELD and UNIT-TYPE are always ERROR; other rules
// take their severity from the limits table.
[[nodiscard]] std::vector<domain::Violation> validate(const domain::ContentUnit& unit,
                                                      const config::LimitsTable& limits);

// validate_all concatenates validate() over units in input order.
[[nodiscard]] std::vector<domain::Violation> validate_all(
    const std::vector<domain::ContentUnit>& units, const config::LimitsTable& limits);

}  // namespace cgate::validation
