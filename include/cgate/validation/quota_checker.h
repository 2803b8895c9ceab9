#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/core/severity.h"
#include "cgate/domain/content_unit.h"
#include "cgate/domain/violation.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cgate::validation {

// QuotaResult is the verdict for one collection.
//
//   count < minimum                  -> FAIL, deficit = minimum - count
//   minimum <= count < target_min    -> WARN
//   target_min <= count <= target_max -> PASS
//   count > target_max               -> WARN (plus a QUOTA-MAX advisory above `maximum`)
//
// A collection size outside every band is a FAIL (QUOTA-NO-BAND).
struct QuotaResult {
  core::Outcome outcome{core::Outcome::kPass};
  std::optional<config::QuotaBand> band;
  std::size_t collection_size{0};  // NOLINT(readability-identifier-naming)
  std::size_t special_count{0};    // NOLINT(readability-identifier-naming)
  std::size_t deficit{0};
  std::vector<domain::Violation> violations;
  std::vector<domain::Advisory> advisories;
};

// check_quota evaluates the special-item count of a collection. `scope` names the
// collection in locations (usually the section id).
[[nodiscard]] QuotaResult check_quota(std::size_t collection_size, std::size_t special_count,
                                      const config::QuotaTable& table,
                                      const std::string& scope = "collection");

// Overload that also checks sub-type diversity: when more than diversity_threshold
// special items are present and all share one sub-type, a QUOTA-DIVERSITY advisory is
// added. The outcome is unaffected.
[[nodiscard]] QuotaResult check_quota(std::size_t collection_size,
                                      const std::vector<std::string>& special_subtypes,
                                      const config::QuotaTable& table,
                                      const std::string& scope = "collection");

// check_units_quota treats every unit with a special_kind as a special item.
[[nodiscard]] QuotaResult check_units_quota(const std::vector<domain::ContentUnit>& units,
                                            const config::QuotaTable& table,
                                            const std::string& scope);

}  // namespace cgate::validation
