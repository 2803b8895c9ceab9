#include "cgate/validation/quota_checker.h"

#include "cgate/validation/rule_ids.h"

#include <algorithm>

namespace cgate::validation {

namespace {

domain::Violation quota_violation(std::string_view rule_id, core::Severity severity,
                                  const std::string& scope, std::string message,
                                  std::size_t measured, std::size_t limit) {
  domain::Violation v{};
  v.location = domain::Location{scope, "", std::nullopt};
  v.rule_id = std::string(rule_id);
  v.severity = severity;
  v.message = std::move(message);
  v.measurement =
      domain::Measurement{static_cast<double>(measured), static_cast<double>(limit)};
  return v;
}

std::string band_label(const config::QuotaBand& band) {
  return std::to_string(band.size_min) + "-" + std::to_string(band.size_max);
}

}  // namespace

QuotaResult check_quota(std::size_t collection_size, std::size_t special_count,
                        const config::QuotaTable& table, const std::string& scope) {
  QuotaResult result{};
  result.collection_size = collection_size;
  result.special_count = special_count;

  const auto* band = table.find(collection_size);
  if (band == nullptr) {
    result.outcome = core::Outcome::kFail;
    domain::Violation v{};
    v.location = domain::Location{scope, "", std::nullopt};
    v.rule_id = std::string(kQuotaNoBand);
    v.severity = core::Severity::kError;
    v.message = scope + ": no quota band covers a collection of " +
                std::to_string(collection_size) + " items";
    result.violations.push_back(std::move(v));
    return result;
  }
  result.band = *band;

  const std::string prefix = scope + ": " + std::to_string(special_count) +
                             " special items in " + std::to_string(collection_size) +
                             " (band " + band_label(*band) + ")";

  if (special_count < band->minimum) {
    result.outcome = core::Outcome::kFail;
    result.deficit = band->minimum - special_count;
    result.violations.push_back(quota_violation(
        kQuotaMin, core::Severity::kError, scope,
        prefix + " is below minimum of " + std::to_string(band->minimum) + ", deficit " +
            std::to_string(result.deficit),
        special_count, band->minimum));
  } else if (special_count < band->target_min) {
    result.outcome = core::Outcome::kWarn;
    result.violations.push_back(quota_violation(
        kQuotaTarget, core::Severity::kWarning, scope,
        prefix + " is below target range " + std::to_string(band->target_min) + "-" +
            std::to_string(band->target_max),
        special_count, band->target_min));
  } else if (special_count > band->target_max) {
    result.outcome = core::Outcome::kWarn;
    result.violations.push_back(quota_violation(
        kQuotaTarget, core::Severity::kWarning, scope,
        prefix + " is above target range " + std::to_string(band->target_min) + "-" +
            std::to_string(band->target_max),
        special_count, band->target_max));
  }

  if (band->maximum.has_value() && special_count > *band->maximum) {
    result.advisories.push_back(domain::Advisory{
        domain::Location{scope, "", std::nullopt}, std::string(kQuotaMax),
        prefix + " exceeds band maximum of " + std::to_string(*band->maximum)});
  }

  return result;
}

QuotaResult check_quota(std::size_t collection_size,
                        const std::vector<std::string>& special_subtypes,
                        const config::QuotaTable& table, const std::string& scope) {
  auto result = check_quota(collection_size, special_subtypes.size(), table, scope);

  if (special_subtypes.size() > table.diversity_threshold && !special_subtypes.empty()) {
    const auto& first = special_subtypes.front();
    const bool uniform =
        std::all_of(special_subtypes.begin(), special_subtypes.end(),
                    [&](const std::string& s) { return s == first; });
    if (uniform) {
      result.advisories.push_back(domain::Advisory{
          domain::Location{scope, "", std::nullopt}, std::string(kQuotaDiversity),
          scope + ": all " + std::to_string(special_subtypes.size()) +
              " special items are of type '" + first + "'"});
    }
  }
  return result;
}

QuotaResult check_units_quota(const std::vector<domain::ContentUnit>& units,
                              const config::QuotaTable& table, const std::string& scope) {
  std::vector<std::string> subtypes;
  for (const auto& unit : units) {
    if (unit.special_kind.has_value()) {
      subtypes.push_back(*unit.special_kind);
    }
  }
  return check_quota(units.size(), subtypes, table, scope);
}

}  // namespace cgate::validation
