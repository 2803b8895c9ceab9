#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/core/severity.h"
#include "cgate/domain/violation.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cgate::reporting {

// ReportFinding is a violation or advisory after categorization and severity lookup.
struct ReportFinding {
  domain::Location location;
  std::string rule_id;  // NOLINT(readability-identifier-naming)
  core::FindingCategory category{core::FindingCategory::kContentRule};
  core::ReportSeverity severity{core::ReportSeverity::kLow};
  std::string message;
  bool advisory{false};
};

// ActionItem groups every finding of one rule id into a single fix.
struct ActionItem {
  std::string rule_id;  // NOLINT(readability-identifier-naming)
  core::FindingCategory category{core::FindingCategory::kContentRule};
  core::ReportSeverity severity{core::ReportSeverity::kLow};  // worst grouped finding
  std::string action;
  std::vector<domain::Location> locations;  // first-seen order, no duplicates
  std::vector<std::string> checklist;
  std::size_t occurrences{0};
};

// Report is the prioritized output handed back to generation.
// overall_severity is LOW for an empty report.
struct Report {
  core::ReportSeverity overall_severity{core::ReportSeverity::kLow};  // NOLINT(readability-identifier-naming)
  bool requires_immediate_action{false};  // NOLINT(readability-identifier-naming)
  std::vector<ActionItem> action_items;   // severity descending, then rule id
  std::vector<ReportFinding> findings;    // violations then advisories, input order
};

class ErrorReporter {
 public:
  explicit ErrorReporter(config::ReportingConfig config);

  [[nodiscard]] Report report(const std::vector<domain::Violation>& violations,
                              const std::vector<domain::Advisory>& advisories) const;

  [[nodiscard]] core::FindingCategory categorize(const std::string& rule_id) const;

  // severity_for consults the lookup table keyed by (category, rule id, field). The most
  // specific matching row wins ("*" is least specific); among equally specific rows the
  // first declared wins. Without a match: ERROR -> HIGH, WARNING -> MEDIUM, and
  // advisories (original == nullopt) -> LOW.
  [[nodiscard]] core::ReportSeverity severity_for(core::FindingCategory category,
                                                  const std::string& rule_id,
                                                  const std::string& field,
                                                  std::optional<core::Severity> original) const;

 private:
  config::ReportingConfig config_;
};

[[nodiscard]] nlohmann::json report_to_json(const Report& report);

}  // namespace cgate::reporting
