#pragma once

#include <string>

namespace cgate::core {

// One severity vocabulary shared by every component.
//
// Severity: per-finding severity emitted by the constraint validator and quota checker.
//   kError blocks acceptance; kWarning is advisory.
// Outcome: tri-state verdict of the quota checker, the quality gate and gate dimensions.
// ReportSeverity: final, prioritized severity assigned by the error reporter.
//
// All enumerators are declared in ascending order so that std::max and operator<
// express "more severe".

enum class Severity {
  kWarning,
  kError,
};

enum class Outcome {
  kPass,
  kWarn,
  kFail,
};

enum class ReportSeverity {
  kLow,
  kMedium,
  kHigh,
  kCritical,
};

// FindingCategory groups findings for reporting.
enum class FindingCategory {
  kStructural,      // structure and format: sizes, required fields, unit types
  kContentRule,     // content rules: word ranges, marker tokens, delivery duration
  kDistributional,  // collection-level distribution: quotas, diversity
};

// String conversion helpers. The *_from_string variants throw std::invalid_argument
// for unknown values. Strings are upper-case ("ERROR", "PASS", "CRITICAL").
[[nodiscard]] std::string severity_to_string(Severity s);
[[nodiscard]] Severity severity_from_string(const std::string& s);

[[nodiscard]] std::string outcome_to_string(Outcome o);
[[nodiscard]] Outcome outcome_from_string(const std::string& s);

[[nodiscard]] std::string report_severity_to_string(ReportSeverity s);
[[nodiscard]] ReportSeverity report_severity_from_string(const std::string& s);

[[nodiscard]] std::string finding_category_to_string(FindingCategory c);
[[nodiscard]] FindingCategory finding_category_from_string(const std::string& s);

// Default mapping used when no explicit report severity is configured:
// ERROR -> HIGH, WARNING -> MEDIUM.
[[nodiscard]] ReportSeverity default_report_severity(Severity s) noexcept;

// Outcome of a finding with the given severity: ERROR -> FAIL, WARNING -> WARN.
[[nodiscard]] Outcome outcome_for(Severity s) noexcept;

// Outcomes combine by taking the worst.
[[nodiscard]] Outcome worst(Outcome a, Outcome b) noexcept;

}  // namespace cgate::core
