#include "cgate/core/severity.h"

#include <stdexcept>

namespace cgate::core {

std::string severity_to_string(Severity s) {
  switch (s) {
    case Severity::kWarning:
      return "WARNING";
    case Severity::kError:
      return "ERROR";
  }
  return "unknown";
}

Severity severity_from_string(const std::string& s) {
  if (s == "WARNING")
    return Severity::kWarning;
  if (s == "ERROR")
    return Severity::kError;
  throw std::invalid_argument("Unknown Severity: " + s);
}

std::string outcome_to_string(Outcome o) {
  switch (o) {
    case Outcome::kPass:
      return "PASS";
    case Outcome::kWarn:
      return "WARN";
    case Outcome::kFail:
      return "FAIL";
  }
  return "unknown";
}

Outcome outcome_from_string(const std::string& s) {
  if (s == "PASS")
    return Outcome::kPass;
  if (s == "WARN")
    return Outcome::kWarn;
  if (s == "FAIL")
    return Outcome::kFail;
  throw std::invalid_argument("Unknown Outcome: " + s);
}

std::string report_severity_to_string(ReportSeverity s) {
  switch (s) {
    case ReportSeverity::kLow:
      return "LOW";
    case ReportSeverity::kMedium:
      return "MEDIUM";
    case ReportSeverity::kHigh:
      return "HIGH";
    case ReportSeverity::kCritical:
      return "CRITICAL";
  }
  return "unknown";
}

ReportSeverity report_severity_from_string(const std::string& s) {
  if (s == "LOW")
    return ReportSeverity::kLow;
  if (s == "MEDIUM")
    return ReportSeverity::kMedium;
  if (s == "HIGH")
    return ReportSeverity::kHigh;
  if (s == "CRITICAL")
    return ReportSeverity::kCritical;
  throw std::invalid_argument("Unknown ReportSeverity: " + s);
}

std::string finding_category_to_string(FindingCategory c) {
  switch (c) {
    case FindingCategory::kStructural:
      return "structural";
    case FindingCategory::kContentRule:
      return "content_rule";
    case FindingCategory::kDistributional:
      return "distributional";
  }
  return "unknown";
}

FindingCategory finding_category_from_string(const std::string& s) {
  if (s == "structural")
    return FindingCategory::kStructural;
  if (s == "content_rule")
    return FindingCategory::kContentRule;
  if (s == "distributional")
    return FindingCategory::kDistributional;
  throw std::invalid_argument("Unknown FindingCategory: " + s);
}

ReportSeverity default_report_severity(Severity s) noexcept {
  return s == Severity::kError ? ReportSeverity::kHigh : ReportSeverity::kMedium;
}

Outcome outcome_for(Severity s) noexcept {
  return s == Severity::kError ? Outcome::kFail : Outcome::kWarn;
}

Outcome worst(Outcome a, Outcome b) noexcept {
  return a < b ? b : a;
}

}  // namespace cgate::core
