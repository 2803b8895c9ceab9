#include "cgate/reporting/error_reporter.h"

#include "cgate/domain/domain_json.h"

#include <algorithm>
#include <map>

namespace cgate::reporting {

namespace {

constexpr const char* kWildcard = "*";

bool matches(const std::string& pattern, const std::string& value) {
  return pattern == kWildcard || pattern == value;
}

int specificity(const config::SeverityRule& rule) {
  return (rule.category != kWildcard ? 1 : 0) + (rule.rule_id != kWildcard ? 1 : 0) +
         (rule.field != kWildcard ? 1 : 0);
}

}  // namespace

ErrorReporter::ErrorReporter(config::ReportingConfig config) : config_(std::move(config)) {}

core::FindingCategory ErrorReporter::categorize(const std::string& rule_id) const {
  const auto it = config_.rule_categories.find(rule_id);
  return it != config_.rule_categories.end() ? it->second : config_.default_category;
}

core::ReportSeverity ErrorReporter::severity_for(core::FindingCategory category,
                                                 const std::string& rule_id,
                                                 const std::string& field,
                                                 std::optional<core::Severity> original) const {
  const std::string category_name = core::finding_category_to_string(category);
  const config::SeverityRule* best = nullptr;
  int best_specificity = -1;
  for (const auto& row : config_.severity_rules) {
    if (!matches(row.category, category_name) || !matches(row.rule_id, rule_id) ||
        !matches(row.field, field)) {
      continue;
    }
    const int s = specificity(row);
    if (s > best_specificity) {
      best_specificity = s;
      best = &row;
    }
  }
  if (best != nullptr) {
    return best->severity;
  }
  return original.has_value() ? core::default_report_severity(*original)
                              : core::ReportSeverity::kLow;
}

Report ErrorReporter::report(const std::vector<domain::Violation>& violations,
                             const std::vector<domain::Advisory>& advisories) const {
  Report report{};

  for (const auto& v : violations) {
    const auto category = categorize(v.rule_id);
    report.findings.push_back(ReportFinding{v.location, v.rule_id, category,
                                            severity_for(category, v.rule_id, v.location.field, v.severity),
                                            v.message, false});
  }
  for (const auto& a : advisories) {
    const auto category = categorize(a.rule_id);
    report.findings.push_back(ReportFinding{a.location, a.rule_id, category,
                                            severity_for(category, a.rule_id, a.location.field, std::nullopt),
                                            a.message, true});
  }

  std::map<std::string, ActionItem> grouped;
  for (const auto& f : report.findings) {
    auto [it, inserted] = grouped.try_emplace(f.rule_id);
    auto& item = it->second;
    if (inserted) {
      item.rule_id = f.rule_id;
      item.category = f.category;
      item.severity = f.severity;
      const auto guide = config_.remediation.find(f.rule_id);
      if (guide != config_.remediation.end()) {
        item.action = guide->second.action;
        item.checklist = guide->second.checklist;
      } else {
        item.action = "Resolve " + f.rule_id + ": " + f.message;
      }
    }
    item.severity = std::max(item.severity, f.severity);
    ++item.occurrences;
    if (std::find(item.locations.begin(), item.locations.end(), f.location) ==
        item.locations.end()) {
      item.locations.push_back(f.location);
    }
    report.overall_severity = std::max(report.overall_severity, f.severity);
  }

  for (auto& [rule_id, item] : grouped) {
    report.action_items.push_back(std::move(item));
  }
  std::stable_sort(report.action_items.begin(), report.action_items.end(),
                   [](const ActionItem& a, const ActionItem& b) { return a.severity > b.severity; });

  report.requires_immediate_action = report.overall_severity >= core::ReportSeverity::kHigh;
  return report;
}

nlohmann::json report_to_json(const Report& report) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : report.action_items) {
    nlohmann::json locations = nlohmann::json::array();
    for (const auto& loc : item.locations) {
      locations.push_back(loc.to_string());
    }
    items.push_back({{"rule_id", item.rule_id},
                     {"category", core::finding_category_to_string(item.category)},
                     {"severity", core::report_severity_to_string(item.severity)},
                     {"action", item.action},
                     {"locations", locations},
                     {"checklist", item.checklist},
                     {"occurrences", item.occurrences}});
  }
  nlohmann::json findings = nlohmann::json::array();
  for (const auto& f : report.findings) {
    findings.push_back({{"location", domain::location_to_json(f.location)},
                        {"rule_id", f.rule_id},
                        {"category", core::finding_category_to_string(f.category)},
                        {"severity", core::report_severity_to_string(f.severity)},
                        {"message", f.message},
                        {"advisory", f.advisory}});
  }
  return nlohmann::json{{"overall_severity", core::report_severity_to_string(report.overall_severity)},
                        {"requires_immediate_action", report.requires_immediate_action},
                        {"action_items", items},
                        {"findings", findings}};
}

}  // namespace cgate::reporting
