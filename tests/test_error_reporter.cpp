#include "cgate/reporting/error_reporter.h"

#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace cgate;

namespace {

domain::Advisory diversity_advisory() {
  return domain::Advisory{domain::Location{"history", "", std::nullopt}, "QUOTA-DIVERSITY",
                          "history: all 3 special items are of type 'chart'"};
}

}  // namespace

TEST_CASE("Rule ids map to finding categories", "[reporting]") {
  const reporting::ErrorReporter reporter(testing::sample_config().reporting);
  CHECK(reporter.categorize("LIMIT-LINES") == core::FindingCategory::kStructural);
  CHECK(reporter.categorize("QUOTA-MIN") == core::FindingCategory::kDistributional);
  // Unlisted rules fall into the default category.
  CHECK(reporter.categorize("MARKER-MIN") == core::FindingCategory::kContentRule);
}

TEST_CASE("severity_for prefers the most specific matching row", "[reporting]") {
  const reporting::ErrorReporter reporter(testing::sample_config().reporting);

  CHECK(reporter.severity_for(core::FindingCategory::kStructural, "REQ-FIELD", "title",
                              core::Severity::kError) == core::ReportSeverity::kCritical);
  CHECK(reporter.severity_for(core::FindingCategory::kStructural, "LIMIT-LINES", "body",
                              core::Severity::kError) == core::ReportSeverity::kHigh);
  CHECK(reporter.severity_for(core::FindingCategory::kContentRule, "MARKER-MIN", "notes",
                              core::Severity::kWarning) == core::ReportSeverity::kLow);

  SECTION("no row matches") {
    CHECK(reporter.severity_for(core::FindingCategory::kContentRule, "RANGE-WORDS-MAX", "notes",
                                core::Severity::kError) == core::ReportSeverity::kHigh);
    CHECK(reporter.severity_for(core::FindingCategory::kContentRule, "RANGE-WORDS-MAX", "notes",
                                core::Severity::kWarning) == core::ReportSeverity::kMedium);
    CHECK(reporter.severity_for(core::FindingCategory::kContentRule, "RANGE-WORDS-MAX", "notes",
                                std::nullopt) == core::ReportSeverity::kLow);
  }

  SECTION("the field must match when a row names one") {
    CHECK(reporter.severity_for(core::FindingCategory::kContentRule, "MARKER-MIN", "body",
                                core::Severity::kWarning) == core::ReportSeverity::kMedium);
  }
}

TEST_CASE("Findings are grouped into prioritized action items", "[reporting]") {
  const reporting::ErrorReporter reporter(testing::sample_config().reporting);
  const std::vector<domain::Violation> violations{
      testing::violation("LIMIT-LINES", core::Severity::kError, "s1", "body"),
      testing::violation("MARKER-MIN", core::Severity::kWarning, "s1", "notes"),
      testing::violation("LIMIT-LINES", core::Severity::kError, "s3", "body"),
      testing::violation("REQ-FIELD", core::Severity::kError, "s2", "title"),
      testing::violation("LIMIT-LINES", core::Severity::kError, "s1", "body"),
  };

  const auto report = reporter.report(violations, {diversity_advisory()});

  CHECK(report.overall_severity == core::ReportSeverity::kCritical);
  CHECK(report.requires_immediate_action);
  REQUIRE(report.findings.size() == 6);
  CHECK(report.findings.back().advisory);
  CHECK(report.findings.back().severity == core::ReportSeverity::kLow);

  REQUIRE(report.action_items.size() == 4);
  CHECK(report.action_items[0].rule_id == "REQ-FIELD");
  CHECK(report.action_items[0].severity == core::ReportSeverity::kCritical);

  const auto& lines = report.action_items[1];
  CHECK(lines.rule_id == "LIMIT-LINES");
  CHECK(lines.severity == core::ReportSeverity::kHigh);
  CHECK(lines.occurrences == 3);
  REQUIRE(lines.locations.size() == 2);
  CHECK(lines.locations[0].unit_id == "s1");
  CHECK(lines.locations[1].unit_id == "s3");
  CHECK(lines.action == "Split the body across two slides");
  CHECK(lines.checklist.size() == 2);

  // Equal severities keep rule-id order.
  CHECK(report.action_items[2].rule_id == "MARKER-MIN");
  CHECK(report.action_items[2].action == "Resolve MARKER-MIN: s1.notes: MARKER-MIN");
  CHECK(report.action_items[3].rule_id == "QUOTA-DIVERSITY");
  CHECK(report.action_items[3].category == core::FindingCategory::kDistributional);
}

TEST_CASE("Low-severity findings do not require immediate action", "[reporting]") {
  const reporting::ErrorReporter reporter(testing::sample_config().reporting);

  SECTION("empty report") {
    const auto report = reporter.report({}, {});
    CHECK(report.overall_severity == core::ReportSeverity::kLow);
    CHECK_FALSE(report.requires_immediate_action);
    CHECK(report.action_items.empty());
  }
  SECTION("advisory only") {
    const auto report = reporter.report({}, {diversity_advisory()});
    CHECK(report.overall_severity == core::ReportSeverity::kLow);
    CHECK_FALSE(report.requires_immediate_action);
    CHECK(report.action_items.size() == 1);
  }
  SECTION("medium warning") {
    const auto report = reporter.report(
        {testing::violation("RANGE-WORDS-MAX", core::Severity::kWarning, "s1", "notes")}, {});
    CHECK(report.overall_severity == core::ReportSeverity::kMedium);
    CHECK_FALSE(report.requires_immediate_action);
  }
}

TEST_CASE("report_to_json renders locations as strings", "[reporting]") {
  const reporting::ErrorReporter reporter(testing::sample_config().reporting);
  const auto json = reporting::report_to_json(
      reporter.report({testing::violation("LIMIT-LINES", core::Severity::kError, "s7", "body")}, {}));

  CHECK(json.at("overall_severity") == "HIGH");
  CHECK(json.at("requires_immediate_action") == true);
  CHECK(json.at("action_items").at(0).at("locations").at(0) == "s7.body");
  CHECK(json.at("findings").at(0).at("category") == "structural");
}
