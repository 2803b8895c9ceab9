#pragma once

#include "cgate/config/pipeline_config.h"
#include "cgate/domain/content_unit.h"
#include "cgate/domain/violation.h"

#include <string>
#include <vector>

// Shared builders for a small, fully specified pipeline configuration.
// Four categories with a minimum population of 5, slide limits, three quota bands and
// a three-dimension gate. Tests mutate the returned copy where they need a variation.

namespace cgate::testing {

inline config::PipelineConfig sample_config() {
  config::PipelineConfig c;
  c.config_id = "test-config";

  c.catalog.categories = {{"fundamentals", "Fundamentals", 5},
                          {"methods", "Methods", 5},
                          {"history", "History", 5},
                          {"populations", "Populations", 5}};

  auto& cls = c.classifier;
  cls.rule_order = {"PRI-001", "SEC-001", "SEC-002", "SEC-003", "TIE-001", "TIE-002", "TIE-003"};
  cls.subject_routes = {{"fundamentals", {"concept", "theory", "variable"}},
                        {"methods", {"method", "sampling", "measurement"}},
                        {"history", {"history", "century"}},
                        {"populations", {"cohort", "participants"}}};
  cls.technique_cues = {{"methods", {"randomized"}}, {"populations", {"sample size"}}};
  cls.period_cues = {{"history", {"originally", "was first"}}};
  cls.population_cues = {{"populations", {"children", "older adults"}}};
  cls.testable_cues = {{"fundamentals", {"is defined as"}},
                       {"methods", {"calculate"}},
                       {"history", {"introduced by"}},
                       {"populations", {"prevalence"}}};
  cls.foundation_order = {"fundamentals", "methods", "populations", "history"};
  cls.fallback_category = "fundamentals";
  cls.definition_markers = {"is defined as", "refers to"};
  cls.xref_min_share = 0.3;
  cls.xref_limit = 2;

  config::UnitLimits slide;
  slide.unit_type = "slide";
  config::FieldLimits title;
  title.field = "title";
  title.required = true;
  title.max_lines = 2;
  title.max_chars_per_line = 32;
  config::FieldLimits body;
  body.field = "body";
  body.required = true;
  body.max_lines = 8;
  body.max_chars_per_line = 66;
  config::FieldLimits notes;
  notes.field = "notes";
  notes.min_words = 3;
  notes.max_words = 40;
  notes.max_duration_seconds = 10.0;
  notes.markers = {{"[PAUSE]", 1}};
  slide.fields = {title, body, notes};
  c.limits.unit_types = {slide};
  c.limits.speaking_rate_wpm = 150.0;
  c.limits.rule_severities = {{"RANGE-WORDS-MIN", core::Severity::kWarning},
                              {"MARKER-MIN", core::Severity::kWarning}};

  c.quotas.bands = {{1, 11, 1, 2, 4, 5}, {12, 15, 2, 3, 4, 6}, {16, 20, 3, 4, 5, 8}};
  c.quotas.diversity_threshold = 2;

  auto& gate = c.gate;
  gate.gate_id = "slides";
  gate.dimensions = {
      {"structure", 0.4, 50.0,
       {"UNIT-TYPE", "REQ-FIELD", "LIMIT-LINES", "LIMIT-CHARS", "LIMIT-TOTAL-CHARS"}},
      {"delivery", 0.3, std::nullopt,
       {"RANGE-WORDS-MIN", "RANGE-WORDS-MAX", "LIMIT-DURATION", "MARKER-MIN"}},
      {"distribution", 0.3, std::nullopt,
       {"QUOTA-NO-BAND", "QUOTA-MIN", "QUOTA-TARGET"}},
  };
  gate.unassigned_dimension = "structure";
  gate.pass_threshold = 90.0;
  gate.warn_threshold = 80.0;
  gate.dimension_pass_threshold = 80.0;
  gate.dimension_warn_threshold = 60.0;
  gate.penalties = {{"REQ-FIELD", 25.0}, {"LIMIT-LINES", 10.0}, {"LIMIT-CHARS", 5.0},
                    {"QUOTA-MIN", 20.0}, {"QUOTA-TARGET", 10.0}};
  gate.default_penalty = 5.0;
  gate.auto_fail = {
      {"AF-REQ", config::AutoFailKind::kRulePresent, "REQ-FIELD", 0, "",
       "A required field is missing"},
      {"AF-CHARS", config::AutoFailKind::kRuleCountExceeds, "LIMIT-CHARS", 3, "",
       "Too many over-long lines"},
      {"AF-QUOTA", config::AutoFailKind::kRulePresent, "QUOTA-MIN", 0, "",
       "Special-item minimum not met"},
      {"AF-STRUCT", config::AutoFailKind::kDimensionBelowFloor, "", 0, "structure",
       "Structure below floor"},
  };

  auto& rep = c.reporting;
  rep.default_category = core::FindingCategory::kContentRule;
  rep.rule_categories = {{"UNIT-TYPE", core::FindingCategory::kStructural},
                         {"REQ-FIELD", core::FindingCategory::kStructural},
                         {"LIMIT-LINES", core::FindingCategory::kStructural},
                         {"LIMIT-CHARS", core::FindingCategory::kStructural},
                         {"LIMIT-TOTAL-CHARS", core::FindingCategory::kStructural},
                         {"QUOTA-MIN", core::FindingCategory::kDistributional},
                         {"QUOTA-TARGET", core::FindingCategory::kDistributional},
                         {"QUOTA-DIVERSITY", core::FindingCategory::kDistributional}};
  rep.severity_rules = {
      {"structural", "*", "*", core::ReportSeverity::kHigh},
      {"structural", "REQ-FIELD", "*", core::ReportSeverity::kCritical},
      {"content_rule", "MARKER-MIN", "notes", core::ReportSeverity::kLow},
      {"distributional", "QUOTA-DIVERSITY", "*", core::ReportSeverity::kLow},
  };
  rep.remediation = {{"LIMIT-LINES",
                      {"Split the body across two slides",
                       {"Move supporting points to the notes", "Keep one idea per line"}}}};

  c.pipeline.worker_count = 2;
  c.pipeline.checkpoint_after_section = true;
  c.pipeline.retry.max_iterations = 3;
  c.pipeline.retry.stop_on_no_improvement = true;

  return c;
}

// A slide that passes every limit of sample_config().
inline domain::ContentUnit good_slide(const std::string& unit_id,
                                      const std::string& category_id = "fundamentals") {
  return domain::ContentUnit{unit_id,
                             category_id,
                             "slide",
                             {{"title", "Sampling basics"},
                              {"body", "Random samples\nStratified samples\nCluster samples"},
                              {"notes", "Walk through each design in turn [PAUSE] then ask."}},
                             std::nullopt};
}

inline domain::ContentUnit visual_slide(const std::string& unit_id, const std::string& kind,
                                        const std::string& category_id = "fundamentals") {
  auto unit = good_slide(unit_id, category_id);
  unit.special_kind = kind;
  return unit;
}

inline std::string numbered_lines(std::size_t count) {
  std::string text;
  for (std::size_t i = 1; i <= count; ++i) {
    if (!text.empty()) {
      text += '\n';
    }
    text += "Point " + std::to_string(i);
  }
  return text;
}

inline domain::Violation violation(const std::string& rule_id,
                                   core::Severity severity = core::Severity::kError,
                                   const std::string& unit_id = "s1",
                                   const std::string& field = "body") {
  domain::Violation v{};
  v.location = domain::Location{unit_id, field, std::nullopt};
  v.rule_id = rule_id;
  v.severity = severity;
  v.message = unit_id + "." + field + ": " + rule_id;
  return v;
}

}  // namespace cgate::testing
