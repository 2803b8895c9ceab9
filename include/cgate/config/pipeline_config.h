#pragma once

#include "cgate/core/severity.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cgate::config {

// PipelineConfig is the single canonical source of every table-driven value used by
// the classifier, validator, quota checker, quality gate, error reporter and pipeline
// runner. Components receive the sub-structure they need by const reference; no
// component holds a private copy of a limit that also appears here.

// ── Category catalog ─────────────────────────────────────────────────────────

struct CategoryDef {
  std::string category_id;     // NOLINT(readability-identifier-naming)
  std::string label;           // NOLINT(readability-identifier-naming)
  std::size_t min_population{0};  // NOLINT(readability-identifier-naming)
};

// Ordered list of categories. Catalog order is the final deterministic tie-break.
struct CategoryCatalog {
  std::vector<CategoryDef> categories;

  [[nodiscard]] bool contains(const std::string& category_id) const;
  [[nodiscard]] std::optional<std::size_t> index_of(const std::string& category_id) const;
};

// ── Classifier rule data ─────────────────────────────────────────────────────

// CueTable maps a category id to the cue phrases that support it.
using CueTable = std::map<std::string, std::vector<std::string>>;

struct ClassifierSettings {
  // Declared evaluation order of rule ids. Tiers must be non-decreasing and the last
  // rule must be the forced-choice tie-breaker.
  std::vector<std::string> rule_order;  // NOLINT(readability-identifier-naming)

  CueTable subject_routes;   // NOLINT(readability-identifier-naming)
  CueTable technique_cues;   // NOLINT(readability-identifier-naming)
  CueTable period_cues;      // NOLINT(readability-identifier-naming)
  CueTable population_cues;  // NOLINT(readability-identifier-naming)
  CueTable testable_cues;    // NOLINT(readability-identifier-naming)

  // Most foundational category first.
  std::vector<std::string> foundation_order;  // NOLINT(readability-identifier-naming)
  std::string fallback_category;              // NOLINT(readability-identifier-naming)

  // Phrases that introduce a definition, e.g. "is defined as". The words before the
  // first occurrence form the defined term.
  std::vector<std::string> definition_markers;  // NOLINT(readability-identifier-naming)

  double xref_min_share{0.0};  // NOLINT(readability-identifier-naming)
  std::size_t xref_limit{0};   // NOLINT(readability-identifier-naming)
};

// ── Limits table ─────────────────────────────────────────────────────────────

struct MarkerRequirement {
  std::string token;        // NOLINT(readability-identifier-naming)
  std::size_t min_count{0};  // NOLINT(readability-identifier-naming)
};

// Limits for one named field. Absent optionals mean "not checked".
struct FieldLimits {
  std::string field;                                // NOLINT(readability-identifier-naming)
  bool required{false};                             // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> max_lines;             // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> max_chars_per_line;    // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> max_total_chars;       // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> min_words;             // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> max_words;             // NOLINT(readability-identifier-naming)
  std::optional<double> max_duration_seconds;       // NOLINT(readability-identifier-naming)
  std::vector<MarkerRequirement> markers;           // NOLINT(readability-identifier-naming)
};

struct UnitLimits {
  std::string unit_type;            // NOLINT(readability-identifier-naming)
  std::vector<FieldLimits> fields;  // NOLINT(readability-identifier-naming)
};

struct LimitsTable {
  std::vector<UnitLimits> unit_types;  // NOLINT(readability-identifier-naming)
  double speaking_rate_wpm{0.0};       // NOLINT(readability-identifier-naming)
  // Severity per validator rule id. REQ-FIELD is always ERROR and cannot be overridden.
  std::map<std::string, core::Severity> rule_severities;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] const UnitLimits* find(const std::string& unit_type) const;
  // Configured severity for rule_id; ERROR when the rule is not listed.
  [[nodiscard]] core::Severity severity_for(const std::string& rule_id) const;
};

// ── Quota table ──────────────────────────────────────────────────────────────

// Band of collection sizes [size_min, size_max] and its special-item requirements.
struct QuotaBand {
  std::size_t size_min{0};    // NOLINT(readability-identifier-naming)
  std::size_t size_max{0};    // NOLINT(readability-identifier-naming)
  std::size_t minimum{0};     // NOLINT(readability-identifier-naming)
  std::size_t target_min{0};  // NOLINT(readability-identifier-naming)
  std::size_t target_max{0};  // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> maximum;  // NOLINT(readability-identifier-naming)
};

struct QuotaTable {
  std::vector<QuotaBand> bands;  // NOLINT(readability-identifier-naming)
  // Diversity advisory fires when more than this many special items share one sub-type.
  std::size_t diversity_threshold{0};  // NOLINT(readability-identifier-naming)

  [[nodiscard]] const QuotaBand* find(std::size_t collection_size) const;
};

// ── Quality gate ─────────────────────────────────────────────────────────────

struct DimensionDef {
  std::string dimension_id;           // NOLINT(readability-identifier-naming)
  double weight{0.0};                 // NOLINT(readability-identifier-naming)
  std::optional<double> floor;        // NOLINT(readability-identifier-naming)
  std::vector<std::string> rule_ids;  // NOLINT(readability-identifier-naming)
};

enum class AutoFailKind {
  kRulePresent,        // any violation with rule_id
  kRuleCountExceeds,   // more than max_count violations with rule_id
  kDimensionBelowFloor,  // dimension raw score below its configured floor
};

struct AutoFailCondition {
  std::string condition_id;  // NOLINT(readability-identifier-naming)
  AutoFailKind kind{AutoFailKind::kRulePresent};
  std::string rule_id;       // NOLINT(readability-identifier-naming)
  std::size_t max_count{0};  // NOLINT(readability-identifier-naming)
  std::string dimension_id;  // NOLINT(readability-identifier-naming)
  std::string description;   // NOLINT(readability-identifier-naming)
};

struct GateDefinition {
  std::string gate_id;                     // NOLINT(readability-identifier-naming)
  std::vector<DimensionDef> dimensions;    // NOLINT(readability-identifier-naming)
  // Dimension that receives violations whose rule id no dimension lists.
  std::string unassigned_dimension;        // NOLINT(readability-identifier-naming)
  double pass_threshold{0.0};              // NOLINT(readability-identifier-naming)
  double warn_threshold{0.0};              // NOLINT(readability-identifier-naming)
  double dimension_pass_threshold{0.0};    // NOLINT(readability-identifier-naming)
  double dimension_warn_threshold{0.0};    // NOLINT(readability-identifier-naming)
  std::map<std::string, double> penalties;  // NOLINT(readability-identifier-naming)
  double default_penalty{0.0};             // NOLINT(readability-identifier-naming)
  std::vector<AutoFailCondition> auto_fail;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] double penalty_for(const std::string& rule_id) const;
};

// ── Error reporting ──────────────────────────────────────────────────────────

// One row of the report-severity lookup table. "*" matches any value.
struct SeverityRule {
  std::string category;  // NOLINT(readability-identifier-naming)
  std::string rule_id;   // NOLINT(readability-identifier-naming)
  std::string field;     // NOLINT(readability-identifier-naming)
  core::ReportSeverity severity{core::ReportSeverity::kMedium};
};

struct RemediationGuide {
  std::string action;                  // NOLINT(readability-identifier-naming)
  std::vector<std::string> checklist;  // NOLINT(readability-identifier-naming)
};

struct ReportingConfig {
  std::map<std::string, core::FindingCategory> rule_categories;  // NOLINT(readability-identifier-naming)
  core::FindingCategory default_category{core::FindingCategory::kContentRule};
  std::vector<SeverityRule> severity_rules;                // NOLINT(readability-identifier-naming)
  std::map<std::string, RemediationGuide> remediation;     // NOLINT(readability-identifier-naming)
};

// ── Pipeline execution ───────────────────────────────────────────────────────

struct RetryPolicy {
  std::size_t max_iterations{1};        // NOLINT(readability-identifier-naming)
  bool stop_on_no_improvement{true};    // NOLINT(readability-identifier-naming)
  std::chrono::milliseconds io_backoff{0};  // NOLINT(readability-identifier-naming)
};

struct PipelineSettings {
  std::size_t worker_count{1};  // NOLINT(readability-identifier-naming)
  RetryPolicy retry;            // NOLINT(readability-identifier-naming)
  bool checkpoint_after_section{true};  // NOLINT(readability-identifier-naming)
};

struct PipelineConfig {
  std::string config_id;          // NOLINT(readability-identifier-naming)
  CategoryCatalog catalog;        // NOLINT(readability-identifier-naming)
  ClassifierSettings classifier;  // NOLINT(readability-identifier-naming)
  LimitsTable limits;             // NOLINT(readability-identifier-naming)
  QuotaTable quotas;              // NOLINT(readability-identifier-naming)
  GateDefinition gate;            // NOLINT(readability-identifier-naming)
  ReportingConfig reporting;      // NOLINT(readability-identifier-naming)
  PipelineSettings pipeline;      // NOLINT(readability-identifier-naming)
};

// validate_pipeline_config checks cross-field invariants and throws
// std::invalid_argument naming the first offending value:
// - 4..6 categories with unique ids; fallback and foundation ids in the catalog
// - rule_order non-empty without duplicates (rule ids are resolved by the classifier)
// - quota bands non-overlapping and contiguous, minimum <= target_min <= target_max
// - gate weights sum to 1.0, warn_threshold <= pass_threshold, dimensions unique
// - auto-fail conditions reference known dimensions
void validate_pipeline_config(const PipelineConfig& config);

}  // namespace cgate::config
