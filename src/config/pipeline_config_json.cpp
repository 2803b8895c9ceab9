#include "cgate/config/config_loader.h"

#include <stdexcept>

namespace cgate::config {

namespace {

using json = nlohmann::json;

template <typename T>
std::optional<T> optional_value(const json& j, const char* key) {
  if (j.contains(key) && !j.at(key).is_null()) {
    return j.at(key).get<T>();
  }
  return std::nullopt;
}

std::string auto_fail_kind_to_string(AutoFailKind kind) {
  switch (kind) {
    case AutoFailKind::kRulePresent:
      return "rule_present";
    case AutoFailKind::kRuleCountExceeds:
      return "rule_count_exceeds";
    case AutoFailKind::kDimensionBelowFloor:
      return "dimension_below_floor";
  }
  return "unknown";
}

AutoFailKind auto_fail_kind_from_string(const std::string& s) {
  if (s == "rule_present")
    return AutoFailKind::kRulePresent;
  if (s == "rule_count_exceeds")
    return AutoFailKind::kRuleCountExceeds;
  if (s == "dimension_below_floor")
    return AutoFailKind::kDimensionBelowFloor;
  throw std::invalid_argument("Unknown AutoFailKind: " + s);
}

CueTable cue_table_from_json(const json& j, const char* key) {
  if (!j.contains(key)) {
    return {};
  }
  return j.at(key).get<CueTable>();
}

FieldLimits field_limits_from_json(const json& j) {
  FieldLimits f;
  f.field = j.at("field").get<std::string>();
  f.required = j.value("required", false);
  f.max_lines = optional_value<std::size_t>(j, "max_lines");
  f.max_chars_per_line = optional_value<std::size_t>(j, "max_chars_per_line");
  f.max_total_chars = optional_value<std::size_t>(j, "max_total_chars");
  f.min_words = optional_value<std::size_t>(j, "min_words");
  f.max_words = optional_value<std::size_t>(j, "max_words");
  f.max_duration_seconds = optional_value<double>(j, "max_duration_seconds");
  if (j.contains("markers")) {
    for (const auto& m : j.at("markers")) {
      f.markers.push_back({m.at("token").get<std::string>(), m.at("min_count").get<std::size_t>()});
    }
  }
  return f;
}

json field_limits_to_json(const FieldLimits& f) {
  json j;
  j["field"] = f.field;
  j["required"] = f.required;
  if (f.max_lines.has_value())
    j["max_lines"] = f.max_lines.value();
  if (f.max_chars_per_line.has_value())
    j["max_chars_per_line"] = f.max_chars_per_line.value();
  if (f.max_total_chars.has_value())
    j["max_total_chars"] = f.max_total_chars.value();
  if (f.min_words.has_value())
    j["min_words"] = f.min_words.value();
  if (f.max_words.has_value())
    j["max_words"] = f.max_words.value();
  if (f.max_duration_seconds.has_value())
    j["max_duration_seconds"] = f.max_duration_seconds.value();
  j["markers"] = json::array();
  for (const auto& m : f.markers) {
    j["markers"].push_back({{"min_count", m.min_count}, {"token", m.token}});
  }
  return j;
}

LimitsTable limits_from_json(const json& j) {
  LimitsTable limits;
  limits.speaking_rate_wpm = j.value("speaking_rate_wpm", 0.0);
  if (j.contains("rule_severities")) {
    for (const auto& [rule_id, sev] : j.at("rule_severities").items()) {
      limits.rule_severities[rule_id] = core::severity_from_string(sev.get<std::string>());
    }
  }
  for (const auto& u : j.at("unit_types")) {
    UnitLimits unit;
    unit.unit_type = u.at("unit_type").get<std::string>();
    for (const auto& f : u.at("fields")) {
      unit.fields.push_back(field_limits_from_json(f));
    }
    limits.unit_types.push_back(std::move(unit));
  }
  return limits;
}

QuotaTable quotas_from_json(const json& j) {
  QuotaTable quotas;
  quotas.diversity_threshold = j.at("diversity_threshold").get<std::size_t>();
  for (const auto& b : j.at("bands")) {
    QuotaBand band;
    band.size_min = b.at("size_min").get<std::size_t>();
    band.size_max = b.at("size_max").get<std::size_t>();
    band.minimum = b.at("minimum").get<std::size_t>();
    band.target_min = b.at("target_min").get<std::size_t>();
    band.target_max = b.at("target_max").get<std::size_t>();
    band.maximum = optional_value<std::size_t>(b, "maximum");
    quotas.bands.push_back(band);
  }
  return quotas;
}

GateDefinition gate_from_json(const json& j) {
  GateDefinition gate;
  gate.gate_id = j.at("gate_id").get<std::string>();
  gate.pass_threshold = j.at("pass_threshold").get<double>();
  gate.warn_threshold = j.at("warn_threshold").get<double>();
  gate.dimension_pass_threshold = j.at("dimension_pass_threshold").get<double>();
  gate.dimension_warn_threshold = j.at("dimension_warn_threshold").get<double>();
  gate.default_penalty = j.at("default_penalty").get<double>();
  gate.unassigned_dimension = j.at("unassigned_dimension").get<std::string>();
  if (j.contains("penalties")) {
    gate.penalties = j.at("penalties").get<std::map<std::string, double>>();
  }
  for (const auto& d : j.at("dimensions")) {
    DimensionDef dim;
    dim.dimension_id = d.at("id").get<std::string>();
    dim.weight = d.at("weight").get<double>();
    dim.floor = optional_value<double>(d, "floor");
    dim.rule_ids = d.value("rules", std::vector<std::string>{});
    gate.dimensions.push_back(std::move(dim));
  }
  if (j.contains("auto_fail")) {
    for (const auto& a : j.at("auto_fail")) {
      AutoFailCondition cond;
      cond.condition_id = a.at("id").get<std::string>();
      cond.kind = auto_fail_kind_from_string(a.at("kind").get<std::string>());
      cond.rule_id = a.value("rule_id", "");
      cond.max_count = a.value("max_count", std::size_t{0});
      cond.dimension_id = a.value("dimension", "");
      cond.description = a.at("description").get<std::string>();
      gate.auto_fail.push_back(std::move(cond));
    }
  }
  return gate;
}

ReportingConfig reporting_from_json(const json& j) {
  ReportingConfig reporting;
  reporting.default_category =
      core::finding_category_from_string(j.at("default_category").get<std::string>());
  if (j.contains("rule_categories")) {
    for (const auto& [rule_id, cat] : j.at("rule_categories").items()) {
      reporting.rule_categories[rule_id] =
          core::finding_category_from_string(cat.get<std::string>());
    }
  }
  if (j.contains("severity_rules")) {
    for (const auto& r : j.at("severity_rules")) {
      SeverityRule rule;
      rule.category = r.value("category", "*");
      rule.rule_id = r.value("rule_id", "*");
      rule.field = r.value("field", "*");
      rule.severity = core::report_severity_from_string(r.at("severity").get<std::string>());
      if (rule.category != "*") {
        // Validates the category name; throws std::invalid_argument when unknown.
        static_cast<void>(core::finding_category_from_string(rule.category));
      }
      reporting.severity_rules.push_back(std::move(rule));
    }
  }
  if (j.contains("remediation")) {
    for (const auto& [rule_id, guide] : j.at("remediation").items()) {
      reporting.remediation[rule_id] = {guide.at("action").get<std::string>(),
                                        guide.value("checklist", std::vector<std::string>{})};
    }
  }
  return reporting;
}

}  // namespace

PipelineConfig pipeline_config_from_json(const json& j) {
  PipelineConfig config;
  config.config_id = j.at("config_id").get<std::string>();

  for (const auto& c : j.at("categories")) {
    config.catalog.categories.push_back({c.at("id").get<std::string>(),
                                         c.at("label").get<std::string>(),
                                         c.at("min_population").get<std::size_t>()});
  }

  const auto& cj = j.at("classifier");
  auto& cls = config.classifier;
  cls.rule_order = cj.at("rule_order").get<std::vector<std::string>>();
  cls.subject_routes = cue_table_from_json(cj, "subject_routes");
  cls.technique_cues = cue_table_from_json(cj, "technique_cues");
  cls.period_cues = cue_table_from_json(cj, "period_cues");
  cls.population_cues = cue_table_from_json(cj, "population_cues");
  cls.testable_cues = cue_table_from_json(cj, "testable_cues");
  cls.foundation_order = cj.value("foundation_order", std::vector<std::string>{});
  cls.fallback_category = cj.at("fallback_category").get<std::string>();
  cls.definition_markers = cj.value("definition_markers", std::vector<std::string>{});
  cls.xref_min_share = cj.at("xref").at("min_share").get<double>();
  cls.xref_limit = cj.at("xref").at("limit").get<std::size_t>();

  config.limits = limits_from_json(j.at("limits"));
  config.quotas = quotas_from_json(j.at("quotas"));
  config.gate = gate_from_json(j.at("gate"));
  config.reporting = reporting_from_json(j.at("reporting"));

  const auto& pj = j.at("pipeline");
  config.pipeline.worker_count = pj.at("worker_count").get<std::size_t>();
  config.pipeline.checkpoint_after_section = pj.value("checkpoint_after_section", true);
  const auto& rj = pj.at("retry");
  config.pipeline.retry.max_iterations = rj.at("max_iterations").get<std::size_t>();
  config.pipeline.retry.stop_on_no_improvement = rj.value("stop_on_no_improvement", true);
  config.pipeline.retry.io_backoff = std::chrono::milliseconds{rj.value("io_backoff_ms", 0)};

  validate_pipeline_config(config);
  return config;
}

json pipeline_config_to_json(const PipelineConfig& config) {
  json j;
  j["config_id"] = config.config_id;

  j["categories"] = json::array();
  for (const auto& c : config.catalog.categories) {
    j["categories"].push_back(
        {{"id", c.category_id}, {"label", c.label}, {"min_population", c.min_population}});
  }

  const auto& cls = config.classifier;
  j["classifier"] = {
      {"rule_order", cls.rule_order},
      {"subject_routes", cls.subject_routes},
      {"technique_cues", cls.technique_cues},
      {"period_cues", cls.period_cues},
      {"population_cues", cls.population_cues},
      {"testable_cues", cls.testable_cues},
      {"foundation_order", cls.foundation_order},
      {"fallback_category", cls.fallback_category},
      {"definition_markers", cls.definition_markers},
      {"xref", {{"limit", cls.xref_limit}, {"min_share", cls.xref_min_share}}},
  };

  json limits;
  limits["speaking_rate_wpm"] = config.limits.speaking_rate_wpm;
  limits["rule_severities"] = json::object();
  for (const auto& [rule_id, sev] : config.limits.rule_severities) {
    limits["rule_severities"][rule_id] = core::severity_to_string(sev);
  }
  limits["unit_types"] = json::array();
  for (const auto& unit : config.limits.unit_types) {
    json fields = json::array();
    for (const auto& f : unit.fields) {
      fields.push_back(field_limits_to_json(f));
    }
    limits["unit_types"].push_back({{"fields", fields}, {"unit_type", unit.unit_type}});
  }
  j["limits"] = limits;

  json bands = json::array();
  for (const auto& b : config.quotas.bands) {
    json band = {{"size_min", b.size_min},     {"size_max", b.size_max},
                 {"minimum", b.minimum},       {"target_min", b.target_min},
                 {"target_max", b.target_max}};
    if (b.maximum.has_value()) {
      band["maximum"] = b.maximum.value();
    }
    bands.push_back(band);
  }
  j["quotas"] = {{"bands", bands}, {"diversity_threshold", config.quotas.diversity_threshold}};

  const auto& gate = config.gate;
  json dims = json::array();
  for (const auto& d : gate.dimensions) {
    json dim = {{"id", d.dimension_id}, {"rules", d.rule_ids}, {"weight", d.weight}};
    if (d.floor.has_value()) {
      dim["floor"] = d.floor.value();
    }
    dims.push_back(dim);
  }
  json auto_fail = json::array();
  for (const auto& a : gate.auto_fail) {
    auto_fail.push_back({{"id", a.condition_id},
                         {"kind", auto_fail_kind_to_string(a.kind)},
                         {"rule_id", a.rule_id},
                         {"max_count", a.max_count},
                         {"dimension", a.dimension_id},
                         {"description", a.description}});
  }
  j["gate"] = {{"gate_id", gate.gate_id},
               {"pass_threshold", gate.pass_threshold},
               {"warn_threshold", gate.warn_threshold},
               {"dimension_pass_threshold", gate.dimension_pass_threshold},
               {"dimension_warn_threshold", gate.dimension_warn_threshold},
               {"default_penalty", gate.default_penalty},
               {"penalties", gate.penalties},
               {"unassigned_dimension", gate.unassigned_dimension},
               {"dimensions", dims},
               {"auto_fail", auto_fail}};

  json reporting;
  reporting["default_category"] =
      core::finding_category_to_string(config.reporting.default_category);
  reporting["rule_categories"] = json::object();
  for (const auto& [rule_id, cat] : config.reporting.rule_categories) {
    reporting["rule_categories"][rule_id] = core::finding_category_to_string(cat);
  }
  reporting["severity_rules"] = json::array();
  for (const auto& r : config.reporting.severity_rules) {
    reporting["severity_rules"].push_back(
        {{"category", r.category},
         {"rule_id", r.rule_id},
         {"field", r.field},
         {"severity", core::report_severity_to_string(r.severity)}});
  }
  reporting["remediation"] = json::object();
  for (const auto& [rule_id, guide] : config.reporting.remediation) {
    reporting["remediation"][rule_id] = {{"action", guide.action}, {"checklist", guide.checklist}};
  }
  j["reporting"] = reporting;

  const auto& p = config.pipeline;
  j["pipeline"] = {{"worker_count", p.worker_count},
                   {"checkpoint_after_section", p.checkpoint_after_section},
                   {"retry",
                    {{"max_iterations", p.retry.max_iterations},
                     {"stop_on_no_improvement", p.retry.stop_on_no_improvement},
                     {"io_backoff_ms", p.retry.io_backoff.count()}}}};

  return j;
}

}  // namespace cgate::config
