#include "cgate/config/pipeline_config.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace cgate::config {

namespace {

constexpr std::size_t kMinCategories = 4;
constexpr std::size_t kMaxCategories = 6;
constexpr double kWeightTolerance = 1e-6;

void require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::invalid_argument(message);
  }
}

void validate_catalog(const PipelineConfig& config) {
  const auto& cats = config.catalog.categories;
  require(cats.size() >= kMinCategories && cats.size() <= kMaxCategories,
          "catalog: expected 4 to 6 categories, got " + std::to_string(cats.size()));

  std::set<std::string> seen;
  for (const auto& cat : cats) {
    require(!cat.category_id.empty(), "catalog: category_id must not be empty");
    require(seen.insert(cat.category_id).second,
            "catalog: duplicate category_id '" + cat.category_id + "'");
  }
}

void validate_cue_table(const CategoryCatalog& catalog, const CueTable& table,
                        const std::string& name) {
  for (const auto& [category_id, cues] : table) {
    require(catalog.contains(category_id),
            "classifier." + name + ": unknown category '" + category_id + "'");
    for (const auto& cue : cues) {
      require(!cue.empty(), "classifier." + name + ": empty cue for '" + category_id + "'");
    }
  }
}

void validate_classifier(const PipelineConfig& config) {
  const auto& c = config.classifier;
  require(!c.rule_order.empty(), "classifier.rule_order must not be empty");
  std::set<std::string> ids(c.rule_order.begin(), c.rule_order.end());
  require(ids.size() == c.rule_order.size(), "classifier.rule_order contains duplicates");

  require(config.catalog.contains(c.fallback_category),
          "classifier.fallback_category '" + c.fallback_category + "' is not in the catalog");
  for (const auto& id : c.foundation_order) {
    require(config.catalog.contains(id),
            "classifier.foundation_order: unknown category '" + id + "'");
  }

  validate_cue_table(config.catalog, c.subject_routes, "subject_routes");
  validate_cue_table(config.catalog, c.technique_cues, "technique_cues");
  validate_cue_table(config.catalog, c.period_cues, "period_cues");
  validate_cue_table(config.catalog, c.population_cues, "population_cues");
  validate_cue_table(config.catalog, c.testable_cues, "testable_cues");

  require(c.xref_min_share > 0.0 && c.xref_min_share <= 1.0,
          "classifier.xref_min_share must be in (0, 1]");
}

void validate_limits(const LimitsTable& limits) {
  require(!limits.unit_types.empty(), "limits.unit_types must not be empty");

  std::set<std::string> types;
  bool any_duration = false;
  for (const auto& unit : limits.unit_types) {
    require(types.insert(unit.unit_type).second,
            "limits: duplicate unit_type '" + unit.unit_type + "'");
    std::set<std::string> fields;
    for (const auto& f : unit.fields) {
      require(fields.insert(f.field).second,
              "limits." + unit.unit_type + ": duplicate field '" + f.field + "'");
      if (f.min_words.has_value() && f.max_words.has_value()) {
        require(f.min_words.value() <= f.max_words.value(),
                "limits." + unit.unit_type + "." + f.field + ": min_words > max_words");
      }
      any_duration = any_duration || f.max_duration_seconds.has_value();
    }
  }
  if (any_duration) {
    require(limits.speaking_rate_wpm > 0.0,
            "limits.speaking_rate_wpm must be positive when a duration limit is configured");
  }

  const auto it = limits.rule_severities.find("REQ-FIELD");
  require(it == limits.rule_severities.end() || it->second == core::Severity::kError,
          "limits.rule_severities: REQ-FIELD is always ERROR");
}

void validate_quotas(const QuotaTable& quotas) {
  require(!quotas.bands.empty(), "quotas.bands must not be empty");

  for (std::size_t i = 0; i < quotas.bands.size(); ++i) {
    const auto& b = quotas.bands[i];
    const std::string where = "quotas.bands[" + std::to_string(i) + "]";
    require(b.size_min <= b.size_max, where + ": size_min > size_max");
    require(b.minimum <= b.target_min && b.target_min <= b.target_max,
            where + ": expected minimum <= target_min <= target_max");
    if (b.maximum.has_value()) {
      require(b.target_max <= b.maximum.value(), where + ": target_max > maximum");
    }
    if (i > 0) {
      require(quotas.bands[i - 1].size_max + 1 == b.size_min,
              where + ": bands must be contiguous and non-overlapping");
    }
  }
}

void validate_gate(const GateDefinition& gate) {
  require(!gate.dimensions.empty(), "gate.dimensions must not be empty");

  std::set<std::string> dims;
  double weight_sum = 0.0;
  for (const auto& d : gate.dimensions) {
    require(dims.insert(d.dimension_id).second,
            "gate: duplicate dimension '" + d.dimension_id + "'");
    require(d.weight >= 0.0, "gate." + d.dimension_id + ": negative weight");
    weight_sum += d.weight;
  }
  require(std::fabs(weight_sum - 1.0) <= kWeightTolerance,
          "gate: dimension weights must sum to 1.0, got " + std::to_string(weight_sum));
  require(dims.count(gate.unassigned_dimension) == 1,
          "gate.unassigned_dimension '" + gate.unassigned_dimension + "' is not a dimension");

  require(gate.warn_threshold <= gate.pass_threshold, "gate: warn_threshold > pass_threshold");
  require(gate.dimension_warn_threshold <= gate.dimension_pass_threshold,
          "gate: dimension_warn_threshold > dimension_pass_threshold");

  for (const auto& cond : gate.auto_fail) {
    if (cond.kind == AutoFailKind::kDimensionBelowFloor) {
      const auto it = std::find_if(
          gate.dimensions.begin(), gate.dimensions.end(),
          [&](const DimensionDef& d) { return d.dimension_id == cond.dimension_id; });
      require(it != gate.dimensions.end(),
              "gate.auto_fail." + cond.condition_id + ": unknown dimension");
      require(it->floor.has_value(),
              "gate.auto_fail." + cond.condition_id + ": dimension has no floor");
    } else {
      require(!cond.rule_id.empty(), "gate.auto_fail." + cond.condition_id + ": rule_id required");
    }
  }
}

}  // namespace

bool CategoryCatalog::contains(const std::string& category_id) const {
  return index_of(category_id).has_value();
}

std::optional<std::size_t> CategoryCatalog::index_of(const std::string& category_id) const {
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (categories[i].category_id == category_id) {
      return i;
    }
  }
  return std::nullopt;
}

const UnitLimits* LimitsTable::find(const std::string& unit_type) const {
  for (const auto& unit : unit_types) {
    if (unit.unit_type == unit_type) {
      return &unit;
    }
  }
  return nullptr;
}

core::Severity LimitsTable::severity_for(const std::string& rule_id) const {
  const auto it = rule_severities.find(rule_id);
  return it != rule_severities.end() ? it->second : core::Severity::kError;
}

const QuotaBand* QuotaTable::find(std::size_t collection_size) const {
  for (const auto& band : bands) {
    if (collection_size >= band.size_min && collection_size <= band.size_max) {
      return &band;
    }
  }
  return nullptr;
}

double GateDefinition::penalty_for(const std::string& rule_id) const {
  const auto it = penalties.find(rule_id);
  return it != penalties.end() ? it->second : default_penalty;
}

void validate_pipeline_config(const PipelineConfig& config) {
  validate_catalog(config);
  validate_classifier(config);
  validate_limits(config.limits);
  validate_quotas(config.quotas);
  validate_gate(config.gate);

  require(config.pipeline.worker_count >= 1, "pipeline.worker_count must be at least 1");
  require(config.pipeline.retry.max_iterations >= 1,
          "pipeline.retry.max_iterations must be at least 1");
}

}  // namespace cgate::config
