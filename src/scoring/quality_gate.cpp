#include "cgate/scoring/quality_gate.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace cgate::scoring {

namespace {

constexpr double kMaxScore = 100.0;
constexpr double kWeightTolerance = 1e-6;
// Absorbs rounding in weighted sums such as 0.3 * 100 + 0.7 * 85.
constexpr double kThresholdEpsilon = 1e-9;

std::size_t count_rule(const std::vector<ScoreCategory>& categories, const std::string& rule_id) {
  std::size_t n = 0;
  for (const auto& c : categories) {
    n += static_cast<std::size_t>(
        std::count_if(c.violations.begin(), c.violations.end(),
                      [&](const domain::Violation& v) { return v.rule_id == rule_id; }));
  }
  return n;
}

core::Outcome threshold_outcome(double value, double pass, double warn) {
  if (value + kThresholdEpsilon >= pass) {
    return core::Outcome::kPass;
  }
  if (value + kThresholdEpsilon >= warn) {
    return core::Outcome::kWarn;
  }
  return core::Outcome::kFail;
}

}  // namespace

QualityGate::QualityGate(config::GateDefinition definition) : definition_(std::move(definition)) {}

std::vector<ScoreCategory> QualityGate::build_categories(
    const std::vector<domain::Violation>& violations) const {
  std::vector<ScoreCategory> categories;
  categories.reserve(definition_.dimensions.size());

  std::map<std::string, std::size_t> owner;  // rule id -> category index
  std::size_t unassigned = 0;
  for (std::size_t i = 0; i < definition_.dimensions.size(); ++i) {
    const auto& dim = definition_.dimensions[i];
    categories.push_back(ScoreCategory{dim.dimension_id, kMaxScore, dim.weight, {}});
    for (const auto& rule_id : dim.rule_ids) {
      owner.emplace(rule_id, i);
    }
    if (dim.dimension_id == definition_.unassigned_dimension) {
      unassigned = i;
    }
  }
  if (categories.empty()) {
    return categories;
  }

  for (const auto& v : violations) {
    const auto it = owner.find(v.rule_id);
    auto& category = categories[it != owner.end() ? it->second : unassigned];
    category.raw_score = std::max(0.0, category.raw_score - definition_.penalty_for(v.rule_id));
    category.violations.push_back(v);
  }
  return categories;
}

GateResult QualityGate::score(const std::vector<ScoreCategory>& categories) const {
  double weight_sum = 0.0;
  for (const auto& c : categories) {
    if (c.weight < 0.0) {
      throw std::invalid_argument("Negative weight for dimension " + c.dimension_id);
    }
    if (c.raw_score < 0.0 || c.raw_score > kMaxScore) {
      throw std::invalid_argument("Score out of range for dimension " + c.dimension_id);
    }
    weight_sum += c.weight;
  }
  if (std::fabs(weight_sum - 1.0) > kWeightTolerance) {
    throw std::invalid_argument("Dimension weights must sum to 1.0");
  }

  GateResult result{};
  result.gate_id = definition_.gate_id;

  // Auto-fail conditions are independent of the weighted total.
  for (const auto& condition : definition_.auto_fail) {
    switch (condition.kind) {
      case config::AutoFailKind::kRulePresent: {
        const auto n = count_rule(categories, condition.rule_id);
        if (n > 0) {
          result.auto_fail.push_back(TriggeredAutoFail{
              condition.condition_id, condition.description,
              condition.rule_id + " present " + std::to_string(n) + " time(s)"});
        }
        break;
      }
      case config::AutoFailKind::kRuleCountExceeds: {
        const auto n = count_rule(categories, condition.rule_id);
        if (n > condition.max_count) {
          result.auto_fail.push_back(TriggeredAutoFail{
              condition.condition_id, condition.description,
              condition.rule_id + " count " + std::to_string(n) + " exceeds " +
                  std::to_string(condition.max_count)});
        }
        break;
      }
      case config::AutoFailKind::kDimensionBelowFloor: {
        const auto dim = std::find_if(
            definition_.dimensions.begin(), definition_.dimensions.end(),
            [&](const config::DimensionDef& d) { return d.dimension_id == condition.dimension_id; });
        const auto cat = std::find_if(categories.begin(), categories.end(), [&](const ScoreCategory& c) {
          return c.dimension_id == condition.dimension_id;
        });
        if (dim != definition_.dimensions.end() && dim->floor.has_value() &&
            cat != categories.end() && cat->raw_score < *dim->floor) {
          result.auto_fail.push_back(TriggeredAutoFail{
              condition.condition_id, condition.description,
              condition.dimension_id + " scored " + domain::format_quantity(cat->raw_score) +
                  " below floor " + domain::format_quantity(*dim->floor)});
        }
        break;
      }
    }
  }

  for (const auto& c : categories) {
    DimensionResult d{};
    d.dimension_id = c.dimension_id;
    d.raw_score = c.raw_score;
    d.weight = c.weight;
    d.contribution = c.raw_score * c.weight;
    d.status = threshold_outcome(c.raw_score, definition_.dimension_pass_threshold,
                                 definition_.dimension_warn_threshold);
    d.violation_count = c.violations.size();
    result.weighted_score += d.contribution;
    result.breakdown.push_back(std::move(d));
  }

  result.status = result.auto_failed()
                      ? core::Outcome::kFail
                      : threshold_outcome(result.weighted_score, definition_.pass_threshold,
                                          definition_.warn_threshold);
  return result;
}

nlohmann::json gate_result_to_json(const GateResult& result) {
  nlohmann::json breakdown = nlohmann::json::array();
  for (const auto& d : result.breakdown) {
    breakdown.push_back({{"dimension_id", d.dimension_id},
                         {"raw_score", d.raw_score},
                         {"weight", d.weight},
                         {"contribution", d.contribution},
                         {"status", core::outcome_to_string(d.status)},
                         {"violation_count", d.violation_count}});
  }
  nlohmann::json auto_fail = nlohmann::json::array();
  for (const auto& a : result.auto_fail) {
    auto_fail.push_back(
        {{"condition_id", a.condition_id}, {"description", a.description}, {"detail", a.detail}});
  }
  return nlohmann::json{{"gate_id", result.gate_id},
                        {"weighted_score", result.weighted_score},
                        {"status", core::outcome_to_string(result.status)},
                        {"auto_fail", auto_fail},
                        {"breakdown", breakdown}};
}

}  // namespace cgate::scoring
