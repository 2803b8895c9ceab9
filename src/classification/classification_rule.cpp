#include "cgate/classification/classification_rule.h"

#include <algorithm>

namespace cgate::classification {

std::vector<std::string> RuleVerdict::leaders() const {
  std::vector<std::string> result;
  double best = 0.0;
  for (const auto& s : scores) {
    if (s.score > best) {
      best = s.score;
      result.clear();
      result.push_back(s.category_id);
    } else if (s.score == best && best > 0.0) {
      result.push_back(s.category_id);
    }
  }
  return result;
}

std::optional<std::string> RuleVerdict::decisive() const {
  auto top = leaders();
  if (top.size() != 1) {
    return std::nullopt;
  }
  return top.front();
}

double RuleVerdict::score_of(const std::string& category_id) const {
  const auto it = std::find_if(scores.begin(), scores.end(), [&](const CategoryScore& s) {
    return s.category_id == category_id;
  });
  return it != scores.end() ? it->score : 0.0;
}

RuleVerdict aggregate_support(const config::CategoryCatalog& catalog,
                              const std::vector<RuleOutcome>& prior) {
  RuleVerdict total;
  for (const auto& category : catalog.categories) {
    double sum = 0.0;
    for (const auto& outcome : prior) {
      if (outcome.tier == domain::RuleTier::kTertiary) {
        continue;
      }
      sum += outcome.verdict.score_of(category.category_id);
    }
    if (sum > 0.0) {
      total.scores.push_back(CategoryScore{category.category_id, sum});
    }
  }
  return total;
}

}  // namespace cgate::classification
