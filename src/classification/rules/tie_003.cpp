#include "cgate/classification/rules/tie_003.h"

#include "cgate/classification/cue_rule.h"
#include "cgate/core/normalization.h"

namespace cgate::classification {

RuleVerdict Tie003::evaluate(const domain::Item& item, const config::CategoryCatalog& catalog,
                             const ClassificationContext& /*context*/,
                             const std::vector<RuleOutcome>& prior) const {
  const auto testable = score_cues(core::tokenize_ascii(item.text), testable_cues_, catalog);
  const auto support = aggregate_support(catalog, prior);

  // Candidates are the testable leaders, or every supported category when no testable
  // cue matched. Catalog order is kept so the first strict maximum is deterministic.
  std::vector<std::string> candidates = testable.leaders();
  if (candidates.empty()) {
    for (const auto& s : support.scores) {
      candidates.push_back(s.category_id);
    }
  }

  RuleVerdict verdict;
  if (candidates.empty()) {
    verdict.scores.push_back(CategoryScore{fallback_category_, 1.0});
    return verdict;
  }

  std::string best = candidates.front();
  double best_support = support.score_of(best);
  for (const auto& candidate : candidates) {
    const double s = support.score_of(candidate);
    if (s > best_support) {
      best_support = s;
      best = candidate;
    }
  }
  verdict.scores.push_back(CategoryScore{best, 1.0});
  return verdict;
}

}  // namespace cgate::classification
