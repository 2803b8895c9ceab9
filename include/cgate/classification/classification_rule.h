#pragma once

#include "cgate/classification/dependency_mapper.h"
#include "cgate/config/pipeline_config.h"
#include "cgate/domain/assignment.h"
#include "cgate/domain/item.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cgate::classification {

struct CategoryScore {
  std::string category_id;
  double score{0.0};
};

// RuleVerdict is the support a single rule gives each category for one item.
// Only categories with a positive score are listed, in catalog order.
struct RuleVerdict {
  std::vector<CategoryScore> scores;

  [[nodiscard]] bool empty() const noexcept { return scores.empty(); }
  // Categories sharing the maximum score.
  [[nodiscard]] std::vector<std::string> leaders() const;
  // The single category holding a strictly greater score than every other, if any.
  [[nodiscard]] std::optional<std::string> decisive() const;
  [[nodiscard]] double score_of(const std::string& category_id) const;
};

// RuleOutcome records what an already-evaluated rule concluded for the current item.
struct RuleOutcome {
  std::string rule_id;
  domain::RuleTier tier{domain::RuleTier::kPrimary};
  RuleVerdict verdict;
};

// ClassificationContext carries batch-level data computed once before items are
// classified.
struct ClassificationContext {
  DependencyMap dependencies;
};

// ClassificationRule is the abstract base class for all cascade rules.
// Rules are pure: the same item, catalog, context and prior outcomes always give the
// same verdict. Tie-breakers read `prior` (earlier outcomes for this item, in
// evaluation order); earlier tiers ignore it.
class ClassificationRule {
 public:
  virtual ~ClassificationRule() = default;

  [[nodiscard]] virtual std::string_view rule_id() const noexcept = 0;
  [[nodiscard]] virtual domain::RuleTier tier() const noexcept = 0;
  [[nodiscard]] virtual std::string_view description() const noexcept = 0;

  // A forced-choice rule always returns a decisive verdict. The cascade must end with one.
  [[nodiscard]] virtual bool is_forced_choice() const noexcept { return false; }

  [[nodiscard]] virtual RuleVerdict evaluate(const domain::Item& item,
                                             const config::CategoryCatalog& catalog,
                                             const ClassificationContext& context,
                                             const std::vector<RuleOutcome>& prior) const = 0;

 protected:
  ClassificationRule() = default;
  ClassificationRule(const ClassificationRule&) = default;
  ClassificationRule& operator=(const ClassificationRule&) = default;
  ClassificationRule(ClassificationRule&&) = default;
  ClassificationRule& operator=(ClassificationRule&&) = default;
};

// aggregate_support sums, per category, the scores given by non-tertiary outcomes.
// Result is in catalog order and omits categories with no support.
[[nodiscard]] RuleVerdict aggregate_support(const config::CategoryCatalog& catalog,
                                            const std::vector<RuleOutcome>& prior);

}  // namespace cgate::classification
