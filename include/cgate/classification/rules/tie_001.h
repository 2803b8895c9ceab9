#pragma once

#include "cgate/classification/classification_rule.h"

#include <string>
#include <utility>
#include <vector>

namespace cgate::classification {

// TIE-001: Foundation ordering (tertiary tier)
// Applies only to items that define a term other items use. Among the categories
// earlier tiers supported, picks the one earliest in foundation_order so the
// definition is delivered before its dependents.
class Tie001 final : public ClassificationRule {
 public:
  explicit Tie001(std::vector<std::string> foundation_order)
      : foundation_order_(std::move(foundation_order)) {}

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "TIE-001"; }
  [[nodiscard]] domain::RuleTier tier() const noexcept override {
    return domain::RuleTier::kTertiary;
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Prefer the most foundational supported category for defining items";
  }

  [[nodiscard]] RuleVerdict evaluate(const domain::Item& item,
                                     const config::CategoryCatalog& catalog,
                                     const ClassificationContext& context,
                                     const std::vector<RuleOutcome>& prior) const override;

 private:
  std::vector<std::string> foundation_order_;
};

}  // namespace cgate::classification
