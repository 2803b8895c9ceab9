#pragma once

#include "cgate/classification/classification_rule.h"

#include <utility>

namespace cgate::classification {

// CueRule scores each category by how many of its cue phrases occur in the item text.
// A phrase occurring twice counts twice. Cue matching is token based and
// case-insensitive, so "Cohort Study" matches the cue "cohort study".
class CueRule : public ClassificationRule {
 public:
  [[nodiscard]] RuleVerdict evaluate(const domain::Item& item,
                                     const config::CategoryCatalog& catalog,
                                     const ClassificationContext& context,
                                     const std::vector<RuleOutcome>& prior) const final;

  [[nodiscard]] const config::CueTable& cues() const noexcept { return cues_; }

 protected:
  explicit CueRule(config::CueTable cues) : cues_(std::move(cues)) {}

 private:
  config::CueTable cues_;
};

// score_cues is the matching step shared by cue rules and the forced-choice tie-breaker.
[[nodiscard]] RuleVerdict score_cues(const std::vector<std::string>& tokens,
                                     const config::CueTable& cues,
                                     const config::CategoryCatalog& catalog);

}  // namespace cgate::classification
