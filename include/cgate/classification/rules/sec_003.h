#pragma once

#include "cgate/classification/cue_rule.h"

namespace cgate::classification {

// SEC-003: Route by population cue (secondary tier)
class Sec003 final : public CueRule {
 public:
  explicit Sec003(config::CueTable population_cues) : CueRule(std::move(population_cues)) {}

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "SEC-003"; }
  [[nodiscard]] domain::RuleTier tier() const noexcept override {
    return domain::RuleTier::kSecondary;
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Route by population cue";
  }
};

}  // namespace cgate::classification
