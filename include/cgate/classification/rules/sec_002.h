#pragma once

#include "cgate/classification/cue_rule.h"

namespace cgate::classification {

// SEC-002: Route by period or timing cue (secondary tier)
class Sec002 final : public CueRule {
 public:
  explicit Sec002(config::CueTable period_cues) : CueRule(std::move(period_cues)) {}

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "SEC-002"; }
  [[nodiscard]] domain::RuleTier tier() const noexcept override {
    return domain::RuleTier::kSecondary;
  }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Route by period or timing cue";
  }
};

}  // namespace cgate::classification
