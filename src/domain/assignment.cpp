#include "cgate/domain/assignment.h"

#include <algorithm>
#include <stdexcept>

namespace cgate::domain {

bool Assignment::has_flag(FlagKind kind) const noexcept {
  return std::any_of(flags.begin(), flags.end(), [kind](const Flag& f) { return f.kind == kind; });
}

std::string rule_tier_to_string(RuleTier t) {
  switch (t) {
    case RuleTier::kPrimary:
      return "primary";
    case RuleTier::kSecondary:
      return "secondary";
    case RuleTier::kTertiary:
      return "tertiary";
  }
  return "unknown";
}

RuleTier rule_tier_from_string(const std::string& s) {
  if (s == "primary")
    return RuleTier::kPrimary;
  if (s == "secondary")
    return RuleTier::kSecondary;
  if (s == "tertiary")
    return RuleTier::kTertiary;
  throw std::invalid_argument("Unknown RuleTier: " + s);
}

std::string flag_kind_to_string(FlagKind k) {
  switch (k) {
    case FlagKind::kFrontload:
      return "FRONTLOAD";
    case FlagKind::kAmbiguous:
      return "AMBIGUOUS";
    case FlagKind::kXref:
      return "XREF";
  }
  return "unknown";
}

FlagKind flag_kind_from_string(const std::string& s) {
  if (s == "FRONTLOAD")
    return FlagKind::kFrontload;
  if (s == "AMBIGUOUS")
    return FlagKind::kAmbiguous;
  if (s == "XREF")
    return FlagKind::kXref;
  throw std::invalid_argument("Unknown FlagKind: " + s);
}

}  // namespace cgate::domain
