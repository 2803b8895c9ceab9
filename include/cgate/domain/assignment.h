#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cgate::domain {

// RuleTier orders the classification cascade. Lower tiers are consulted first.
enum class RuleTier {
  kPrimary,
  kSecondary,
  kTertiary,
};

enum class FlagKind {
  kFrontload,  // item defines a term other items depend on; deliver it first
  kAmbiguous,  // tiers disagreed and a tertiary tie-breaker decided
  kXref,       // item also belongs to a secondary category
};

// Flag is metadata on an Assignment; it never changes the assigned category.
// kAmbiguous carries a rationale naming the runner-up category in `detail`.
// kXref carries the secondary category id in `detail`.
struct Flag {
  FlagKind kind{FlagKind::kFrontload};
  std::string detail;

  bool operator==(const Flag&) const = default;
};

// Assignment maps one Item to exactly one category, with the deciding rule.
struct Assignment {
  std::int64_t item_id{0};      // NOLINT(readability-identifier-naming)
  std::string category_id;      // NOLINT(readability-identifier-naming)
  std::string rule_id;          // NOLINT(readability-identifier-naming)
  RuleTier tier{RuleTier::kPrimary};
  std::vector<Flag> flags;

  [[nodiscard]] bool has_flag(FlagKind kind) const noexcept;
  bool operator==(const Assignment&) const = default;
};

// String conversion helpers.
// *_from_string throws std::invalid_argument for unknown values.
std::string rule_tier_to_string(RuleTier t);
RuleTier rule_tier_from_string(const std::string& s);
std::string flag_kind_to_string(FlagKind k);
FlagKind flag_kind_from_string(const std::string& s);

}  // namespace cgate::domain
