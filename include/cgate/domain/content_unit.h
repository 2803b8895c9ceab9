#pragma once

#include <map>
#include <optional>
#include <string>

namespace cgate::domain {

// ContentUnit is an artifact produced by the external generation collaborator for one
// category (a slide, a blueprint section, ...). The unit_type tag selects the limits
// applied by the constraint validator; fields are named text blocks.
//
// special_kind marks a unit as a "special item" for distribution quotas (e.g. a visual
// slide) and records its sub-type (e.g. "chart", "diagram").
struct ContentUnit {
  std::string unit_id;                       // NOLINT(readability-identifier-naming)
  std::string category_id;                   // NOLINT(readability-identifier-naming)
  std::string unit_type;                     // NOLINT(readability-identifier-naming)
  std::map<std::string, std::string> fields;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> special_kind;   // NOLINT(readability-identifier-naming)

  bool operator==(const ContentUnit&) const = default;
};

}  // namespace cgate::domain
