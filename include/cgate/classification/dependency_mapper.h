#pragma once

#include "cgate/domain/item.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cgate::classification {

// DependencyMap records which items define a term and which items use it.
//
// An item defines a term when its text contains a definition marker (e.g.
// "is defined as") preceded by at least one word; the term is the last one or two
// words before the marker, without leading articles. Another item depends on the
// definer when its token stream contains the term as a contiguous phrase.
struct DependencyMap {
  std::map<std::int64_t, std::string> defined_terms;
  // definer item id -> dependent item ids, ascending
  std::map<std::int64_t, std::vector<std::int64_t>> dependents;
  // Every item id, each definer ahead of its dependents. Items caught in a
  // definition cycle come last, in input order.
  std::vector<std::int64_t> suggested_order;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool has_dependents(std::int64_t item_id) const;
  [[nodiscard]] std::vector<std::int64_t> dependents_of(std::int64_t item_id) const;
};

// map_dependencies scans the whole batch. Deterministic: results depend only on item
// text, item ids, input order and marker order.
[[nodiscard]] DependencyMap map_dependencies(const std::vector<domain::Item>& items,
                                             const std::vector<std::string>& definition_markers);

// delivery_order sorts item ids topologically over the definer -> dependent edges,
// taking ready items in input order. Ids left unplaced by a cycle are appended in
// input order.
[[nodiscard]] std::vector<std::int64_t> delivery_order(
    const std::vector<domain::Item>& items,
    const std::map<std::int64_t, std::vector<std::int64_t>>& dependents);

// extract_defined_term returns the term an item defines, or "" when it defines none.
[[nodiscard]] std::string extract_defined_term(const std::string& text,
                                               const std::vector<std::string>& definition_markers);

}  // namespace cgate::classification
