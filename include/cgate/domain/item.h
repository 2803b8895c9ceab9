#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace cgate::domain {

// Item is an atomic unit of content (a fact or concept) to be classified.
// Items are immutable once ingested; identifiers are stable and sequential.
struct Item {
  std::int64_t item_id{0};  // NOLINT(readability-identifier-naming)
  std::string text;         // NOLINT(readability-identifier-naming)
  std::size_t word_count{0};  // NOLINT(readability-identifier-naming)
};

// make_item builds an Item and derives word_count from text.
[[nodiscard]] Item make_item(std::int64_t item_id, std::string text);

}  // namespace cgate::domain
