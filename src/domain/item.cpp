#include "cgate/domain/item.h"

#include "cgate/core/text_metrics.h"

namespace cgate::domain {

Item make_item(std::int64_t item_id, std::string text) {
  Item item;
  item.item_id = item_id;
  item.word_count = core::word_count(text);
  item.text = std::move(text);
  return item;
}

}  // namespace cgate::domain
