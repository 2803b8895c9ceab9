#pragma once

#include "cgate/domain/assignment.h"
#include "cgate/domain/content_unit.h"
#include "cgate/domain/item.h"
#include "cgate/domain/violation.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace cgate::domain {

// JSON codecs for the pipeline's interchange records.
// Object keys are sorted (nlohmann::json uses std::map), arrays keep input order.
// The *_from_json functions throw nlohmann::json::exception on missing fields or type
// mismatches and std::invalid_argument on unknown enum strings.

// Item input: {"id": 1, "text": "..."}; word_count is derived, never read.
[[nodiscard]] Item item_from_json(const nlohmann::json& j);
[[nodiscard]] std::vector<Item> items_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json item_to_json(const Item& item);

[[nodiscard]] nlohmann::json assignment_to_json(const Assignment& assignment);
[[nodiscard]] Assignment assignment_from_json(const nlohmann::json& j);

// ContentUnit: {"unit_id", "category_id", "unit_type", "fields": {..}, "special_kind"?}
[[nodiscard]] ContentUnit content_unit_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json content_unit_to_json(const ContentUnit& unit);

[[nodiscard]] nlohmann::json location_to_json(const Location& location);
[[nodiscard]] nlohmann::json violation_to_json(const Violation& violation);
[[nodiscard]] Violation violation_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json advisory_to_json(const Advisory& advisory);

}  // namespace cgate::domain
