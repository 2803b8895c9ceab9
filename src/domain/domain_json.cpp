#include "cgate/domain/domain_json.h"

namespace cgate::domain {

Item item_from_json(const nlohmann::json& j) {
  return make_item(j.at("id").get<std::int64_t>(), j.at("text").get<std::string>());
}

std::vector<Item> items_from_json(const nlohmann::json& j) {
  const auto& array = j.is_object() ? j.at("items") : j;
  std::vector<Item> items;
  items.reserve(array.size());
  for (const auto& entry : array) {
    items.push_back(item_from_json(entry));
  }
  return items;
}

nlohmann::json item_to_json(const Item& item) {
  return nlohmann::json{
      {"id", item.item_id}, {"text", item.text}, {"word_count", item.word_count}};
}

nlohmann::json assignment_to_json(const Assignment& assignment) {
  nlohmann::json flags = nlohmann::json::array();
  for (const auto& flag : assignment.flags) {
    flags.push_back({{"kind", flag_kind_to_string(flag.kind)}, {"detail", flag.detail}});
  }
  return nlohmann::json{{"item_id", assignment.item_id},
                        {"category_id", assignment.category_id},
                        {"rule_id", assignment.rule_id},
                        {"tier", rule_tier_to_string(assignment.tier)},
                        {"flags", flags}};
}

Assignment assignment_from_json(const nlohmann::json& j) {
  Assignment a{};
  a.item_id = j.at("item_id").get<std::int64_t>();
  a.category_id = j.at("category_id").get<std::string>();
  a.rule_id = j.at("rule_id").get<std::string>();
  a.tier = rule_tier_from_string(j.at("tier").get<std::string>());
  for (const auto& f : j.at("flags")) {
    a.flags.push_back(
        Flag{flag_kind_from_string(f.at("kind").get<std::string>()), f.at("detail").get<std::string>()});
  }
  return a;
}

ContentUnit content_unit_from_json(const nlohmann::json& j) {
  ContentUnit unit{};
  unit.unit_id = j.at("unit_id").get<std::string>();
  unit.category_id = j.value("category_id", std::string{});
  unit.unit_type = j.at("unit_type").get<std::string>();
  if (j.contains("fields")) {
    for (const auto& [name, text] : j.at("fields").items()) {
      unit.fields[name] = text.get<std::string>();
    }
  }
  if (j.contains("special_kind") && !j.at("special_kind").is_null()) {
    unit.special_kind = j.at("special_kind").get<std::string>();
  }
  return unit;
}

nlohmann::json content_unit_to_json(const ContentUnit& unit) {
  nlohmann::json j{{"unit_id", unit.unit_id},
                   {"category_id", unit.category_id},
                   {"unit_type", unit.unit_type},
                   {"fields", unit.fields}};
  if (unit.special_kind.has_value()) {
    j["special_kind"] = *unit.special_kind;
  }
  return j;
}

nlohmann::json location_to_json(const Location& location) {
  nlohmann::json j{{"unit_id", location.unit_id}, {"field", location.field}};
  j["line"] = location.line.has_value() ? nlohmann::json(*location.line) : nlohmann::json(nullptr);
  return j;
}

nlohmann::json violation_to_json(const Violation& violation) {
  nlohmann::json j{{"location", location_to_json(violation.location)},
                   {"rule_id", violation.rule_id},
                   {"severity", core::severity_to_string(violation.severity)},
                   {"message", violation.message}};
  if (violation.measurement.has_value()) {
    j["measured"] = violation.measurement->measured;
    j["limit"] = violation.measurement->limit;
  }
  return j;
}

Violation violation_from_json(const nlohmann::json& j) {
  Violation v{};
  const auto& loc = j.at("location");
  v.location.unit_id = loc.at("unit_id").get<std::string>();
  v.location.field = loc.value("field", std::string{});
  if (loc.contains("line") && !loc.at("line").is_null()) {
    v.location.line = loc.at("line").get<std::size_t>();
  }
  v.rule_id = j.at("rule_id").get<std::string>();
  v.severity = core::severity_from_string(j.at("severity").get<std::string>());
  v.message = j.at("message").get<std::string>();
  if (j.contains("measured") && j.contains("limit")) {
    v.measurement = Measurement{j.at("measured").get<double>(), j.at("limit").get<double>()};
  }
  return v;
}

nlohmann::json advisory_to_json(const Advisory& advisory) {
  return nlohmann::json{{"location", location_to_json(advisory.location)},
                        {"rule_id", advisory.rule_id},
                        {"message", advisory.message}};
}

}  // namespace cgate::domain
