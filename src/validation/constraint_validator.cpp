#include "cgate/validation/constraint_validator.h"

#include "cgate/core/normalization.h"
#include "cgate/core/text_metrics.h"
#include "cgate/validation/rule_ids.h"

#include <iterator>
#include <string>
#include <utility>

namespace cgate::validation {

namespace {

using domain::format_quantity;

domain::Violation make_violation(const config::LimitsTable& limits, std::string_view rule_id,
                                 domain::Location location, std::string message,
                                 double measured, double limit) {
  domain::Violation v{};
  v.location = std::move(location);
  v.rule_id = std::string(rule_id);
  v.severity = limits.severity_for(v.rule_id);
  v.message = std::move(message);
  v.measurement = domain::Measurement{measured, limit};
  return v;
}

void check_field(const domain::ContentUnit& unit, const config::FieldLimits& field,
                 const config::LimitsTable& limits, std::vector<domain::Violation>& out) {
  const auto it = unit.fields.find(field.field);
  const bool present = it != unit.fields.end() && !core::trim(it->second).empty();
  if (!present) {
    if (field.required) {
      domain::Violation v{};
      v.location = domain::Location{unit.unit_id, field.field, std::nullopt};
      v.rule_id = std::string(kRequiredField);
      v.severity = core::Severity::kError;
      v.message = v.location.to_string() + ": required field '" + field.field + "' is missing";
      out.push_back(std::move(v));
    }
    return;
  }

  const std::string& text = it->second;
  const domain::Location field_loc{unit.unit_id, field.field, std::nullopt};
  const auto lines = core::non_empty_lines(text);

  if (field.max_lines.has_value() && lines.size() > *field.max_lines) {
    out.push_back(make_violation(
        limits, kLimitLines, field_loc,
        field_loc.to_string() + ": " + std::to_string(lines.size()) + " lines exceeds maximum of " +
            std::to_string(*field.max_lines),
        static_cast<double>(lines.size()), static_cast<double>(*field.max_lines)));
  }

  std::size_t total_chars = 0;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const std::size_t chars = core::utf8_length(lines[i]);
    total_chars += chars;
    if (field.max_chars_per_line.has_value() && chars > *field.max_chars_per_line) {
      const domain::Location line_loc{unit.unit_id, field.field, i + 1};
      out.push_back(make_violation(
          limits, kLimitChars, line_loc,
          line_loc.to_string() + ": " + std::to_string(chars) +
              " characters exceeds maximum of " + std::to_string(*field.max_chars_per_line),
          static_cast<double>(chars), static_cast<double>(*field.max_chars_per_line)));
    }
  }

  if (field.max_total_chars.has_value() && total_chars > *field.max_total_chars) {
    out.push_back(make_violation(
        limits, kLimitTotalChars, field_loc,
        field_loc.to_string() + ": " + std::to_string(total_chars) +
            " characters in total exceeds maximum of " + std::to_string(*field.max_total_chars),
        static_cast<double>(total_chars), static_cast<double>(*field.max_total_chars)));
  }

  const std::size_t words = core::word_count(text);
  if (field.min_words.has_value() && words < *field.min_words) {
    out.push_back(make_violation(
        limits, kWordsMin, field_loc,
        field_loc.to_string() + ": " + std::to_string(words) + " words is below minimum of " +
            std::to_string(*field.min_words),
        static_cast<double>(words), static_cast<double>(*field.min_words)));
  }
  if (field.max_words.has_value() && words > *field.max_words) {
    out.push_back(make_violation(
        limits, kWordsMax, field_loc,
        field_loc.to_string() + ": " + std::to_string(words) + " words exceeds maximum of " +
            std::to_string(*field.max_words),
        static_cast<double>(words), static_cast<double>(*field.max_words)));
  }

  if (field.max_duration_seconds.has_value() && limits.speaking_rate_wpm > 0.0) {
    const double seconds = static_cast<double>(words) / limits.speaking_rate_wpm * 60.0;
    if (seconds > *field.max_duration_seconds) {
      out.push_back(make_violation(
          limits, kLimitDuration, field_loc,
          field_loc.to_string() + ": estimated " + format_quantity(seconds) +
              " seconds at " + format_quantity(limits.speaking_rate_wpm) +
              " wpm exceeds maximum of " + format_quantity(*field.max_duration_seconds),
          seconds, *field.max_duration_seconds));
    }
  }

  for (const auto& marker : field.markers) {
    const std::size_t count = core::count_marker(text, marker.token);
    if (count < marker.min_count) {
      out.push_back(make_violation(
          limits, kMarkerMin, field_loc,
          field_loc.to_string() + ": marker " + marker.token + " appears " +
              std::to_string(count) + " times, minimum is " + std::to_string(marker.min_count),
          static_cast<double>(count), static_cast<double>(marker.min_count)));
    }
  }
}

}  // namespace

std::vector<domain::Violation> validate(const domain::ContentUnit& unit,
                                        const config::LimitsTable& limits) {
  std::vector<domain::Violation> violations;

  const auto* unit_limits = limits.find(unit.unit_type);
  if (unit_limits == nullptr) {
    domain::Violation v{};
    v.location = domain::Location{unit.unit_id, "", std::nullopt};
    v.rule_id = std::string(kUnitType);
    v.severity = core::Severity::kError;
    v.message = unit.unit_id + ": unknown unit type '" + unit.unit_type + "'";
    violations.push_back(std::move(v));
    return violations;
  }

  for (const auto& field : unit_limits->fields) {
    check_field(unit, field, limits, violations);
  }
  return violations;
}

std::vector<domain::Violation> validate_all(const std::vector<domain::ContentUnit>& units,
                                            const config::LimitsTable& limits) {
  std::vector<domain::Violation> violations;
  for (const auto& unit : units) {
    auto found = validate(unit, limits);
    violations.insert(violations.end(), std::make_move_iterator(found.begin()),
                      std::make_move_iterator(found.end()));
  }
  return violations;
}

}  // namespace cgate::validation
