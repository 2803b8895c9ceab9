#pragma once

#include <string_view>

namespace cgate::validation {

// Rule identifiers emitted by the constraint validator and quota checker.
// Gate penalties, auto-fail conditions and report lookups refer to these strings.

inline constexpr std::string_view kUnitType = "UNIT-TYPE";
inline constexpr std::string_view kRequiredField = "REQ-FIELD";
inline constexpr std::string_view kLimitLines = "LIMIT-LINES";
inline constexpr std::string_view kLimitChars = "LIMIT-CHARS";
inline constexpr std::string_view kLimitTotalChars = "LIMIT-TOTAL-CHARS";
inline constexpr std::string_view kWordsMin = "RANGE-WORDS-MIN";
inline constexpr std::string_view kWordsMax = "RANGE-WORDS-MAX";
inline constexpr std::string_view kLimitDuration = "LIMIT-DURATION";
inline constexpr std::string_view kMarkerMin = "MARKER-MIN";

inline constexpr std::string_view kQuotaNoBand = "QUOTA-NO-BAND";
inline constexpr std::string_view kQuotaMin = "QUOTA-MIN";
inline constexpr std::string_view kQuotaTarget = "QUOTA-TARGET";
inline constexpr std::string_view kQuotaMax = "QUOTA-MAX";
inline constexpr std::string_view kQuotaDiversity = "QUOTA-DIVERSITY";

}  // namespace cgate::validation
