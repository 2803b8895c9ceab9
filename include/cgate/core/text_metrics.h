#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cgate::core {

// Measurements used by the constraint validator. All functions are pure.
//
// Line model: text is split on '\n' (a trailing '\r' is stripped); lines that are
// empty after trimming ASCII whitespace are not counted.
// Character model: Unicode code points of the UTF-8 encoded line, so "é" counts as 1.
// Word model: whitespace-separated tokens, excluding bracketed marker tokens such as
// "[PAUSE]" which are delivery cues rather than content.

// non_empty_lines returns the lines that contain at least one non-whitespace byte,
// in order, without their line terminators (interior whitespace is preserved).
[[nodiscard]] std::vector<std::string> non_empty_lines(std::string_view text);

// utf8_length counts code points; continuation bytes (10xxxxxx) are not counted.
[[nodiscard]] std::size_t utf8_length(std::string_view text) noexcept;

// is_marker_token reports whether token has the form "[NAME]" with a non-empty NAME.
[[nodiscard]] bool is_marker_token(std::string_view token) noexcept;

// word_count counts whitespace-separated tokens that are not marker tokens.
[[nodiscard]] std::size_t word_count(std::string_view text);

// count_marker counts occurrences of marker (e.g. "[PAUSE]") as a substring of text.
[[nodiscard]] std::size_t count_marker(std::string_view text, std::string_view marker);

}  // namespace cgate::core
