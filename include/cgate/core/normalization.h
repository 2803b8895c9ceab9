#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cgate::core {

// Deterministic ASCII-only normalization utilities.
// Locale-independent and byte-stable across platforms and compilers:
// - ASCII lowercasing via explicit char math (no std::tolower)
// - Non-alphanumeric bytes act as delimiters
// - Non-ASCII bytes are treated as delimiters by tokenize_ascii and preserved by
//   normalize_ascii_lower

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// tokenize_ascii lowercases input, splits on non-alphanumeric bytes, and drops
// tokens shorter than min_length. Tokens are returned in encounter order.
inline std::vector<std::string> tokenize_ascii(const std::string_view input,
                                               const std::size_t min_length = 1) {
  std::vector<std::string> tokens;
  std::string current;

  const auto flush = [&]() {
    if (!current.empty() && current.size() >= min_length) {
      tokens.push_back(current);
    }
    current.clear();
  };

  for (const char ch : input) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
      current.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      current.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      flush();
    }
  }
  flush();

  return tokens;
}

// trim removes leading and trailing ASCII whitespace (space, tab, CR, LF).
inline std::string trim(const std::string_view input) {
  const auto is_space = [](char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
  };

  std::size_t start = 0;
  while (start < input.size() && is_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_space(input[end - 1])) {
    --end;
  }
  return std::string{input.substr(start, end - start)};
}

// contains_phrase reports whether the token sequence of phrase occurs contiguously
// in tokens. An empty phrase never matches.
[[nodiscard]] bool contains_phrase(const std::vector<std::string>& tokens,
                                   std::string_view phrase);

// count_phrase counts non-overlapping contiguous occurrences of phrase in tokens.
[[nodiscard]] std::size_t count_phrase(const std::vector<std::string>& tokens,
                                       std::string_view phrase);

}  // namespace cgate::core
