#include "cgate/core/text_metrics.h"

#include "cgate/core/normalization.h"

namespace cgate::core {

namespace {

bool is_ascii_space(char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

}  // namespace

std::vector<std::string> non_empty_lines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (!trim(line).empty()) {
      lines.emplace_back(line);
    }
    start = end + 1;
  }
  return lines;
}

std::size_t utf8_length(std::string_view text) noexcept {
  std::size_t count = 0;
  for (const char ch : text) {
    const auto byte = static_cast<unsigned char>(ch);
    if ((byte & 0xC0u) != 0x80u) {
      ++count;
    }
  }
  return count;
}

bool is_marker_token(std::string_view token) noexcept {
  return token.size() > 2 && token.front() == '[' && token.back() == ']';
}

std::size_t word_count(std::string_view text) {
  std::size_t count = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && is_ascii_space(text[i])) {
      ++i;
    }
    const std::size_t begin = i;
    while (i < text.size() && !is_ascii_space(text[i])) {
      ++i;
    }
    if (i > begin && !is_marker_token(text.substr(begin, i - begin))) {
      ++count;
    }
  }
  return count;
}

std::size_t count_marker(std::string_view text, std::string_view marker) {
  if (marker.empty()) {
    return 0;
  }
  std::size_t count = 0;
  std::size_t pos = text.find(marker);
  while (pos != std::string_view::npos) {
    ++count;
    pos = text.find(marker, pos + marker.size());
  }
  return count;
}

bool contains_phrase(const std::vector<std::string>& tokens, std::string_view phrase) {
  return count_phrase(tokens, phrase) > 0;
}

std::size_t count_phrase(const std::vector<std::string>& tokens, std::string_view phrase) {
  const auto needle = tokenize_ascii(phrase);
  if (needle.empty() || needle.size() > tokens.size()) {
    return 0;
  }

  std::size_t count = 0;
  std::size_t i = 0;
  while (i + needle.size() <= tokens.size()) {
    bool match = true;
    for (std::size_t k = 0; k < needle.size(); ++k) {
      if (tokens[i + k] != needle[k]) {
        match = false;
        break;
      }
    }
    if (match) {
      ++count;
      i += needle.size();
    } else {
      ++i;
    }
  }
  return count;
}

}  // namespace cgate::core
