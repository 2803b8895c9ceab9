#include "cgate/classification/dependency_mapper.h"

#include "cgate/core/normalization.h"
#include "cgate/core/text_metrics.h"

#include <algorithm>
#include <deque>
#include <set>

namespace cgate::classification {

namespace {

constexpr std::size_t kMaxTermWords = 2;
constexpr std::size_t kMinTermLength = 3;

bool is_article(const std::string& token) {
  return token == "a" || token == "an" || token == "the";
}

// Position of the first occurrence of needle in tokens, or tokens.size().
std::size_t find_phrase(const std::vector<std::string>& tokens,
                        const std::vector<std::string>& needle) {
  if (needle.empty() || needle.size() > tokens.size()) {
    return tokens.size();
  }
  for (std::size_t i = 0; i + needle.size() <= tokens.size(); ++i) {
    if (std::equal(needle.begin(), needle.end(), tokens.begin() + static_cast<std::ptrdiff_t>(i))) {
      return i;
    }
  }
  return tokens.size();
}

}  // namespace

bool DependencyMap::has_dependents(std::int64_t item_id) const {
  const auto it = dependents.find(item_id);
  return it != dependents.end() && !it->second.empty();
}

std::vector<std::int64_t> DependencyMap::dependents_of(std::int64_t item_id) const {
  const auto it = dependents.find(item_id);
  return it != dependents.end() ? it->second : std::vector<std::int64_t>{};
}

std::string extract_defined_term(const std::string& text,
                                 const std::vector<std::string>& definition_markers) {
  const auto tokens = core::tokenize_ascii(text);

  // Earliest marker occurrence wins; ties resolved by marker declaration order.
  std::size_t best_pos = tokens.size();
  for (const auto& marker : definition_markers) {
    const std::size_t pos = find_phrase(tokens, core::tokenize_ascii(marker));
    if (pos < best_pos && pos > 0) {
      best_pos = pos;
    }
  }
  if (best_pos == tokens.size()) {
    return "";
  }

  const std::size_t begin = best_pos > kMaxTermWords ? best_pos - kMaxTermWords : 0;
  std::vector<std::string> words(tokens.begin() + static_cast<std::ptrdiff_t>(begin),
                                 tokens.begin() + static_cast<std::ptrdiff_t>(best_pos));
  while (!words.empty() && is_article(words.front())) {
    words.erase(words.begin());
  }

  std::string term;
  for (const auto& w : words) {
    if (!term.empty()) {
      term += ' ';
    }
    term += w;
  }
  return term.size() >= kMinTermLength ? term : "";
}

std::vector<std::int64_t> delivery_order(
    const std::vector<domain::Item>& items,
    const std::map<std::int64_t, std::vector<std::int64_t>>& dependents) {
  std::map<std::int64_t, std::size_t> incoming;
  for (const auto& item : items) {
    incoming[item.item_id];
  }
  for (const auto& [definer, users] : dependents) {
    if (incoming.count(definer) == 0) {
      continue;
    }
    for (const auto user : users) {
      const auto it = incoming.find(user);
      if (it != incoming.end()) {
        ++it->second;
      }
    }
  }

  // Kahn's algorithm with a FIFO seeded in input order.
  std::deque<std::int64_t> ready;
  for (const auto& item : items) {
    if (incoming[item.item_id] == 0) {
      ready.push_back(item.item_id);
    }
  }
  std::vector<std::int64_t> order;
  order.reserve(items.size());
  std::set<std::int64_t> placed;
  while (!ready.empty()) {
    const auto current = ready.front();
    ready.pop_front();
    if (!placed.insert(current).second) {
      continue;
    }
    order.push_back(current);
    const auto it = dependents.find(current);
    if (it == dependents.end()) {
      continue;
    }
    for (const auto user : it->second) {
      auto in = incoming.find(user);
      if (in != incoming.end() && in->second > 0 && --in->second == 0) {
        ready.push_back(user);
      }
    }
  }

  for (const auto& item : items) {
    if (placed.insert(item.item_id).second) {
      order.push_back(item.item_id);
    }
  }
  return order;
}

DependencyMap map_dependencies(const std::vector<domain::Item>& items,
                               const std::vector<std::string>& definition_markers) {
  DependencyMap map;
  if (definition_markers.empty()) {
    map.suggested_order = delivery_order(items, map.dependents);
    return map;
  }

  for (const auto& item : items) {
    auto term = extract_defined_term(item.text, definition_markers);
    if (!term.empty()) {
      map.defined_terms[item.item_id] = std::move(term);
    }
  }

  std::vector<std::vector<std::string>> token_cache;
  token_cache.reserve(items.size());
  for (const auto& item : items) {
    token_cache.push_back(core::tokenize_ascii(item.text));
  }

  for (const auto& [definer_id, term] : map.defined_terms) {
    std::vector<std::int64_t> users;
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (items[i].item_id == definer_id) {
        continue;
      }
      if (core::contains_phrase(token_cache[i], term)) {
        users.push_back(items[i].item_id);
      }
    }
    if (!users.empty()) {
      std::sort(users.begin(), users.end());
      map.dependents[definer_id] = std::move(users);
    }
  }

  map.suggested_order = delivery_order(items, map.dependents);
  return map;
}

}  // namespace cgate::classification
