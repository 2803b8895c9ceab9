#include "cgate/core/id_generator.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

namespace cgate::core {

bool is_safe_identifier(std::string_view id) noexcept {
  if (id.empty() || id.size() > 64 || id.front() == '.') {
    return false;
  }
  return std::all_of(id.begin(), id.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_' || c == '-';
  });
}

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  std::ostringstream id;
  id << prefix << '-' << std::hex << micros << std::dec << '-'
     << counter_.fetch_add(1, std::memory_order_relaxed);
  return id.str();
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  return std::string(prefix) + "-" +
         std::to_string(counter_.fetch_add(1, std::memory_order_relaxed));
}

}  // namespace cgate::core
