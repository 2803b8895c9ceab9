#include "cgate/core/clock.h"

#include <array>
#include <chrono>
#include <ctime>

namespace cgate::core {

namespace {

// 2026-01-01T00:00:00Z
constexpr std::time_t kSteppingStart = 1767225600;

std::string to_iso8601(std::time_t t) {
  std::tm utc{};
  gmtime_r(&t, &utc);
  std::array<char, sizeof "YYYY-MM-DDTHH:MM:SSZ"> buffer{};
  const auto n = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return {buffer.data(), n};
}

}  // namespace

std::string SystemClock::now_iso8601() {
  return to_iso8601(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

std::string FixedClock::now_iso8601() {
  return instant_;
}

std::string SteppingClock::now_iso8601() {
  std::lock_guard<std::mutex> lock(mutex_);
  return to_iso8601(kSteppingStart + static_cast<std::time_t>(elapsed_seconds_++));
}

}  // namespace cgate::core
