#pragma once

#include <mutex>
#include <string>
#include <utility>

namespace cgate::core {

// IClock stamps state revisions, checkpoints and audit events with
// "YYYY-MM-DDTHH:MM:SSZ" strings.
class IClock {
 public:
  virtual ~IClock() = default;

  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Wall-clock UTC, second resolution.
class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

// Always the same instant.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string instant) : instant_(std::move(instant)) {}

  std::string now_iso8601() override;

 private:
  std::string instant_;
};

// One second later on every call, starting at 2026-01-01T00:00:00Z, so each state
// revision of a test run gets a distinct, reproducible timestamp. Thread-safe.
class SteppingClock final : public IClock {
 public:
  SteppingClock() = default;

  SteppingClock(const SteppingClock&) = delete;
  SteppingClock& operator=(const SteppingClock&) = delete;
  SteppingClock(SteppingClock&&) = delete;
  SteppingClock& operator=(SteppingClock&&) = delete;
  ~SteppingClock() override = default;

  std::string now_iso8601() override;

 private:
  std::mutex mutex_;
  long long elapsed_seconds_{0};
};

}  // namespace cgate::core
