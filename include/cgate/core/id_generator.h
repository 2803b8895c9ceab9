#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace cgate::core {

// is_safe_identifier: 1-64 characters from [A-Za-z0-9._-], not starting with '.'.
// Run ids become directory names under a file store and must pass this check.
[[nodiscard]] bool is_safe_identifier(std::string_view id) noexcept;

// IIdGenerator names runs ("run-...") and audit events ("evt-...").
// Every id it returns starts with "<prefix>-" and is a safe identifier when the
// prefix is one.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "<prefix>-<hex microseconds>-<counter>". Unique within a process; thread-safe.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;
  ~SystemIdGenerator() override = default;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// "<prefix>-<counter>" with one counter shared by every prefix, so audit trails
// recorded in tests are byte-stable. Thread-safe.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;
  ~DeterministicIdGenerator() override = default;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace cgate::core
