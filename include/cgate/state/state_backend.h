#pragma once

#include "cgate/core/result.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cgate::state {

// IStateBackend is the persistence port of the state store. It moves opaque encoded
// records; it never interprets them.
//
// Contract:
// - store_current replaces the live record atomically: a concurrent or later load
//   sees either the old record or the new one, never a mix.
// - store_checkpoint never overwrites; an existing name yields kAlreadyExists.
// - load_* return nullopt when nothing is stored under the key.
// - list_checkpoints returns names in ascending lexicographic order.
// - I/O failures are reported as kIoFailure.
class IStateBackend {
 public:
  virtual ~IStateBackend() = default;

  [[nodiscard]] virtual core::Result<std::optional<std::string>, core::StoreError> load_current(
      const std::string& run_id) = 0;
  [[nodiscard]] virtual core::Result<bool, core::StoreError> store_current(
      const std::string& run_id, const std::string& record) = 0;

  [[nodiscard]] virtual core::Result<std::optional<std::string>, core::StoreError>
  load_checkpoint(const std::string& run_id, const std::string& name) = 0;
  [[nodiscard]] virtual core::Result<bool, core::StoreError> store_checkpoint(
      const std::string& run_id, const std::string& name, const std::string& record) = 0;
  [[nodiscard]] virtual core::Result<std::vector<std::string>, core::StoreError>
  list_checkpoints(const std::string& run_id) = 0;

 protected:
  IStateBackend() = default;
  IStateBackend(const IStateBackend&) = default;
  IStateBackend& operator=(const IStateBackend&) = default;
  IStateBackend(IStateBackend&&) = default;
  IStateBackend& operator=(IStateBackend&&) = default;
};

// In-memory backend for tests and dry runs. Thread-safe.
class InMemoryStateBackend final : public IStateBackend {
 public:
  [[nodiscard]] core::Result<std::optional<std::string>, core::StoreError> load_current(
      const std::string& run_id) override;
  [[nodiscard]] core::Result<bool, core::StoreError> store_current(
      const std::string& run_id, const std::string& record) override;
  [[nodiscard]] core::Result<std::optional<std::string>, core::StoreError> load_checkpoint(
      const std::string& run_id, const std::string& name) override;
  [[nodiscard]] core::Result<bool, core::StoreError> store_checkpoint(
      const std::string& run_id, const std::string& name, const std::string& record) override;
  [[nodiscard]] core::Result<std::vector<std::string>, core::StoreError> list_checkpoints(
      const std::string& run_id) override;

  // Replaces the live record without going through a store; used to simulate
  // external damage in tests.
  void overwrite_current(const std::string& run_id, std::string record);

 private:
  std::mutex mutex_;
  std::map<std::string, std::string> current_;
  std::map<std::pair<std::string, std::string>, std::string> checkpoints_;
};

}  // namespace cgate::state
