#include "cgate/state/state_backend.h"

namespace cgate::state {

core::Result<std::optional<std::string>, core::StoreError> InMemoryStateBackend::load_current(
    const std::string& run_id) {
  using R = core::Result<std::optional<std::string>, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = current_.find(run_id);
  if (it == current_.end()) {
    return R::ok(std::nullopt);
  }
  return R::ok(it->second);
}

core::Result<bool, core::StoreError> InMemoryStateBackend::store_current(
    const std::string& run_id, const std::string& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_[run_id] = record;
  return core::Result<bool, core::StoreError>::ok(true);
}

core::Result<std::optional<std::string>, core::StoreError> InMemoryStateBackend::load_checkpoint(
    const std::string& run_id, const std::string& name) {
  using R = core::Result<std::optional<std::string>, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = checkpoints_.find({run_id, name});
  if (it == checkpoints_.end()) {
    return R::ok(std::nullopt);
  }
  return R::ok(it->second);
}

core::Result<bool, core::StoreError> InMemoryStateBackend::store_checkpoint(
    const std::string& run_id, const std::string& name, const std::string& record) {
  using R = core::Result<bool, core::StoreError>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!checkpoints_.emplace(std::make_pair(run_id, name), record).second) {
    return R::err({core::StoreErrorCode::kAlreadyExists, "Checkpoint already exists: " + name});
  }
  return R::ok(true);
}

core::Result<std::vector<std::string>, core::StoreError> InMemoryStateBackend::list_checkpoints(
    const std::string& run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto& [key, _] : checkpoints_) {
    if (key.first == run_id) {
      names.push_back(key.second);
    }
  }
  return core::Result<std::vector<std::string>, core::StoreError>::ok(std::move(names));
}

void InMemoryStateBackend::overwrite_current(const std::string& run_id, std::string record) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_[run_id] = std::move(record);
}

}  // namespace cgate::state
