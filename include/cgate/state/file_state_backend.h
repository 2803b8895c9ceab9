#pragma once

#include "cgate/state/state_backend.h"

#include <filesystem>
#include <mutex>

namespace cgate::state {

// FileStateBackend stores records under a root directory:
//
//   <root>/<run_id>/state.json
//   <root>/<run_id>/checkpoints/<name>.json
//
// Every file is written to a sibling temporary file and renamed over the target, so a
// crash mid-write leaves the previous record intact. Checkpoint files are created
// once and never rewritten.
// Run ids that are not safe identifiers (core::is_safe_identifier) are refused
// with kInvalid.
class FileStateBackend final : public IStateBackend {
 public:
  explicit FileStateBackend(std::filesystem::path root);

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

  [[nodiscard]] std::filesystem::path state_path(const std::string& run_id) const;
  [[nodiscard]] std::filesystem::path checkpoint_path(const std::string& run_id,
                                                      const std::string& name) const;

 private:
  std::filesystem::path root_;
  std::mutex mutex_;
};

}  // namespace cgate::state
