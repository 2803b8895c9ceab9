#include "cgate/state/file_state_backend.h"

#include "cgate/core/id_generator.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace cgate::state {

namespace fs = std::filesystem;

namespace {

constexpr const char* kStateFile = "state.json";
constexpr const char* kCheckpointDir = "checkpoints";
constexpr const char* kRecordExtension = ".json";
constexpr const char* kTempSuffix = ".tmp";

core::StoreError io_error(const std::string& message) {
  return core::StoreError{core::StoreErrorCode::kIoFailure, message};
}

core::StoreError unsafe_run_id(const std::string& run_id) {
  return core::StoreError{core::StoreErrorCode::kInvalid,
                          "Run id '" + run_id + "' is not usable as a directory name"};
}

core::Result<std::optional<std::string>, core::StoreError> read_optional(const fs::path& path) {
  using R = core::Result<std::optional<std::string>, core::StoreError>;
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      return R::err(io_error("Cannot stat " + path.string() + ": " + ec.message()));
    }
    return R::ok(std::nullopt);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return R::err(io_error("Cannot open " + path.string()));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return R::err(io_error("Read failed for " + path.string()));
  }
  return R::ok(buffer.str());
}

// Write-temp-then-rename. rename() replaces the target atomically on POSIX filesystems.
core::Result<bool, core::StoreError> write_atomic(const fs::path& path, const std::string& data) {
  using R = core::Result<bool, core::StoreError>;
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    return R::err(io_error("Cannot create " + path.parent_path().string() + ": " + ec.message()));
  }

  fs::path temp = path;
  temp += kTempSuffix;
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return R::err(io_error("Cannot open " + temp.string() + " for writing"));
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      return R::err(io_error("Write failed for " + temp.string()));
    }
  }

  fs::rename(temp, path, ec);
  if (ec) {
    fs::remove(temp, ec);
    return R::err(io_error("Cannot rename into " + path.string()));
  }
  return R::ok(true);
}

}  // namespace

FileStateBackend::FileStateBackend(fs::path root) : root_(std::move(root)) {}

fs::path FileStateBackend::state_path(const std::string& run_id) const {
  return root_ / run_id / kStateFile;
}

fs::path FileStateBackend::checkpoint_path(const std::string& run_id,
                                           const std::string& name) const {
  return root_ / run_id / kCheckpointDir / (name + kRecordExtension);
}

core::Result<std::optional<std::string>, core::StoreError> FileStateBackend::load_current(
    const std::string& run_id) {
  if (!core::is_safe_identifier(run_id)) {
    return core::Result<std::optional<std::string>, core::StoreError>::err(unsafe_run_id(run_id));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return read_optional(state_path(run_id));
}

core::Result<bool, core::StoreError> FileStateBackend::store_current(const std::string& run_id,
                                                                     const std::string& record) {
  if (!core::is_safe_identifier(run_id)) {
    return core::Result<bool, core::StoreError>::err(unsafe_run_id(run_id));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return write_atomic(state_path(run_id), record);
}

core::Result<std::optional<std::string>, core::StoreError> FileStateBackend::load_checkpoint(
    const std::string& run_id, const std::string& name) {
  if (!core::is_safe_identifier(run_id)) {
    return core::Result<std::optional<std::string>, core::StoreError>::err(unsafe_run_id(run_id));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return read_optional(checkpoint_path(run_id, name));
}

core::Result<bool, core::StoreError> FileStateBackend::store_checkpoint(
    const std::string& run_id, const std::string& name, const std::string& record) {
  if (!core::is_safe_identifier(run_id)) {
    return core::Result<bool, core::StoreError>::err(unsafe_run_id(run_id));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto path = checkpoint_path(run_id, name);
  std::error_code ec;
  if (fs::exists(path, ec)) {
    return core::Result<bool, core::StoreError>::err(
        {core::StoreErrorCode::kAlreadyExists, "Checkpoint already exists: " + name});
  }
  return write_atomic(path, record);
}

core::Result<std::vector<std::string>, core::StoreError> FileStateBackend::list_checkpoints(
    const std::string& run_id) {
  using R = core::Result<std::vector<std::string>, core::StoreError>;
  if (!core::is_safe_identifier(run_id)) {
    return R::err(unsafe_run_id(run_id));
  }
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  const fs::path dir = root_ / run_id / kCheckpointDir;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return R::ok(std::move(names));
  }
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto& path = it->path();
    if (it->is_regular_file() && path.extension() == kRecordExtension) {
      names.push_back(path.stem().string());
    }
  }
  if (ec) {
    return R::err(io_error("Cannot list " + dir.string() + ": " + ec.message()));
  }
  std::sort(names.begin(), names.end());
  return R::ok(std::move(names));
}

}  // namespace cgate::state
