#include "cgate/config/config_loader.h"

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace cgate::config {

namespace {

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return buffer.str();
}

}  // namespace

core::Result<PipelineConfig, std::string> load_pipeline_config(const std::string& path,
                                                               std::chrono::milliseconds backoff) {
  using R = core::Result<PipelineConfig, std::string>;

  auto content = read_file(path);
  if (!content.has_value()) {
    // Single retry for transient read failures (file being replaced, slow mount).
    std::this_thread::sleep_for(backoff);
    content = read_file(path);
  }
  if (!content.has_value()) {
    return R::err("Failed to read config file: " + path);
  }

  try {
    return R::ok(pipeline_config_from_json(nlohmann::json::parse(content.value())));
  } catch (const nlohmann::json::exception& e) {
    return R::err("Malformed config " + path + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    return R::err("Invalid config " + path + ": " + e.what());
  }
}

}  // namespace cgate::config
