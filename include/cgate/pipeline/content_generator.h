#pragma once

#include "cgate/domain/assignment.h"
#include "cgate/domain/content_unit.h"
#include "cgate/domain/item.h"
#include "cgate/reporting/error_reporter.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cgate::pipeline {

// GenerationRequest asks the external generator for the units of one section.
// iteration is 1 for the first draft; later iterations carry the report of the
// previous attempt as feedback.
struct GenerationRequest {
  std::string section_id;                       // NOLINT(readability-identifier-naming)
  std::vector<domain::Item> items;              // items assigned to the section
  std::vector<domain::Assignment> assignments;  // same order as items
  std::size_t iteration{1};
  std::optional<reporting::Report> feedback;
};

// IContentGenerator is the port to the out-of-process content producer.
// Implementations are called from several pool workers at once and must be
// thread-safe. Failures are reported by throwing; the runner records them as a
// section failure.
class IContentGenerator {
 public:
  virtual ~IContentGenerator() = default;

  [[nodiscard]] virtual std::vector<domain::ContentUnit> generate(
      const GenerationRequest& request) = 0;

 protected:
  IContentGenerator() = default;
  IContentGenerator(const IContentGenerator&) = default;
  IContentGenerator& operator=(const IContentGenerator&) = default;
  IContentGenerator(IContentGenerator&&) = default;
  IContentGenerator& operator=(IContentGenerator&&) = default;
};

// RecordedContentGenerator replays units produced earlier, one list per iteration:
//
//   {"sections": {"<section>": [[unit, ...], [unit, ...]]}}
//
// An iteration beyond the recorded revisions returns the last revision again.
// generate() throws std::runtime_error for a section with no recording.
class RecordedContentGenerator final : public IContentGenerator {
 public:
  using Revisions = std::vector<std::vector<domain::ContentUnit>>;

  explicit RecordedContentGenerator(std::map<std::string, Revisions> recordings);

  [[nodiscard]] std::vector<domain::ContentUnit> generate(
      const GenerationRequest& request) override;

  [[nodiscard]] bool has_section(const std::string& section_id) const;

 private:
  std::map<std::string, Revisions> recordings_;
};

// Throws nlohmann::json::exception on a malformed document.
[[nodiscard]] RecordedContentGenerator recorded_generator_from_json(const nlohmann::json& j);

}  // namespace cgate::pipeline
