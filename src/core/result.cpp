#include "cgate/core/result.h"

namespace cgate::core {

std::string store_error_code_to_string(StoreErrorCode code) {
  switch (code) {
    case StoreErrorCode::kNotFound:
      return "not_found";
    case StoreErrorCode::kAlreadyExists:
      return "already_exists";
    case StoreErrorCode::kCorrupted:
      return "corrupted";
    case StoreErrorCode::kInvalid:
      return "invalid";
    case StoreErrorCode::kInvalidTransition:
      return "invalid_transition";
    case StoreErrorCode::kIoFailure:
      return "io_failure";
  }
  return "unknown";
}

std::string classification_error_code_to_string(ClassificationErrorCode code) {
  switch (code) {
    case ClassificationErrorCode::kDuplicateId:
      return "duplicate_id";
    case ClassificationErrorCode::kEmptyCatalog:
      return "empty_catalog";
    case ClassificationErrorCode::kRuleFault:
      return "rule_fault";
    case ClassificationErrorCode::kCoverageMismatch:
      return "coverage_mismatch";
  }
  return "unknown";
}

}  // namespace cgate::core
