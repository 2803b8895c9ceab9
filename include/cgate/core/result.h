#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace cgate::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

// StoreErrorCode classifies failures surfaced by the pipeline state store.
// kCorrupted: the persisted record cannot be parsed or fails its integrity check.
// kInvalid: the record parses but violates a cross-field consistency rule.
enum class StoreErrorCode {
  kNotFound,
  kAlreadyExists,
  kCorrupted,
  kInvalid,
  kInvalidTransition,
  kIoFailure,
};

// ClassificationErrorCode classifies batch-level classification failures.
// Any of these aborts the whole batch; no partial assignments are returned.
enum class ClassificationErrorCode {
  kDuplicateId,
  kEmptyCatalog,
  kRuleFault,
  kCoverageMismatch,
};

// StoreError pairs an error code with a human-readable detail message.
struct StoreError {
  StoreErrorCode code{StoreErrorCode::kIoFailure};
  std::string message;
};

struct ClassificationError {
  ClassificationErrorCode code{ClassificationErrorCode::kRuleFault};
  std::string message;
};

[[nodiscard]] std::string store_error_code_to_string(StoreErrorCode code);
[[nodiscard]] std::string classification_error_code_to_string(ClassificationErrorCode code);

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace cgate::core
