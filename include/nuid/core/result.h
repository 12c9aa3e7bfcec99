#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>

namespace nuid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// They are reserved for caller-supplied data; environmental failures throw instead.

enum class DecodeError {
  kEmpty,
  kInvalidCharacter,
  kInvalidLength,
  kOverflow,
};

enum class StateError {
  kInvalidPrefixLength,
  kInvalidPrefixCharacter,
  kSequenceOutOfRange,
  kIncrementOutOfRange,
};

// Stable, human-readable names for diagnostics and JSON output.
constexpr std::string_view to_string(const DecodeError error) noexcept {
  switch (error) {
    case DecodeError::kEmpty:
      return "empty input";
    case DecodeError::kInvalidCharacter:
      return "character outside the base62 alphabet";
    case DecodeError::kInvalidLength:
      return "invalid length";
    case DecodeError::kOverflow:
      return "value does not fit in 64 bits";
  }
  return "unknown decode error";
}

constexpr std::string_view to_string(const StateError error) noexcept {
  switch (error) {
    case StateError::kInvalidPrefixLength:
      return "prefix must be exactly 12 characters";
    case StateError::kInvalidPrefixCharacter:
      return "prefix contains a character outside the base62 alphabet";
    case StateError::kSequenceOutOfRange:
      return "sequence must be below 62^10";
    case StateError::kIncrementOutOfRange:
      return "increment must be in [33, 333)";
  }
  return "unknown state error";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace nuid::core
