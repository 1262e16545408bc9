#pragma once

#include <utility>
#include <variant>

namespace flakeid::core {

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
//
// T and E must be distinct types.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  explicit Result(std::in_place_index_t<0> tag, T value) : data_(tag, std::move(value)) {}
  explicit Result(std::in_place_index_t<1> tag, E error) : data_(tag, std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace flakeid::core
