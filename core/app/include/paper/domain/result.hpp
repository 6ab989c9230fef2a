#pragma once

#include "paper/domain/error.hpp"

#include <utility>
#include <variant>

namespace paper {

// -----------------------------------------------------------------------------
// Result<T> - value or Error, returned across component boundaries
// -----------------------------------------------------------------------------
//
// @brief  Explicit success/failure return used instead of exceptions for
//         every rejection path (insufficient capital, no edge, duplicate
//         position, halted intake, ...).
//
// @details
// Implicitly constructible from either a T or an Error so call sites read
// naturally:
//
//   Result<ReservationToken> reserve(double amount) {
//     if (amount > available_) {
//       return makeError(ErrorKind::InsufficientCapital, "...");
//     }
//     return ReservationToken{...};
//   }
//
// Accessing value() on an error (or error() on a value) throws
// std::bad_variant_access; callers test ok() first.
//
// Thread model:
//   Value type, no shared state.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
  Result(Error error) : storage_(std::in_place_index<1>, std::move(error)) {}

  bool ok() const { return storage_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T& value() const& { return std::get<0>(storage_); }
  T& value() & { return std::get<0>(storage_); }
  T&& value() && { return std::get<0>(std::move(storage_)); }

  const Error& error() const { return std::get<1>(storage_); }
  ErrorKind kind() const { return error().kind; }

 private:
  std::variant<T, Error> storage_;
};

}  // namespace paper
