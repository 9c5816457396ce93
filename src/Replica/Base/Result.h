//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

/*!
  \file Result.h
  \brief Value-or-error return type used by the wire codec and the file
  collaborators.

  `Result<T>` holds either a `T` or a `std::error_code`. Errors are expected
  outcomes of decoding a datagram or writing a file; they are converted to
  exceptions only at the channel boundary, where a malformed message is a
  protocol failure.
*/

#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace replica {

//! The outcome of an operation: a value of type T or an error code.
template <typename T> class Result {
public:
  //! Initializes the Result with a value.
  explicit(false) constexpr Result(T value) noexcept(
    std::is_nothrow_move_constructible_v<T>)
    : value_(std::move(value))
  {
  }

  //! Initializes the Result with an error code.
  explicit(false) Result(std::error_code error) noexcept
    : value_(error)
  {
  }

  [[nodiscard]] constexpr auto has_value() const noexcept -> bool
  {
    return std::holds_alternative<T>(value_);
  }

  [[nodiscard]] constexpr auto value() const& -> const T&
  {
    return std::get<T>(value_);
  }

  constexpr auto value() && -> T&& { return std::get<T>(std::move(value_)); }

  //! Moves the value out of the Result.
  constexpr auto move_value() -> T { return std::get<T>(std::move(value_)); }

  [[nodiscard]] constexpr auto error() const -> const std::error_code&
  {
    return std::get<std::error_code>(value_);
  }

  constexpr explicit operator bool() const noexcept { return has_value(); }

  template <typename U>
  constexpr auto value_or(U&& default_value) const& -> T
  {
    return has_value() ? value()
                       : static_cast<T>(std::forward<U>(default_value));
  }

  constexpr auto operator*() const& -> const T& { return value(); }
  constexpr auto operator*() & -> T& { return std::get<T>(value_); }

  constexpr auto operator->() const -> const T* { return &value(); }

private:
  std::variant<T, std::error_code> value_;
};

//! Specialization for operations that only report success or failure.
template <> class Result<void> {
public:
  constexpr Result() noexcept
    : value_(std::monostate {})
  {
  }

  explicit(false) Result(std::error_code error) noexcept
    : value_(error)
  {
  }

  [[nodiscard]] constexpr auto has_value() const noexcept -> bool
  {
    return std::holds_alternative<std::monostate>(value_);
  }

  [[nodiscard]] constexpr auto error() const -> const std::error_code&
  {
    return std::get<std::error_code>(value_);
  }

  constexpr explicit operator bool() const noexcept { return has_value(); }

private:
  std::variant<std::monostate, std::error_code> value_;
};

//! Evaluates an expression returning a Result and, if it holds an error,
//! returns that error from the enclosing function.
#define CHECK_RESULT(expr)                                                     \
  if (const auto& result_ = (expr); !result_)                                  \
  return result_.error()

} // namespace replica
