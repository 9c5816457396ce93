//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <Replica/Base/Macros.h>

namespace replica {

//! Sole owner of a POSIX file descriptor; closes it on destruction.
class UniqueFd {
public:
  UniqueFd() noexcept = default;
  explicit UniqueFd(int fd) noexcept
    : fd_(fd)
  {
  }

  ~UniqueFd() noexcept { Reset(); }

  REPLICA_MAKE_NON_COPYABLE(UniqueFd)

  UniqueFd(UniqueFd&& other) noexcept
    : fd_(other.Release())
  {
  }

  auto operator=(UniqueFd&& other) noexcept -> UniqueFd&
  {
    if (this != &other) {
      Reset(other.Release());
    }
    return *this;
  }

  [[nodiscard]] auto Get() const noexcept -> int { return fd_; }
  [[nodiscard]] auto Valid() const noexcept -> bool { return fd_ >= 0; }
  explicit operator bool() const noexcept { return Valid(); }

  //! Gives up ownership without closing and returns the descriptor.
  auto Release() noexcept -> int
  {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

  //! Closes the owned descriptor, if any, and takes ownership of `fd`.
  void Reset(int fd = -1) noexcept;

private:
  int fd_ { -1 };
};

} // namespace replica
