//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <string_view>

#include <Replica/Base/Macros.h>
#include <Replica/Base/UniqueFd.h>

namespace replica::ipc {

class CancelToken;

/*!
  Owner of a cancellation signal shared by every execution unit of a pipeline.

  The signal is an `eventfd` that is written once and never read, so once
  cancellation is requested the descriptor stays readable for everyone
  polling it, in this process and in any process forked after the source was
  created. `RequestCancel()` only performs a `write(2)` and is safe to call
  from a signal handler.
*/
class CancelSource {
public:
  CancelSource();
  ~CancelSource() noexcept = default;

  REPLICA_MAKE_NON_COPYABLE(CancelSource)
  REPLICA_DEFAULT_MOVABLE(CancelSource)

  //! Requests cancellation. Idempotent and async-signal-safe.
  void RequestCancel() const noexcept;

  [[nodiscard]] auto IsCancelRequested() const -> bool;

  [[nodiscard]] auto Token() const noexcept -> CancelToken;

  //! The eventfd, for use by code that must signal without an object.
  [[nodiscard]] auto NativeHandle() const noexcept -> int { return fd_.Get(); }

private:
  UniqueFd fd_;
};

//! Non-owning view of a CancelSource. A default constructed token can never
//! be cancelled.
class CancelToken {
public:
  CancelToken() noexcept = default;

  [[nodiscard]] auto CanBeCancelled() const noexcept -> bool
  {
    return fd_ >= 0;
  }

  [[nodiscard]] auto IsCancelled() const -> bool;

  //! Throws OperationCancelled naming `operation` when cancelled.
  void ThrowIfCancelled(std::string_view operation) const;

  //! Sleeps for `duration` or until cancellation, whichever comes first.
  //! Returns true when the full duration elapsed without cancellation.
  [[nodiscard]] auto WaitFor(std::chrono::milliseconds duration) const
    -> bool;

  //! The descriptor to poll for readability, or -1.
  [[nodiscard]] auto NativeHandle() const noexcept -> int { return fd_; }

private:
  friend class CancelSource;
  explicit CancelToken(const int fd) noexcept
    : fd_(fd)
  {
  }

  int fd_ { -1 };
};

} // namespace replica::ipc
