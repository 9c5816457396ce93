//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cerrno>
#include <cstdint>
#include <system_error>
#include <thread>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <fmt/format.h>

#include <Replica/Ipc/CancelToken.h>
#include <Replica/Ipc/Errors.h>

using replica::ipc::CancelSource;
using replica::ipc::CancelToken;

namespace {

//! Polls `fd` for readability for at most `timeout_ms`. Returns true when it
//! is readable.
auto PollReadable(const int fd, const int timeout_ms) -> bool
{
  pollfd pfd { .fd = fd, .events = POLLIN, .revents = 0 };
  while (true) {
    const int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc >= 0) {
      return rc > 0 && (pfd.revents & POLLIN) != 0;
    }
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "poll");
    }
  }
}

} // namespace

CancelSource::CancelSource()
  : fd_(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK))
{
  if (!fd_) {
    throw std::system_error(
      errno, std::generic_category(), "eventfd for cancellation");
  }
}

void CancelSource::RequestCancel() const noexcept
{
  if (!fd_) {
    return;
  }
  const std::uint64_t one = 1;
  // Only write(2) here: this runs from signal handlers. A full counter
  // (EAGAIN) means cancellation was already requested.
  const ssize_t rc = ::write(fd_.Get(), &one, sizeof(one));
  (void)rc;
}

auto CancelSource::IsCancelRequested() const -> bool
{
  return fd_ && PollReadable(fd_.Get(), 0);
}

auto CancelSource::Token() const noexcept -> CancelToken
{
  return CancelToken { fd_.Get() };
}

auto CancelToken::IsCancelled() const -> bool
{
  return CanBeCancelled() && PollReadable(fd_, 0);
}

void CancelToken::ThrowIfCancelled(const std::string_view operation) const
{
  if (IsCancelled()) {
    throw OperationCancelled(fmt::format("{} cancelled", operation));
  }
}

auto CancelToken::WaitFor(const std::chrono::milliseconds duration) const
  -> bool
{
  if (duration.count() <= 0) {
    return !IsCancelled();
  }
  if (!CanBeCancelled()) {
    std::this_thread::sleep_for(duration);
    return true;
  }
  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (true) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      return !IsCancelled();
    }
    if (PollReadable(fd_, static_cast<int>(left.count()))) {
      return false;
    }
  }
}
