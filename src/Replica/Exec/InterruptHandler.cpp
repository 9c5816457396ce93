//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <system_error>

#include <unistd.h>

#include <Replica/Base/Logging.h>
#include <Replica/Exec/InterruptHandler.h>

using replica::exec::ScopedInterruptHandler;

namespace {

std::atomic<int> g_cancel_fd { -1 };
volatile std::sig_atomic_t g_last_signal = 0;

static_assert(std::atomic<int>::is_always_lock_free);

void OnInterrupt(const int signal_number)
{
  const int saved_errno = errno;
  g_last_signal = signal_number;
  if (const int fd = g_cancel_fd.load(); fd >= 0) {
    const std::uint64_t one = 1;
    (void)!::write(fd, &one, sizeof(one));
  }
  errno = saved_errno;
}

void Install(const int signal_number, struct sigaction& previous)
{
  struct sigaction action {};
  action.sa_handler = &OnInterrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;
  if (::sigaction(signal_number, &action, &previous) != 0) {
    throw std::system_error(errno, std::generic_category(), "sigaction");
  }
}

} // namespace

ScopedInterruptHandler::ScopedInterruptHandler(const ipc::CancelSource& source)
{
  int expected = -1;
  CHECK_F(g_cancel_fd.compare_exchange_strong(expected, source.NativeHandle()),
    "an interrupt handler is already installed");
  g_last_signal = 0;
  try {
    Install(SIGINT, previous_int_);
  } catch (const std::system_error&) {
    g_cancel_fd = -1;
    throw;
  }
  try {
    Install(SIGTERM, previous_term_);
  } catch (const std::system_error&) {
    (void)::sigaction(SIGINT, &previous_int_, nullptr);
    g_cancel_fd = -1;
    throw;
  }
  DLOG_F(1, "interrupt handler installed");
}

ScopedInterruptHandler::~ScopedInterruptHandler()
{
  (void)::sigaction(SIGTERM, &previous_term_, nullptr);
  (void)::sigaction(SIGINT, &previous_int_, nullptr);
  g_cancel_fd = -1;
  DLOG_F(1, "interrupt handler removed");
}

auto ScopedInterruptHandler::LastSignal() noexcept -> int
{
  return g_last_signal;
}
