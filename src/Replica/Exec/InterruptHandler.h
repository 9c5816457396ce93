//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <csignal>

#include <Replica/Base/Macros.h>
#include <Replica/Ipc/CancelToken.h>

namespace replica::exec {

/*!
  Turns SIGINT and SIGTERM into a cancellation request for as long as the
  object lives, then restores the previous dispositions.

  The handler only writes to the CancelSource's eventfd. Only one handler
  may be installed at a time.
*/
class ScopedInterruptHandler {
public:
  explicit ScopedInterruptHandler(const ipc::CancelSource& source);
  ~ScopedInterruptHandler();

  REPLICA_MAKE_NON_COPYABLE(ScopedInterruptHandler)
  REPLICA_MAKE_NON_MOVABLE(ScopedInterruptHandler)

  //! The last signal delivered while a handler was installed, or 0.
  [[nodiscard]] static auto LastSignal() noexcept -> int;

private:
  struct sigaction previous_int_ {};
  struct sigaction previous_term_ {};
};

} // namespace replica::exec
