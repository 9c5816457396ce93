//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <sys/types.h>

#include <Replica/Exec/ExecutionUnit.h>

namespace replica::exec {

/*!
  Runs the body in a child process created with `fork()`.

  The child ignores SIGINT and SIGTERM so that an interactive interrupt is
  seen only by the host, which then cancels the pipeline through its
  channels. The child never returns into the caller's code: it leaves with
  `_Exit` and the body's status, skipping destructors and atexit handlers of
  the inherited host state. The child does not log through loguru, whose
  locks may have been held by another host thread at the time of the fork.

  `Join()` maps a normal exit to its exit code and a death by signal to
  `128 + signal`, the shell convention.
*/
class ProcessUnit final : public ExecutionUnit {
public:
  ProcessUnit(std::string name, Body body);
  ~ProcessUnit() override;

  REPLICA_MAKE_NON_COPYABLE(ProcessUnit)
  REPLICA_MAKE_NON_MOVABLE(ProcessUnit)

  void Start() override;
  auto Join() -> int override;

  [[nodiscard]] auto Kind() const noexcept -> UnitKind override
  {
    return UnitKind::kProcess;
  }

  [[nodiscard]] auto Pid() const noexcept -> pid_t { return pid_; }

private:
  [[noreturn]] void RunChild() noexcept;

  pid_t pid_ { -1 };
};

} // namespace replica::exec
