//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <system_error>

#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

#include <Replica/Base/Logging.h>
#include <Replica/Exec/ProcessUnit.h>

using replica::exec::ProcessUnit;

ProcessUnit::ProcessUnit(std::string name, Body body)
  : ExecutionUnit(std::move(name), std::move(body))
{
}

ProcessUnit::~ProcessUnit()
{
  if (IsStarted() && !IsJoined()) {
    LOG_F(WARNING, "process unit '{}' (pid {}) destroyed while running, joining",
      Name(), pid_);
    try {
      Join();
    } catch (const std::system_error& ex) {
      LOG_F(ERROR, "process unit '{}': {}", Name(), ex.what());
    }
  }
}

void ProcessUnit::Start()
{
  CHECK_F(!IsStarted(), "process unit '{}' started twice", Name());
  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::system_error(
      errno, std::generic_category(), fmt::format("fork '{}'", Name()));
  }
  if (pid == 0) {
    RunChild();
  }
  pid_ = pid;
  MarkStarted();
  DLOG_F(1, "process unit '{}' started as pid {}", Name(), pid_);
}

void ProcessUnit::RunChild() noexcept
{
  (void)std::signal(SIGINT, SIG_IGN);
  (void)std::signal(SIGTERM, SIG_IGN);
  const int status = RunBody([this](std::string_view what) {
    const auto line
      = fmt::format("replica: unit '{}' (pid {}) failed: {}\n", Name(),
        ::getpid(), what);
    (void)::write(STDERR_FILENO, line.data(), line.size());
  });
  std::_Exit(status);
}

auto ProcessUnit::Join() -> int
{
  CHECK_F(IsStarted(), "process unit '{}' joined before start", Name());
  if (const auto status = ExitStatus()) {
    return *status;
  }
  int raw = 0;
  while (::waitpid(pid_, &raw, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(),
        fmt::format("waitpid '{}' (pid {})", Name(), pid_));
    }
  }
  int status = 0;
  if (WIFEXITED(raw)) {
    status = WEXITSTATUS(raw);
  } else if (WIFSIGNALED(raw)) {
    status = 128 + WTERMSIG(raw);
    LOG_F(WARNING, "process unit '{}' (pid {}) killed by signal {}", Name(),
      pid_, WTERMSIG(raw));
  }
  MarkJoined(status);
  DLOG_F(1, "process unit '{}' joined with status {}", Name(), status);
  return status;
}
