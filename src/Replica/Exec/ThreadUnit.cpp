//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Replica/Base/Logging.h>
#include <Replica/Exec/ThreadUnit.h>

using replica::exec::ThreadUnit;

ThreadUnit::ThreadUnit(std::string name, Body body)
  : ExecutionUnit(std::move(name), std::move(body))
{
}

ThreadUnit::~ThreadUnit()
{
  if (IsStarted() && !IsJoined()) {
    LOG_F(WARNING, "thread unit '{}' destroyed while running, joining",
      Name());
    Join();
  }
}

void ThreadUnit::Start()
{
  CHECK_F(!IsStarted(), "thread unit '{}' started twice", Name());
  thread_ = std::thread([this] {
    loguru::set_thread_name(Name().c_str());
    body_status_ = RunBody([this](std::string_view what) {
      LOG_F(ERROR, "unit '{}' failed: {}", Name(), what);
    });
  });
  MarkStarted();
  DLOG_F(1, "thread unit '{}' started", Name());
}

auto ThreadUnit::Join() -> int
{
  CHECK_F(IsStarted(), "thread unit '{}' joined before start", Name());
  if (const auto status = ExitStatus()) {
    return *status;
  }
  thread_.join();
  MarkJoined(body_status_);
  DLOG_F(1, "thread unit '{}' joined with status {}", Name(), body_status_);
  return body_status_;
}
