//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

#include <Replica/Ipc/CancelToken.h>
#include <Replica/Log/Logger.h>
#include <Replica/Mirror/Messages.h>

namespace replica::mirror {

/*!
  Consumes the work queue until it receives a StopMarker.

  For every Task the worker writes a placeholder at the mirrored path under
  the destination root and publishes a TaskCompleted with the absolute path
  of the file. When the file cannot be written it publishes a TaskFailed
  instead and moves on to the next task; nothing is retried.

  The parent directory of every task was created by the host before the task
  was published. Workers never create directories.

  `Run()` is the body of the worker's execution unit and reports how the
  worker ended through its return value.
*/
class Worker {
public:
  struct Config {
    std::uint32_t id { 0 };
    //! Absolute destination root.
    std::filesystem::path destination_root;
    std::size_t placeholder_size { 1024 };
    std::optional<std::chrono::milliseconds> task_delay;
  };

  //! Ended on its StopMarker.
  static constexpr int kStopped = 0;
  //! Ended because cancellation was requested.
  static constexpr int kCancelled = 10;
  //! Ended because a channel failed.
  static constexpr int kChannelFailure = 11;

  Worker(Config config, WorkChannel& work, ResultChannel& results,
    log::Logger logger, ipc::CancelToken cancel);

  auto Run() -> int;

  [[nodiscard]] auto TasksCompleted() const noexcept { return completed_; }
  [[nodiscard]] auto TasksFailed() const noexcept { return failed_; }

private:
  void Process(const Task& task);

  Config config_;
  WorkChannel& work_;
  ResultChannel& results_;
  log::Logger logger_;
  ipc::CancelToken cancel_;
  std::size_t completed_ { 0 };
  std::size_t failed_ { 0 };
};

} // namespace replica::mirror
