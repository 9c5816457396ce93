//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <fmt/format.h>

#include <Replica/Ipc/Errors.h>
#include <Replica/Mirror/Placeholder.h>
#include <Replica/Mirror/Worker.h>

using replica::log::kDebugVerbosity;
using replica::mirror::Worker;

// Worker code may run in a forked child: it logs through logger_ only.

Worker::Worker(Config config, WorkChannel& work, ResultChannel& results,
  log::Logger logger, ipc::CancelToken cancel)
  : config_(std::move(config))
  , work_(work)
  , results_(results)
  , logger_(std::move(logger))
  , cancel_(cancel)
{
}

auto Worker::Run() -> int
{
  logger_.Log(kDebugVerbosity, "worker {} started", config_.id);
  try {
    while (true) {
      const auto message = work_.Receive(cancel_);
      if (std::holds_alternative<StopMarker>(message)) {
        logger_.Log(kDebugVerbosity,
          "worker {} received its stop marker after {} tasks ({} failed)",
          config_.id, completed_ + failed_, failed_);
        return kStopped;
      }
      Process(std::get<Task>(message));
    }
  } catch (const ipc::OperationCancelled&) {
    logger_.Log(loguru::Verbosity_WARNING,
      "worker {} cancelled after {} tasks", config_.id, completed_ + failed_);
    return kCancelled;
  } catch (const ipc::ChannelError& ex) {
    logger_.Log(loguru::Verbosity_ERROR, "worker {} stopped: {}", config_.id,
      ex.what());
    return kChannelFailure;
  }
}

void Worker::Process(const Task& task)
{
  if (config_.task_delay && !cancel_.WaitFor(*config_.task_delay)) {
    throw ipc::OperationCancelled(
      fmt::format("worker {} delay before {}", config_.id, task.relative_path));
  }

  const auto target = config_.destination_root / task.relative_path;
  logger_.Log(kDebugVerbosity, "creating file {}", target.string());

  if (const auto written = WritePlaceholder(target, config_.placeholder_size);
    !written) {
    ++failed_;
    const auto reason = written.error().message();
    logger_.Log(loguru::Verbosity_ERROR, "cannot write {}: {}",
      target.string(), reason);
    results_.Send(
      TaskFailed { .relative_path = task.relative_path, .reason = reason },
      cancel_);
    return;
  }

  ++completed_;
  results_.Send(TaskCompleted { .absolute_path = target.string() }, cancel_);
}
