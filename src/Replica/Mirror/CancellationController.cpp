//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Replica/Base/Logging.h>
#include <Replica/Ipc/Errors.h>
#include <Replica/Mirror/CancellationController.h>

using replica::mirror::CancellationController;
using replica::mirror::CancellationState;
using replica::mirror::DrainReport;

CancellationController::CancellationController(Config config,
  WorkChannel& work, ResultChannel& results, CollectionHandoff& handoff,
  std::span<const std::unique_ptr<exec::ExecutionUnit>> workers,
  exec::ExecutionUnit* receiver, PipelineObserver* observer)
  : config_(config)
  , work_(work)
  , results_(results)
  , handoff_(handoff)
  , workers_(workers)
  , receiver_(receiver)
  , observer_(observer)
{
}

void CancellationController::SetState(const CancellationState state)
{
  LOG_F(INFO, "cancellation: {} -> {}", to_string(state_), to_string(state));
  state_ = state;
  if (observer_ != nullptr) {
    observer_->OnCancellationStateChanged(state);
  }
}

void CancellationController::Abort()
{
  CHECK_F(state_ == CancellationState::kRunning,
    "abort requested while {}", to_string(state_));
  SetState(CancellationState::kAborting);

  for (const auto& worker : workers_) {
    if (IsOutstanding(worker.get())) {
      if (work_.TrySend(StopMarker {})) {
        ++report_.stop_markers_published;
      } else {
        DLOG_F(1, "work queue full, no stop marker for {}", worker->Name());
      }
    }
  }
  if (IsOutstanding(receiver_)) {
    report_.result_stream_end_published = results_.TrySend(ResultStreamEnd {});
  }
  LOG_F(1, "abort published {} stop markers{}", report_.stop_markers_published,
    report_.result_stream_end_published ? " and the result stream end" : "");
}

auto CancellationController::DrainQueuesOnce() -> std::size_t
{
  std::size_t removed = 0;
  while (work_.TryReceive()) {
    ++report_.work_messages_drained;
    ++removed;
  }
  while (results_.TryReceive()) {
    ++report_.result_messages_drained;
    ++removed;
  }
  return removed;
}

auto CancellationController::Drain() -> DrainReport
{
  CHECK_F(state_ == CancellationState::kAborting,
    "drain requested while {}", to_string(state_));

  // Release producers blocked on a full queue before joining them.
  (void)DrainQueuesOnce();

  for (const auto& worker : workers_) {
    if (IsOutstanding(worker.get())) {
      const int status = worker->Join();
      report_.worker_statuses.push_back(status);
      if (observer_ != nullptr) {
        observer_->OnWorkerJoined(worker->Name(), status);
      }
    }
  }
  if (IsOutstanding(receiver_)) {
    report_.receiver_status = receiver_->Join();
  }

  while (report_.drain_passes < config_.drain_attempts) {
    ++report_.drain_passes;
    if (DrainQueuesOnce() == 0) {
      report_.queues_empty = true;
      break;
    }
  }
  if (!report_.queues_empty) {
    LOG_F(WARNING, "queues not empty after {} drain passes",
      report_.drain_passes);
  }

  if (!handoff_.IsTaken()) {
    try {
      report_.stranded_collection = handoff_.TryTake();
    } catch (const ipc::ChannelError& ex) {
      LOG_F(WARNING, "stranded collection unreadable: {}", ex.what());
    }
  }

  SetState(CancellationState::kDrained);
  return report_;
}
