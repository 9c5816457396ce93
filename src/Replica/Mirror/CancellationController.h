//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <Replica/Base/Macros.h>
#include <Replica/Exec/ExecutionUnit.h>
#include <Replica/Mirror/Messages.h>
#include <Replica/Mirror/PipelineObserver.h>

namespace replica::mirror {

//! What tearing down an interrupted pipeline found and did.
struct DrainReport {
  std::uint32_t stop_markers_published { 0 };
  bool result_stream_end_published { false };
  //! Exit status of every worker joined during the drain, in join order.
  std::vector<int> worker_statuses;
  std::optional<int> receiver_status;
  std::size_t work_messages_drained { 0 };
  std::size_t result_messages_drained { 0 };
  std::uint32_t drain_passes { 0 };
  //! Both queues were observed empty before the drain bound was reached.
  bool queues_empty { false };
  //! A collection the receiver delivered but the host never took.
  std::optional<ResultCollection> stranded_collection;
};

/*!
  Tears the pipeline down after an interruption: Running, then Aborting,
  then Drained.

  `Abort()` publishes, without blocking, the same termination messages as a
  normal shutdown: one StopMarker per worker still outstanding and one
  ResultStreamEnd if the receiver is still outstanding. A message that does
  not fit a full queue is skipped; the units observe cancellation anyway.

  `Drain()` joins every outstanding worker, then the receiver, then empties
  the work and result queues with a bounded number of non-blocking passes,
  and finally takes, without blocking, a collection the receiver may have
  delivered that nobody took.

  The log channel is not handled here: the host stops the log aggregator
  after the drain, once no unit can log anymore.
*/
class CancellationController {
public:
  struct Config {
    std::uint32_t drain_attempts { 64 };
  };

  CancellationController(Config config, WorkChannel& work,
    ResultChannel& results, CollectionHandoff& handoff,
    std::span<const std::unique_ptr<exec::ExecutionUnit>> workers,
    exec::ExecutionUnit* receiver, PipelineObserver* observer = nullptr);

  REPLICA_MAKE_NON_COPYABLE(CancellationController)
  REPLICA_MAKE_NON_MOVABLE(CancellationController)

  ~CancellationController() = default;

  [[nodiscard]] auto State() const noexcept { return state_; }

  //! Running to Aborting.
  void Abort();

  //! Aborting to Drained. Returns what the teardown did.
  auto Drain() -> DrainReport;

private:
  void SetState(CancellationState state);

  //! Empties both queues once. Returns the number of messages removed.
  auto DrainQueuesOnce() -> std::size_t;

  static auto IsOutstanding(const exec::ExecutionUnit* unit) noexcept -> bool
  {
    return unit != nullptr && unit->IsStarted() && !unit->IsJoined();
  }

  Config config_;
  WorkChannel& work_;
  ResultChannel& results_;
  CollectionHandoff& handoff_;
  std::span<const std::unique_ptr<exec::ExecutionUnit>> workers_;
  exec::ExecutionUnit* receiver_;
  PipelineObserver* observer_;
  CancellationState state_ { CancellationState::kRunning };
  DrainReport report_;
};

} // namespace replica::mirror
