//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <Replica/Base/Macros.h>
#include <Replica/Exec/ExecutionUnit.h>
#include <Replica/Ipc/CancelToken.h>
#include <Replica/Log/LogAggregator.h>
#include <Replica/Log/Logger.h>
#include <Replica/Mirror/CancellationController.h>
#include <Replica/Mirror/Errors.h>
#include <Replica/Mirror/Messages.h>
#include <Replica/Mirror/MirrorConfig.h>
#include <Replica/Mirror/PipelineObserver.h>
#include <Replica/Mirror/Receiver.h>
#include <Replica/Mirror/Verifier.h>
#include <Replica/Mirror/Worker.h>

namespace replica::mirror {

//! Outcome of a run that was not interrupted.
struct MirrorReport {
  std::filesystem::path source;
  std::filesystem::path destination;
  std::size_t directories_created { 0 };
  std::size_t tasks_published { 0 };
  std::uint32_t stop_markers_published { 0 };
  //! Workers that ended on their stop marker.
  std::uint32_t stop_markers_consumed { 0 };
  std::uint32_t workers_joined { 0 };
  //! TaskCompleted messages the receiver got, duplicates included.
  std::size_t results_received { 0 };
  std::vector<TaskFailed> failures;
  std::uint32_t duplicates { 0 };
  bool count_mismatch { false };
  VerificationReport verification;

  //! Every non-fatal error kind the run ran into.
  [[nodiscard]] auto Errors() const -> std::vector<MirrorError>;
  //! The most severe of Errors(), which decides the exit code.
  [[nodiscard]] auto WorstError() const -> std::optional<MirrorError>;
  [[nodiscard]] auto Succeeded() const -> bool { return Errors().empty(); }
};

/*!
  Mirrors a source tree into a new destination tree with a pool of workers.

  The host owns the whole pipeline: it validates the paths, creates the
  destination root, starts the log aggregator, then the receiver, then the
  workers, walks the source tree creating every directory itself and
  publishing one Task per file, publishes one StopMarker per worker, joins
  the workers, closes the result stream, takes the collection from the
  receiver, joins it, verifies the result and finally stops the log
  aggregator.

  ### Failure Modes
  - Unusable paths: PathError before anything is created.
  - Cancellation, from RequestCancel() or a signal handler bound to
    GetCancelSource(): the pipeline is aborted and drained, then Interrupted
    is thrown.
  - Any other exception: the pipeline is cancelled, aborted and drained, and
    the exception is rethrown.
  - Count mismatch, structural mismatch and write failures are reported in
    the MirrorReport.

  A Replicator runs once.
*/
class Replicator {
public:
  Replicator(std::filesystem::path source, std::filesystem::path destination,
    MirrorConfig config = {});
  ~Replicator();

  REPLICA_MAKE_NON_COPYABLE(Replicator)
  REPLICA_MAKE_NON_MOVABLE(Replicator)

  //! Observer notified from the host thread. Must outlive Run().
  void SetObserver(PipelineObserver* observer) noexcept
  {
    observer_ = observer;
  }

  auto Run() -> MirrorReport;

  [[nodiscard]] auto GetCancelSource() const noexcept
    -> const ipc::CancelSource&
  {
    return cancel_;
  }

  //! Async-signal-safe.
  void RequestCancel() const noexcept { cancel_.RequestCancel(); }

  [[nodiscard]] auto Source() const noexcept -> const std::filesystem::path&
  {
    return source_;
  }
  [[nodiscard]] auto Destination() const noexcept
    -> const std::filesystem::path&
  {
    return destination_;
  }

private:
  void ValidateConfig() const;
  void ValidatePaths() const;
  void CreatePipeline();
  void StartUnit(exec::ExecutionUnit& unit);
  void StartPipeline();
  void PublishTree(MirrorReport& report);
  void PublishStopMarkers(MirrorReport& report);
  void JoinWorkers(MirrorReport& report);
  auto CollectResults() -> ResultCollection;
  void Evaluate(const ResultCollection& collection, MirrorReport& report);
  void AbortAndDrain();
  void StopLogAggregator();

  std::filesystem::path source_;
  std::filesystem::path destination_;
  MirrorConfig config_;
  ipc::CancelSource cancel_;
  PipelineObserver* observer_ { nullptr };
  bool ran_ { false };

  // Created only once the paths are valid. Declared before the units so
  // that they outlive them.
  std::unique_ptr<log::LogChannel> log_channel_;
  std::unique_ptr<WorkChannel> work_;
  std::unique_ptr<ResultChannel> results_;
  std::unique_ptr<CollectionHandoff> handoff_;
  log::Logger logger_;

  std::unique_ptr<log::LogAggregator> aggregator_;
  std::unique_ptr<Receiver> receiver_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::unique_ptr<exec::ExecutionUnit> receiver_unit_;
  std::vector<std::unique_ptr<exec::ExecutionUnit>> worker_units_;
};

} // namespace replica::mirror
