//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string_view>

#include <Replica/Exec/ExecutionUnit.h>
#include <Replica/Mirror/Messages.h>

namespace replica::mirror {

//! States of the pipeline teardown after an interruption.
enum class CancellationState {
  kRunning,
  kAborting,
  kDrained,
};

[[nodiscard]] constexpr auto to_string(const CancellationState state) noexcept
  -> std::string_view
{
  switch (state) {
  case CancellationState::kRunning:
    return "Running";
  case CancellationState::kAborting:
    return "Aborting";
  case CancellationState::kDrained:
    return "Drained";
  }
  return "__NotSupported__";
}

//! Receives pipeline milestones from the host thread, in the order they
//! happen. Has no influence on the run. All hooks default to doing nothing.
class PipelineObserver {
public:
  PipelineObserver() = default;
  virtual ~PipelineObserver() = default;

  PipelineObserver(const PipelineObserver&) = default;
  auto operator=(const PipelineObserver&) -> PipelineObserver& = default;
  PipelineObserver(PipelineObserver&&) = default;
  auto operator=(PipelineObserver&&) -> PipelineObserver& = default;

  virtual void OnUnitStarted(
    std::string_view /*name*/, exec::UnitKind /*kind*/)
  {
  }
  virtual void OnTaskPublished(std::string_view /*relative_path*/) { }
  virtual void OnStopMarkerPublished(std::uint32_t /*index*/) { }
  virtual void OnWorkerJoined(std::string_view /*name*/, int /*status*/) { }
  virtual void OnResultStreamClosed() { }
  virtual void OnCollectionReceived(const ResultCollection& /*collection*/) { }
  virtual void OnCancellationStateChanged(CancellationState /*state*/) { }
};

} // namespace replica::mirror
