//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include <Replica/Base/Macros.h>
#include <Replica/Exec/ExecutionUnit.h>
#include <Replica/Log/LogRecord.h>

namespace replica::log {

/*!
  The single consumer of a LogChannel: receives every LogRecord published by
  the pipeline and emits it through loguru, in arrival order, until a
  LogStreamEnd arrives.

  The aggregator never observes cancellation. It keeps draining for as long
  as producers exist, which is what lets them publish with blocking sends.
  `Stop()` publishes the LogStreamEnd and joins the unit, so it must only be
  called once every producer that could still log has finished.

  In process mode the aggregator is forked before any other pipeline unit,
  while the host is still single threaded, which makes loguru safe to use in
  the child.
*/
class LogAggregator {
public:
  struct Config {
    exec::UnitKind unit { exec::UnitKind::kThread };
    std::string name { "log-aggregator" };
  };

  LogAggregator(LogChannel& channel, Config config);
  ~LogAggregator();

  REPLICA_MAKE_NON_COPYABLE(LogAggregator)
  REPLICA_MAKE_NON_MOVABLE(LogAggregator)

  void Start();

  //! Ends the stream and waits for the aggregator. Returns its exit status.
  auto Stop() -> int;

  [[nodiscard]] auto IsRunning() const noexcept -> bool
  {
    return unit_ && unit_->IsStarted() && !unit_->IsJoined();
  }

  //! Records emitted so far. Only tracked when the aggregator runs on a
  //! thread; a process aggregator reports its count in its own log.
  [[nodiscard]] auto RecordsEmitted() const noexcept -> std::size_t
  {
    return records_emitted_.load();
  }

private:
  auto Run() -> int;

  LogChannel& channel_;
  Config config_;
  std::unique_ptr<exec::ExecutionUnit> unit_;
  std::atomic<std::size_t> records_emitted_ { 0 };
};

//! Emits one record through loguru at the record's verbosity.
void EmitRecord(const LogRecord& record);

} // namespace replica::log
