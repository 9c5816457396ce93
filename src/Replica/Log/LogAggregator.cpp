//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <chrono>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <Replica/Base/Logging.h>
#include <Replica/Ipc/Errors.h>
#include <Replica/Log/LogAggregator.h>

using replica::log::LogAggregator;

void replica::log::EmitRecord(const LogRecord& record)
{
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::chrono::seconds;

  // A forwarded record never aborts the aggregator.
  const auto verbosity = std::max<loguru::Verbosity>(
    record.verbosity, loguru::Verbosity_ERROR);
  const auto since_epoch = record.timestamp.time_since_epoch();
  const auto millis
    = duration_cast<milliseconds>(since_epoch - duration_cast<seconds>(since_epoch));
  const auto whole_seconds
    = std::chrono::time_point_cast<seconds>(record.timestamp);
  VLOG_F(verbosity, "[{}] {:%H:%M:%S}.{:03} {}", record.origin, whole_seconds,
    millis.count(), record.message);
}

LogAggregator::LogAggregator(LogChannel& channel, Config config)
  : channel_(channel)
  , config_(std::move(config))
{
}

LogAggregator::~LogAggregator()
{
  if (IsRunning()) {
    LOG_F(WARNING, "{} destroyed while running, stopping it", config_.name);
    try {
      (void)Stop();
    } catch (const std::exception& ex) {
      LOG_F(ERROR, "{}: stop failed: {}", config_.name, ex.what());
    }
  }
}

void LogAggregator::Start()
{
  CHECK_F(!unit_, "{} started twice", config_.name);
  unit_ = exec::MakeExecutionUnit(
    config_.unit, config_.name, [this] { return Run(); });
  unit_->Start();
  LOG_F(1, "{} started ({})", config_.name, to_string(config_.unit));
}

auto LogAggregator::Stop() -> int
{
  CHECK_F(IsRunning(), "{} is not running", config_.name);
  channel_.Send(LogStreamEnd {});
  const int status = unit_->Join();
  LOG_F(1, "{} stopped with status {}", config_.name, status);
  return status;
}

auto LogAggregator::Run() -> int
{
  std::size_t emitted = 0;
  while (true) {
    LogMessage message;
    try {
      message = channel_.Receive();
    } catch (const ipc::ChannelError& ex) {
      if (ex.code() != ipc::IpcError::kMalformedMessage
        && ex.code() != ipc::IpcError::kUnknownTag) {
        throw;
      }
      // The datagram was consumed; skip it and keep draining.
      LOG_F(ERROR, "{}: {}", config_.name, ex.what());
      continue;
    }
    if (std::holds_alternative<LogStreamEnd>(message)) {
      break;
    }
    EmitRecord(std::get<LogRecord>(message));
    records_emitted_.store(++emitted);
  }
  DLOG_F(1, "{}: log stream closed after {} records", config_.name, emitted);
  return 0;
}
