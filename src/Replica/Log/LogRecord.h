//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include <Replica/Base/Logging.h>
#include <Replica/Base/Result.h>
#include <Replica/Ipc/Channel.h>

namespace replica::log {

//! One diagnostic message produced by a pipeline component.
struct LogRecord {
  loguru::Verbosity verbosity { loguru::Verbosity_INFO };
  std::chrono::system_clock::time_point timestamp;
  //! Identity of the producer, e.g. "worker-3" or "receiver".
  std::string origin;
  std::string message;

  auto operator==(const LogRecord&) const -> bool = default;
};

//! Ends the log aggregator's loop.
struct LogStreamEnd {
  auto operator==(const LogStreamEnd&) const -> bool = default;
};

using LogMessage = std::variant<LogRecord, LogStreamEnd>;

} // namespace replica::log

namespace replica::ipc {

template <> struct MessageCodec<log::LogMessage> {
  static auto Encode(const log::LogMessage& message) -> std::vector<std::byte>;
  static auto Decode(std::span<const std::byte> bytes)
    -> Result<log::LogMessage>;
};

} // namespace replica::ipc

namespace replica::log {

using LogChannel = ipc::Channel<LogMessage>;

} // namespace replica::log
