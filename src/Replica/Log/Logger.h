//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include <Replica/Base/Logging.h>
#include <Replica/Log/LogRecord.h>

namespace replica::log {

//! Verbosity used for per-task diagnostics.
inline constexpr loguru::Verbosity kDebugVerbosity = loguru::Verbosity_1;

//! Parses DEBUG, INFO, WARN, WARNING or ERROR (any case), or a loguru
//! verbosity number.
[[nodiscard]] auto ParseVerbosity(std::string_view text)
  -> std::optional<loguru::Verbosity>;

/*!
  Handle through which a pipeline component publishes diagnostics.

  A Logger is a small value: a reference to the shared log channel, the
  producer identity stamped on every record, and the most verbose level that
  is published. Records above that level are dropped before formatting.
  Publishing blocks while the channel is full and is not cancellable, so
  diagnostics emitted while the pipeline aborts are not lost.

  A default constructed Logger discards everything.
*/
class Logger {
public:
  Logger() = default;
  Logger(LogChannel& channel, std::string origin,
    loguru::Verbosity max_verbosity = loguru::Verbosity_INFO)
    : channel_(&channel)
    , origin_(std::move(origin))
    , max_verbosity_(max_verbosity)
  {
  }

  [[nodiscard]] auto IsEnabled(const loguru::Verbosity verbosity) const noexcept
    -> bool
  {
    return channel_ != nullptr && verbosity <= max_verbosity_;
  }

  template <typename... Args>
  void Log(const loguru::Verbosity verbosity,
    fmt::format_string<Args...> format, Args&&... args) const
  {
    if (IsEnabled(verbosity)) {
      Publish(verbosity, fmt::format(format, std::forward<Args>(args)...));
    }
  }

  //! Same channel and level, different producer identity.
  [[nodiscard]] auto WithOrigin(std::string origin) const -> Logger
  {
    Logger copy = *this;
    copy.origin_ = std::move(origin);
    return copy;
  }

  [[nodiscard]] auto Origin() const noexcept -> const std::string&
  {
    return origin_;
  }

  [[nodiscard]] auto MaxVerbosity() const noexcept { return max_verbosity_; }

private:
  void Publish(loguru::Verbosity verbosity, std::string message) const;

  LogChannel* channel_ { nullptr };
  std::string origin_;
  loguru::Verbosity max_verbosity_ { loguru::Verbosity_INFO };
};

} // namespace replica::log
