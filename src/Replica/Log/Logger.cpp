//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>

#include <Replica/Log/Logger.h>

using replica::log::Logger;

namespace {

// Leaves room for the record header and the origin within the channel's
// default maximum message size.
constexpr std::size_t kMaxMessageBytes = 8 * 1024;

auto Upper(std::string_view text) -> std::string
{
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
    [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return result;
}

} // namespace

auto replica::log::ParseVerbosity(const std::string_view text)
  -> std::optional<loguru::Verbosity>
{
  const auto name = Upper(text);
  if (name == "DEBUG") {
    return kDebugVerbosity;
  }
  if (name == "INFO") {
    return loguru::Verbosity_INFO;
  }
  if (name == "WARN" || name == "WARNING") {
    return loguru::Verbosity_WARNING;
  }
  if (name == "ERROR") {
    return loguru::Verbosity_ERROR;
  }
  int value = 0;
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc {} || ptr != last || text.empty()
    || value < loguru::Verbosity_FATAL || value > loguru::Verbosity_MAX) {
    return std::nullopt;
  }
  return static_cast<loguru::Verbosity>(value);
}

void Logger::Publish(const loguru::Verbosity verbosity, std::string message) const
{
  if (message.size() > kMaxMessageBytes) {
    // Cut before a UTF-8 lead byte, never inside a multi-byte sequence.
    auto cut = kMaxMessageBytes;
    while (cut > 0
      && (static_cast<unsigned char>(message[cut]) & 0xC0U) == 0x80U) {
      --cut;
    }
    message.resize(cut);
    message.append("...");
  }
  channel_->Send(LogRecord {
    .verbosity = verbosity,
    .timestamp = std::chrono::system_clock::now(),
    .origin = origin_,
    .message = std::move(message),
  });
}
