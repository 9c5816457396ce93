//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <type_traits>

#include <Replica/Ipc/Errors.h>
#include <Replica/Ipc/Wire.h>
#include <Replica/Log/LogRecord.h>

using replica::Result;
using replica::ipc::IpcError;
using replica::ipc::PacketReader;
using replica::ipc::PacketWriter;
using replica::log::LogMessage;
using replica::log::LogRecord;
using replica::log::LogStreamEnd;

namespace {

enum class LogTag : std::uint8_t {
  kRecord = 1,
  kStreamEnd = 2,
};

auto DecodeRecord(PacketReader& reader) -> Result<LogRecord>
{
  const auto verbosity = reader.ReadI32();
  CHECK_RESULT(verbosity);
  const auto nanos = reader.ReadI64();
  CHECK_RESULT(nanos);
  auto origin = reader.ReadString();
  CHECK_RESULT(origin);
  auto message = reader.ReadString();
  CHECK_RESULT(message);

  LogRecord record;
  record.verbosity = static_cast<loguru::Verbosity>(verbosity.value());
  record.timestamp = std::chrono::system_clock::time_point {
    std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::nanoseconds { nanos.value() })
  };
  record.origin = origin.move_value();
  record.message = message.move_value();
  return record;
}

} // namespace

auto replica::ipc::MessageCodec<LogMessage>::Encode(const LogMessage& message)
  -> std::vector<std::byte>
{
  PacketWriter writer;
  std::visit(
    [&writer](const auto& value) {
      using T = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<T, LogRecord>) {
        writer.WriteTag(static_cast<std::uint8_t>(LogTag::kRecord));
        writer.WriteI32(static_cast<std::int32_t>(value.verbosity));
        writer.WriteI64(std::chrono::duration_cast<std::chrono::nanoseconds>(
          value.timestamp.time_since_epoch())
            .count());
        writer.WriteString(value.origin);
        writer.WriteString(value.message);
      } else {
        writer.WriteTag(static_cast<std::uint8_t>(LogTag::kStreamEnd));
      }
    },
    message);
  return writer.Take();
}

auto replica::ipc::MessageCodec<LogMessage>::Decode(
  const std::span<const std::byte> bytes) -> Result<LogMessage>
{
  PacketReader reader(bytes);
  const auto tag = reader.ReadTag();
  CHECK_RESULT(tag);
  switch (static_cast<LogTag>(tag.value())) {
  case LogTag::kRecord: {
    auto record = DecodeRecord(reader);
    CHECK_RESULT(record);
    CHECK_RESULT(reader.ExpectEnd());
    return LogMessage { record.move_value() };
  }
  case LogTag::kStreamEnd:
    CHECK_RESULT(reader.ExpectEnd());
    return LogMessage { LogStreamEnd {} };
  }
  return make_error_code(IpcError::kUnknownTag);
}
