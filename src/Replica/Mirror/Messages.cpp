//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <type_traits>

#include <Replica/Ipc/Errors.h>
#include <Replica/Ipc/Wire.h>
#include <Replica/Mirror/Messages.h>

using replica::Result;
using replica::ipc::IpcError;
using replica::ipc::MessageCodec;
using replica::ipc::PacketReader;
using replica::ipc::PacketWriter;
using replica::mirror::ResultCollection;
using replica::mirror::ResultMessage;
using replica::mirror::ResultStreamEnd;
using replica::mirror::StopMarker;
using replica::mirror::Task;
using replica::mirror::TaskCompleted;
using replica::mirror::TaskFailed;
using replica::mirror::WorkMessage;

namespace {

enum class WorkTag : std::uint8_t {
  kTask = 1,
  kStop = 2,
};

enum class ResultTag : std::uint8_t {
  kCompleted = 1,
  kFailed = 2,
  kStreamEnd = 3,
};

template <typename Enum> void WriteTag(PacketWriter& writer, const Enum tag)
{
  writer.WriteTag(static_cast<std::uint8_t>(tag));
}

void WriteFailure(PacketWriter& writer, const TaskFailed& failure)
{
  writer.WriteString(failure.relative_path);
  writer.WriteString(failure.reason);
}

auto ReadFailure(PacketReader& reader) -> Result<TaskFailed>
{
  auto path = reader.ReadString();
  CHECK_RESULT(path);
  auto reason = reader.ReadString();
  CHECK_RESULT(reason);
  return TaskFailed { .relative_path = path.move_value(),
    .reason = reason.move_value() };
}

//! Finishes decoding of `value`: the packet must have been fully consumed.
template <typename Message, typename T>
auto Finish(const PacketReader& reader, T&& value) -> Result<Message>
{
  CHECK_RESULT(reader.ExpectEnd());
  return Message { std::forward<T>(value) };
}

} // namespace

auto MessageCodec<WorkMessage>::Encode(const WorkMessage& message)
  -> std::vector<std::byte>
{
  PacketWriter writer;
  if (const auto* task = std::get_if<Task>(&message)) {
    WriteTag(writer, WorkTag::kTask);
    writer.WriteString(task->relative_path);
  } else {
    WriteTag(writer, WorkTag::kStop);
  }
  return writer.Take();
}

auto MessageCodec<WorkMessage>::Decode(const std::span<const std::byte> bytes)
  -> Result<WorkMessage>
{
  PacketReader reader(bytes);
  const auto tag = reader.ReadTag();
  CHECK_RESULT(tag);
  switch (static_cast<WorkTag>(tag.value())) {
  case WorkTag::kTask: {
    auto path = reader.ReadString();
    CHECK_RESULT(path);
    return Finish<WorkMessage>(reader, Task { path.move_value() });
  }
  case WorkTag::kStop:
    return Finish<WorkMessage>(reader, StopMarker {});
  }
  return make_error_code(IpcError::kUnknownTag);
}

auto MessageCodec<ResultMessage>::Encode(const ResultMessage& message)
  -> std::vector<std::byte>
{
  PacketWriter writer;
  std::visit(
    [&writer](const auto& value) {
      using T = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<T, TaskCompleted>) {
        WriteTag(writer, ResultTag::kCompleted);
        writer.WriteString(value.absolute_path);
      } else if constexpr (std::is_same_v<T, TaskFailed>) {
        WriteTag(writer, ResultTag::kFailed);
        WriteFailure(writer, value);
      } else {
        WriteTag(writer, ResultTag::kStreamEnd);
      }
    },
    message);
  return writer.Take();
}

auto MessageCodec<ResultMessage>::Decode(
  const std::span<const std::byte> bytes) -> Result<ResultMessage>
{
  PacketReader reader(bytes);
  const auto tag = reader.ReadTag();
  CHECK_RESULT(tag);
  switch (static_cast<ResultTag>(tag.value())) {
  case ResultTag::kCompleted: {
    auto path = reader.ReadString();
    CHECK_RESULT(path);
    return Finish<ResultMessage>(reader, TaskCompleted { path.move_value() });
  }
  case ResultTag::kFailed: {
    auto failure = ReadFailure(reader);
    CHECK_RESULT(failure);
    return Finish<ResultMessage>(reader, failure.move_value());
  }
  case ResultTag::kStreamEnd:
    return Finish<ResultMessage>(reader, ResultStreamEnd {});
  }
  return make_error_code(IpcError::kUnknownTag);
}

auto MessageCodec<ResultCollection>::Encode(const ResultCollection& collection)
  -> std::vector<std::byte>
{
  PacketWriter writer;
  writer.WriteU32(static_cast<std::uint32_t>(collection.paths.size()));
  for (const auto& path : collection.paths) {
    writer.WriteString(path);
  }
  writer.WriteU32(static_cast<std::uint32_t>(collection.failures.size()));
  for (const auto& failure : collection.failures) {
    WriteFailure(writer, failure);
  }
  writer.WriteU32(collection.duplicates);
  return writer.Take();
}

auto MessageCodec<ResultCollection>::Decode(
  const std::span<const std::byte> bytes) -> Result<ResultCollection>
{
  PacketReader reader(bytes);
  ResultCollection collection;

  const auto path_count = reader.ReadU32();
  CHECK_RESULT(path_count);
  // Every entry takes at least its length prefix; refuse counts the packet
  // cannot possibly hold before reserving for them.
  if (path_count.value() > reader.Remaining() / 4) {
    return make_error_code(IpcError::kMalformedMessage);
  }
  collection.paths.reserve(path_count.value());
  for (std::uint32_t i = 0; i < path_count.value(); ++i) {
    auto path = reader.ReadString();
    CHECK_RESULT(path);
    collection.paths.push_back(path.move_value());
  }

  const auto failure_count = reader.ReadU32();
  CHECK_RESULT(failure_count);
  if (failure_count.value() > reader.Remaining() / 8) {
    return make_error_code(IpcError::kMalformedMessage);
  }
  for (std::uint32_t i = 0; i < failure_count.value(); ++i) {
    auto failure = ReadFailure(reader);
    CHECK_RESULT(failure);
    collection.failures.push_back(failure.move_value());
  }

  const auto duplicates = reader.ReadU32();
  CHECK_RESULT(duplicates);
  collection.duplicates = duplicates.value();
  CHECK_RESULT(reader.ExpectEnd());
  return collection;
}
