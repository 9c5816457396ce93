//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstddef>
#include <vector>

#include <Replica/Ipc/Errors.h>
#include <Replica/Mirror/Messages.h>
#include <Replica/Testing/GTest.h>

using replica::ipc::IpcError;
using replica::ipc::MessageCodec;
using replica::ipc::WireMessage;
using replica::mirror::CollectionHandoff;
using replica::mirror::ResultChannel;
using replica::mirror::ResultCollection;
using replica::mirror::ResultMessage;
using replica::mirror::ResultStreamEnd;
using replica::mirror::StopMarker;
using replica::mirror::Task;
using replica::mirror::TaskCompleted;
using replica::mirror::TaskFailed;
using replica::mirror::WorkChannel;
using replica::mirror::WorkMessage;

namespace {

static_assert(WireMessage<WorkMessage>);
static_assert(WireMessage<ResultMessage>);
static_assert(WireMessage<ResultCollection>);

//! Test: the pipeline channels carry their messages end to end.
NOLINT_TEST(MessagesTest, PipelineChannelsCarryMessages)
{
  // Arrange
  WorkChannel work("work");
  ResultChannel results("results");
  CollectionHandoff handoff("collection");
  const WorkMessage task = Task { "b/c.txt" };
  const ResultMessage failure
    = TaskFailed { .relative_path = "a.txt", .reason = "denied" };
  const ResultCollection collection { .paths = { "a.txt", "b/c.txt" } };

  // Act
  work.Send(task);
  results.Send(failure);
  handoff.Deliver(collection);

  // Assert
  EXPECT_EQ(work.Receive(), task);
  EXPECT_EQ(results.Receive(), failure);
  EXPECT_EQ(handoff.Take(), collection);
}

//! Test: a task whose path looks like a marker is still a task.
NOLINT_TEST(MessagesTest, TaskNeverCollidesWithStopMarker)
{
  // Arrange
  const WorkMessage task = Task { "" };
  const WorkMessage stop = StopMarker {};

  // Act
  const auto task_bytes = MessageCodec<WorkMessage>::Encode(task);
  const auto stop_bytes = MessageCodec<WorkMessage>::Encode(stop);

  // Assert
  EXPECT_NE(task_bytes, stop_bytes);
  EXPECT_EQ(MessageCodec<WorkMessage>::Decode(task_bytes).value(), task);
  EXPECT_EQ(MessageCodec<WorkMessage>::Decode(stop_bytes).value(), stop);
}

//! Test: every result alternative keeps its kind and fields.
NOLINT_TEST(MessagesTest, ResultAlternativesDecode)
{
  const std::vector<ResultMessage> messages {
    TaskCompleted { "/out/a/b.txt" },
    TaskFailed { .relative_path = "a/c.txt", .reason = "No space left" },
    ResultStreamEnd {},
  };

  for (const auto& message : messages) {
    const auto decoded = MessageCodec<ResultMessage>::Decode(
      MessageCodec<ResultMessage>::Encode(message));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), message);
  }
}

//! Test: the collection keeps paths, failures and the duplicate count.
NOLINT_TEST(MessagesTest, CollectionDecodes)
{
  const ResultCollection collection {
    .paths = { "a/b.txt", "d.txt" },
    .failures = { { .relative_path = "a/c.txt", .reason = "denied" } },
    .duplicates = 2,
  };

  const auto decoded = MessageCodec<ResultCollection>::Decode(
    MessageCodec<ResultCollection>::Encode(collection));

  ASSERT_TRUE(decoded);
  EXPECT_EQ(decoded.value(), collection);
}

//! Test: a collection claiming more entries than its payload holds is
//! malformed.
NOLINT_TEST(MessagesTest, CollectionWithBogusCountIsRejected)
{
  // Arrange
  auto bytes = MessageCodec<ResultCollection>::Encode({});
  bytes[0] = std::byte { 0xFF };
  bytes[1] = std::byte { 0xFF };

  // Act
  const auto decoded = MessageCodec<ResultCollection>::Decode(bytes);

  // Assert
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error(), IpcError::kMalformedMessage);
}

//! Test: unknown work and result tags are rejected.
NOLINT_TEST(MessagesTest, UnknownTagsAreRejected)
{
  const std::vector<std::byte> bytes { std::byte { 0x7F } };

  const auto work = MessageCodec<WorkMessage>::Decode(bytes);
  const auto result = MessageCodec<ResultMessage>::Decode(bytes);

  ASSERT_FALSE(work);
  EXPECT_EQ(work.error(), IpcError::kUnknownTag);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), IpcError::kUnknownTag);
}

} // namespace
