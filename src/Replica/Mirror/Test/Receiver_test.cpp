//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <chrono>
#include <future>
#include <thread>

#include <Replica/Exec/ExecutionUnit.h>
#include <Replica/Ipc/CancelToken.h>
#include <Replica/Mirror/Receiver.h>
#include <Replica/Testing/GTest.h>

using replica::exec::MakeExecutionUnit;
using replica::exec::UnitKind;
using replica::ipc::CancelSource;
using replica::mirror::CollectionHandoff;
using replica::mirror::Receiver;
using replica::mirror::ResultChannel;
using replica::mirror::ResultStreamEnd;
using replica::mirror::TaskCompleted;
using replica::mirror::TaskFailed;
using ::testing::ElementsAre;

namespace {

class ReceiverTest : public ::testing::Test {
protected:
  auto MakeReceiver() -> Receiver
  {
    return { Receiver::Config { .destination_root = "/mirror/out" }, results_,
      handoff_, {}, cancel_.Token() };
  }

  ResultChannel results_ { "results" };
  CollectionHandoff handoff_ { "collection" };
  CancelSource cancel_;
};

//! Test: results are relativized, duplicates dropped and counted, failures
//! kept, and the collection delivered on stream end.
NOLINT_TEST_F(ReceiverTest, CollectsUntilStreamEnd)
{
  // Arrange
  results_.Send(TaskCompleted { "/mirror/out/a/b.txt" });
  results_.Send(TaskFailed { .relative_path = "a/c.txt", .reason = "denied" });
  results_.Send(TaskCompleted { "/mirror/out/d.txt" });
  results_.Send(TaskCompleted { "/mirror/out/a/b.txt" });
  results_.Send(ResultStreamEnd {});
  auto receiver = MakeReceiver();

  // Act
  const auto status = receiver.Run();

  // Assert
  EXPECT_EQ(status, Receiver::kDelivered);
  ASSERT_TRUE(handoff_.IsDelivered());
  const auto collection = handoff_.Take();
  EXPECT_THAT(collection.paths, ElementsAre("a/b.txt", "d.txt"));
  EXPECT_EQ(collection.duplicates, 1U);
  ASSERT_EQ(collection.failures.size(), 1U);
  EXPECT_EQ(collection.failures[0].relative_path, "a/c.txt");
}

//! Test: an empty stream delivers an empty collection.
NOLINT_TEST_F(ReceiverTest, EmptyStream)
{
  results_.Send(ResultStreamEnd {});
  auto receiver = MakeReceiver();

  EXPECT_EQ(receiver.Run(), Receiver::kDelivered);
  EXPECT_EQ(handoff_.Take(), replica::mirror::ResultCollection {});
}

//! Test: cancellation ends the receiver without delivering anything.
NOLINT_TEST_F(ReceiverTest, CancelledReceiverDeliversNothing)
{
  // Arrange
  results_.Send(TaskCompleted { "/mirror/out/a.txt" });
  auto receiver = MakeReceiver();
  auto status = std::async(std::launch::async, [&] { return receiver.Run(); });

  // Act
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  cancel_.RequestCancel();

  // Assert
  ASSERT_EQ(status.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(status.get(), Receiver::kCancelled);
  EXPECT_FALSE(handoff_.TryTake().has_value());
}

//! Test: a receiver running in a child process hands its collection to the
//! parent.
NOLINT_TEST_F(ReceiverTest, DeliversAcrossProcesses)
{
  // Arrange
  auto receiver = MakeReceiver();
  auto unit = MakeExecutionUnit(
    UnitKind::kProcess, "receiver", [&] { return receiver.Run(); });
  unit->Start();

  // Act
  results_.Send(TaskCompleted { "/mirror/out/x/y.txt" });
  results_.Send(ResultStreamEnd {});
  const auto collection = handoff_.Take();

  // Assert
  EXPECT_THAT(collection.paths, ElementsAre("x/y.txt"));
  EXPECT_EQ(unit->Join(), Receiver::kDelivered);
}

} // namespace
