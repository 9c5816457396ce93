//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include <Replica/Ipc/CancelToken.h>
#include <Replica/Ipc/Errors.h>
#include <Replica/Ipc/OneShot.h>
#include <Replica/Testing/GTest.h>

using namespace std::chrono_literals;
using replica::ipc::CancelSource;
using replica::ipc::ChannelError;
using replica::ipc::IpcError;
using replica::ipc::OneShotChannel;
using replica::ipc::OperationCancelled;

namespace {

auto Bytes(std::string_view text) -> std::vector<std::byte>
{
  const auto* first = reinterpret_cast<const std::byte*>(text.data());
  return { first, first + text.size() };
}

//! Test: a delivered payload is taken back unchanged.
NOLINT_TEST(OneShotTest, DeliverThenTake)
{
  // Arrange
  OneShotChannel channel("collection");

  // Act
  channel.Deliver(Bytes("three paths"));
  const auto payload = channel.Take();

  // Assert
  EXPECT_EQ(payload, Bytes("three paths"));
  EXPECT_TRUE(channel.IsDelivered());
  EXPECT_TRUE(channel.IsTaken());
}

//! Test: an empty payload is a valid delivery.
NOLINT_TEST(OneShotTest, EmptyPayload)
{
  OneShotChannel channel("collection");

  channel.Deliver({});

  EXPECT_TRUE(channel.Take().empty());
}

//! Scenario: Take blocks until the producer delivers from another thread.
NOLINT_TEST(OneShotTest, TakeBlocksUntilDelivered)
{
  // Arrange
  OneShotChannel channel("collection");
  std::thread producer([&channel] {
    std::this_thread::sleep_for(20ms);
    channel.Deliver(Bytes("late"));
  });

  // Act
  const auto payload = channel.Take();
  producer.join();

  // Assert
  EXPECT_EQ(payload, Bytes("late"));
}

//! Test: the second delivery is rejected.
NOLINT_TEST(OneShotTest, SecondDeliverIsRejected)
{
  OneShotChannel channel("collection");
  channel.Deliver(Bytes("once"));

  try {
    channel.Deliver(Bytes("twice"));
    FAIL() << "expected ChannelError";
  } catch (const ChannelError& error) {
    EXPECT_EQ(error.code(), IpcError::kAlreadyDelivered);
  }
}

//! Test: the second take is rejected.
NOLINT_TEST(OneShotTest, SecondTakeIsRejected)
{
  OneShotChannel channel("collection");
  channel.Deliver(Bytes("once"));
  (void)channel.Take();

  try {
    (void)channel.Take();
    FAIL() << "expected ChannelError";
  } catch (const ChannelError& error) {
    EXPECT_EQ(error.code(), IpcError::kAlreadyTaken);
  }
}

//! Test: TryTake returns nothing before delivery and the payload after.
NOLINT_TEST(OneShotTest, TryTakeIsNonBlocking)
{
  // Arrange
  OneShotChannel channel("collection");

  // Act & Assert
  EXPECT_FALSE(channel.TryTake().has_value());
  channel.Deliver(Bytes("ready"));
  const auto payload = channel.TryTake();
  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ(*payload, Bytes("ready"));
  EXPECT_TRUE(channel.IsTaken());
}

//! Scenario: a blocked Take returns when cancellation is requested.
NOLINT_TEST(OneShotTest, CancelUnblocksTake)
{
  OneShotChannel channel("collection");
  const CancelSource source;
  std::thread canceller([&source] {
    std::this_thread::sleep_for(20ms);
    source.RequestCancel();
  });

  NOLINT_EXPECT_THROW((void)channel.Take(source.Token()), OperationCancelled);
  canceller.join();
}

//! Scenario: a take cancelled before anything was read leaves the value for
//! a later take.
NOLINT_TEST(OneShotTest, CancelledTakeKeepsValue)
{
  // Arrange
  OneShotChannel channel("collection");
  const CancelSource source;
  source.RequestCancel();
  channel.Deliver(Bytes("late"));

  // Act
  NOLINT_EXPECT_THROW((void)channel.Take(source.Token()), OperationCancelled);

  // Assert
  EXPECT_FALSE(channel.IsTaken());
  const auto payload = channel.TryTake();
  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ(*payload, Bytes("late"));
  EXPECT_TRUE(channel.IsTaken());
}

//! Scenario: a cancelled take followed by a delivery can still be taken.
NOLINT_TEST(OneShotTest, TakeAfterCancelledWait)
{
  // Arrange
  OneShotChannel channel("collection");
  const CancelSource source;
  std::thread canceller([&source] {
    std::this_thread::sleep_for(20ms);
    source.RequestCancel();
  });
  NOLINT_EXPECT_THROW((void)channel.Take(source.Token()), OperationCancelled);
  canceller.join();

  // Act
  channel.Deliver(Bytes("\x01\x02\x03"));

  // Assert
  EXPECT_EQ(channel.Take(), Bytes("\x01\x02\x03"));
}

//! Scenario: a delivery cancelled before sending anything may be repeated.
NOLINT_TEST(OneShotTest, CancelledDeliverMayBeRepeated)
{
  OneShotChannel channel("collection");
  const CancelSource source;
  source.RequestCancel();

  NOLINT_EXPECT_THROW(
    channel.Deliver(Bytes("first"), source.Token()), OperationCancelled);

  EXPECT_FALSE(channel.IsDelivered());
  channel.Deliver(Bytes("second"));
  EXPECT_EQ(channel.Take(), Bytes("second"));
}

//! Scenario: a forked child delivers a payload larger than the socket buffer
//! while the parent takes it.
NOLINT_TEST(OneShotTest, LargePayloadAcrossFork)
{
  // Arrange
  OneShotChannel channel("collection");
  std::vector<std::byte> big(4 * 1024 * 1024);
  for (std::size_t i = 0; i < big.size(); ++i) {
    big[i] = static_cast<std::byte>(i % 251);
  }

  // Act
  const pid_t pid = ::fork();
  ASSERT_GE(pid, 0);
  if (pid == 0) {
    channel.Deliver(big);
    std::_Exit(0);
  }
  const auto payload = channel.Take();
  int status = 0;
  ASSERT_EQ(::waitpid(pid, &status, 0), pid);

  // Assert
  EXPECT_TRUE(WIFEXITED(status) && WEXITSTATUS(status) == 0);
  EXPECT_EQ(payload, big);
}

} // namespace
