//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include <Replica/Ipc/CancelToken.h>
#include <Replica/Ipc/Channel.h>
#include <Replica/Ipc/Errors.h>
#include <Replica/Ipc/Wire.h>
#include <Replica/Testing/GTest.h>

using namespace std::chrono_literals;

namespace {

struct Ticket {
  std::uint32_t producer { 0 };
  std::uint32_t sequence { 0 };
  std::string label;
};

} // namespace

namespace replica::ipc {

template <> struct MessageCodec<Ticket> {
  static auto Encode(const Ticket& ticket) -> std::vector<std::byte>
  {
    PacketWriter writer;
    writer.WriteTag(1);
    writer.WriteU32(ticket.producer);
    writer.WriteU32(ticket.sequence);
    writer.WriteString(ticket.label);
    return writer.Take();
  }

  static auto Decode(std::span<const std::byte> bytes) -> Result<Ticket>
  {
    PacketReader reader(bytes);
    const auto tag = reader.ReadTag();
    CHECK_RESULT(tag);
    if (tag.value() != 1) {
      return make_error_code(IpcError::kUnknownTag);
    }
    Ticket ticket;
    const auto producer = reader.ReadU32();
    CHECK_RESULT(producer);
    const auto sequence = reader.ReadU32();
    CHECK_RESULT(sequence);
    auto label = reader.ReadString();
    CHECK_RESULT(label);
    CHECK_RESULT(reader.ExpectEnd());
    ticket.producer = producer.value();
    ticket.sequence = sequence.value();
    ticket.label = label.move_value();
    return ticket;
  }
};

} // namespace replica::ipc

namespace {

using replica::ipc::CancelSource;
using replica::ipc::Channel;
using replica::ipc::ChannelError;
using replica::ipc::IpcError;
using replica::ipc::OperationCancelled;
using replica::ipc::PacketChannel;

using TicketChannel = Channel<Ticket>;

//! Test: a message sent is received unchanged.
NOLINT_TEST(ChannelTest, SendThenReceive)
{
  // Arrange
  TicketChannel channel("tickets");

  // Act
  channel.Send({ .producer = 3, .sequence = 9, .label = "a/b.txt" });
  const auto received = channel.Receive();

  // Assert
  EXPECT_EQ(received.producer, 3U);
  EXPECT_EQ(received.sequence, 9U);
  EXPECT_EQ(received.label, "a/b.txt");
}

//! Test: channels built from a name alone use the default limits.
NOLINT_TEST(ChannelTest, NameOnlyUsesDefaultConfig)
{
  // Arrange
  const PacketChannel packets("raw");
  TicketChannel channel("tickets");

  // Act
  channel.Send(
    { .producer = 1, .sequence = 2, .label = std::string(1024, 'n') });
  const auto received = channel.Receive();

  // Assert
  EXPECT_EQ(packets.Name(), "raw");
  EXPECT_EQ(packets.GetConfig().max_message_size, 16U * 1024U);
  EXPECT_EQ(packets.GetConfig().buffer_size, 0U);
  EXPECT_EQ(channel.Name(), "tickets");
  EXPECT_EQ(received.label.size(), 1024U);
}

//! Test: TryReceive on an empty channel returns nothing and does not block.
NOLINT_TEST(ChannelTest, TryReceiveOnEmptyReturnsNothing)
{
  TicketChannel channel("tickets");

  EXPECT_FALSE(channel.TryReceive().has_value());
}

//! Test: TrySend reports a full queue instead of blocking, and a drain makes
//! room again.
NOLINT_TEST(ChannelTest, TrySendReportsFullQueue)
{
  // Arrange
  TicketChannel channel("tickets");
  std::uint32_t sent = 0;

  // Act
  while (channel.TrySend({ .producer = 0, .sequence = sent, .label = "x" })) {
    ++sent;
    ASSERT_LT(sent, 1'000'000U) << "queue never filled";
  }
  std::uint32_t drained = 0;
  while (channel.TryReceive()) {
    ++drained;
  }

  // Assert
  EXPECT_GT(sent, 0U);
  EXPECT_EQ(drained, sent);
  EXPECT_TRUE(channel.TrySend({ .producer = 0, .sequence = 0, .label = "y" }));
}

//! Test: a message larger than the configured limit is rejected at send.
NOLINT_TEST(ChannelTest, OversizedMessageIsRejected)
{
  // Arrange
  TicketChannel channel("tickets", { .max_message_size = 64 });
  const Ticket big { .producer = 0, .sequence = 0, .label = std::string(100, 'x') };

  // Act & Assert
  try {
    channel.Send(big);
    FAIL() << "expected ChannelError";
  } catch (const ChannelError& error) {
    EXPECT_EQ(error.code(), IpcError::kMessageTooLarge);
  }
}

//! Test: a datagram that does not decode raises a protocol error.
NOLINT_TEST(ChannelTest, UndecodableMessageIsProtocolError)
{
  // Arrange
  PacketChannel raw("raw");
  const std::byte junk[] = { std::byte { 42 } };

  // Act
  raw.Send(junk);
  const auto packet = raw.Receive();
  const auto decoded = replica::ipc::MessageCodec<Ticket>::Decode(packet);

  // Assert
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error(), IpcError::kUnknownTag);
}

//! Scenario: many producers and many consumers share one channel; every
//! message is received exactly once.
NOLINT_TEST(ChannelTest, ManyProducersManyConsumersNoLossNoDuplicates)
{
  // Arrange
  constexpr std::uint32_t kProducers = 4;
  constexpr std::uint32_t kConsumers = 3;
  constexpr std::uint32_t kPerProducer = 500;
  TicketChannel channel("tickets");
  std::mutex mutex;
  std::multiset<std::pair<std::uint32_t, std::uint32_t>> received;

  // Act
  std::vector<std::thread> consumers;
  for (std::uint32_t c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([&] {
      while (true) {
        const auto ticket = channel.Receive();
        if (ticket.label == "stop") {
          return;
        }
        std::lock_guard lock(mutex);
        received.emplace(ticket.producer, ticket.sequence);
      }
    });
  }
  std::vector<std::thread> producers;
  for (std::uint32_t p = 0; p < kProducers; ++p) {
    producers.emplace_back([&channel, p] {
      for (std::uint32_t i = 0; i < kPerProducer; ++i) {
        channel.Send({ .producer = p, .sequence = i, .label = "item" });
      }
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }
  for (std::uint32_t c = 0; c < kConsumers; ++c) {
    channel.Send({ .producer = 0, .sequence = 0, .label = "stop" });
  }
  for (auto& consumer : consumers) {
    consumer.join();
  }

  // Assert
  ASSERT_EQ(received.size(), kProducers * kPerProducer);
  for (std::uint32_t p = 0; p < kProducers; ++p) {
    for (std::uint32_t i = 0; i < kPerProducer; ++i) {
      EXPECT_EQ(received.count({ p, i }), 1U);
    }
  }
}

//! Scenario: a receiver blocked on an empty channel returns promptly when
//! cancellation is requested.
NOLINT_TEST(ChannelTest, CancelUnblocksReceive)
{
  // Arrange
  TicketChannel channel("tickets");
  const CancelSource source;
  std::thread canceller([&source] {
    std::this_thread::sleep_for(20ms);
    source.RequestCancel();
  });

  // Act & Assert
  NOLINT_EXPECT_THROW(
    (void)channel.Receive(source.Token()), OperationCancelled);
  canceller.join();
}

//! Scenario: a sender blocked on a full channel returns promptly when
//! cancellation is requested.
NOLINT_TEST(ChannelTest, CancelUnblocksSend)
{
  // Arrange
  TicketChannel channel("tickets");
  while (channel.TrySend({ .producer = 0, .sequence = 0, .label = "fill" })) { }
  const CancelSource source;
  std::thread canceller([&source] {
    std::this_thread::sleep_for(20ms);
    source.RequestCancel();
  });

  // Act & Assert
  NOLINT_EXPECT_THROW(
    channel.Send({ .producer = 0, .sequence = 1, .label = "blocked" },
      source.Token()),
    OperationCancelled);
  canceller.join();
}

//! Scenario: a forked child process sends through a channel created by the
//! parent.
NOLINT_TEST(ChannelTest, WorksAcrossFork)
{
  // Arrange
  constexpr std::uint32_t kCount = 200;
  TicketChannel channel("tickets");

  // Act
  const pid_t pid = ::fork();
  ASSERT_GE(pid, 0);
  if (pid == 0) {
    for (std::uint32_t i = 0; i < kCount; ++i) {
      channel.Send({ .producer = 1, .sequence = i, .label = "child" });
    }
    std::_Exit(0);
  }
  std::set<std::uint32_t> sequences;
  for (std::uint32_t i = 0; i < kCount; ++i) {
    const auto ticket = channel.Receive();
    EXPECT_EQ(ticket.label, "child");
    sequences.insert(ticket.sequence);
  }
  int status = 0;
  ASSERT_EQ(::waitpid(pid, &status, 0), pid);

  // Assert
  EXPECT_TRUE(WIFEXITED(status) && WEXITSTATUS(status) == 0);
  EXPECT_EQ(sequences.size(), kCount);
  EXPECT_FALSE(channel.TryReceive().has_value());
}

} // namespace
