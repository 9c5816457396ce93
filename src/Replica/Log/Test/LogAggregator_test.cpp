//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include <Replica/Log/LogAggregator.h>
#include <Replica/Log/Logger.h>
#include <Replica/Testing/GTest.h>
#include <Replica/Testing/ScopedLogCapture.h>

using replica::exec::UnitKind;
using replica::log::LogAggregator;
using replica::log::LogChannel;
using replica::log::Logger;
using replica::testing::ScopedLogCapture;

namespace {

//! Scenario: records from many concurrent producers are each emitted exactly
//! once before the aggregator stops.
NOLINT_TEST(LogAggregatorTest, EmitsEveryRecordExactlyOnce)
{
  // Arrange
  constexpr int kProducers = 4;
  constexpr int kRecords = 100;
  ScopedLogCapture capture("LogAggregatorTest");
  LogChannel channel("log");
  LogAggregator aggregator(channel, { .unit = UnitKind::kThread });
  aggregator.Start();

  // Act
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&channel, p] {
      const Logger logger(channel, fmt::format("producer-{}", p));
      for (int i = 0; i < kRecords; ++i) {
        logger.Log(loguru::Verbosity_INFO, "record <{}:{}>", p, i);
      }
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }
  const int status = aggregator.Stop();

  // Assert
  EXPECT_EQ(status, 0);
  EXPECT_FALSE(aggregator.IsRunning());
  EXPECT_EQ(aggregator.RecordsEmitted(),
    static_cast<std::size_t>(kProducers * kRecords));
  for (int p = 0; p < kProducers; ++p) {
    for (int i = 0; i < kRecords; ++i) {
      EXPECT_EQ(capture.Count(fmt::format("record <{}:{}>", p, i)), 1);
    }
  }
}

//! Test: the emitted line carries the producer identity.
NOLINT_TEST(LogAggregatorTest, EmittedLineNamesOrigin)
{
  ScopedLogCapture capture("LogAggregatorOrigin");
  LogChannel channel("log");
  LogAggregator aggregator(channel, {});
  aggregator.Start();

  Logger(channel, "receiver").Log(loguru::Verbosity_WARNING, "duplicate");
  (void)aggregator.Stop();

  EXPECT_TRUE(capture.Contains("[receiver]"));
  EXPECT_TRUE(capture.Contains("duplicate"));
}

//! Test: a process-backed aggregator drains the channel and exits cleanly.
NOLINT_TEST(LogAggregatorTest, ProcessAggregatorStops)
{
  // Arrange
  LogChannel channel("log");
  LogAggregator aggregator(channel, { .unit = UnitKind::kProcess });
  aggregator.Start();
  const Logger logger(channel, "host", loguru::Verbosity_INFO);

  // Act
  for (int i = 0; i < 50; ++i) {
    logger.Log(loguru::Verbosity_INFO, "from host {}", i);
  }
  const int status = aggregator.Stop();

  // Assert
  EXPECT_EQ(status, 0);
  EXPECT_FALSE(channel.TryReceive().has_value());
}

} // namespace
