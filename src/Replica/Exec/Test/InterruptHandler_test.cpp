//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <csignal>

#include <Replica/Exec/InterruptHandler.h>
#include <Replica/Ipc/CancelToken.h>
#include <Replica/Testing/GTest.h>

using replica::exec::ScopedInterruptHandler;
using replica::ipc::CancelSource;

namespace {

volatile std::sig_atomic_t g_marker_hits = 0;

void MarkerHandler(int /*signal_number*/) { g_marker_hits = g_marker_hits + 1; }

//! Fixture installing a recognizable SIGINT handler to verify restoration.
class InterruptHandlerTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    struct sigaction marker {};
    marker.sa_handler = &MarkerHandler;
    sigemptyset(&marker.sa_mask);
    ASSERT_EQ(::sigaction(SIGINT, &marker, &saved_), 0);
    g_marker_hits = 0;
  }

  void TearDown() override { (void)::sigaction(SIGINT, &saved_, nullptr); }

private:
  struct sigaction saved_ {};
};

//! Test: SIGINT requests cancellation while the handler is installed.
NOLINT_TEST_F(InterruptHandlerTest, SigintRequestsCancel)
{
  // Arrange
  const CancelSource source;
  const ScopedInterruptHandler handler(source);

  // Act
  ASSERT_EQ(::raise(SIGINT), 0);

  // Assert
  EXPECT_TRUE(source.IsCancelRequested());
  EXPECT_EQ(ScopedInterruptHandler::LastSignal(), SIGINT);
  EXPECT_EQ(g_marker_hits, 0);
}

//! Test: SIGTERM is handled the same way.
NOLINT_TEST_F(InterruptHandlerTest, SigtermRequestsCancel)
{
  const CancelSource source;
  const ScopedInterruptHandler handler(source);

  ASSERT_EQ(::raise(SIGTERM), 0);

  EXPECT_TRUE(source.IsCancelRequested());
  EXPECT_EQ(ScopedInterruptHandler::LastSignal(), SIGTERM);
}

//! Test: the previous SIGINT disposition is restored on destruction.
NOLINT_TEST_F(InterruptHandlerTest, RestoresPreviousHandler)
{
  // Arrange
  const CancelSource source;
  {
    const ScopedInterruptHandler handler(source);
  }

  // Act
  ASSERT_EQ(::raise(SIGINT), 0);

  // Assert
  EXPECT_EQ(g_marker_hits, 1);
  EXPECT_FALSE(source.IsCancelRequested());
}

} // namespace
