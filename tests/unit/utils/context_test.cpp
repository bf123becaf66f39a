/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/context.hpp"

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

using rollnode::Context;
using rollnode::ContextError;
using namespace std::chrono_literals;

TEST(ContextTest, BackgroundNeverDone) {
  auto ctx = Context::background();
  EXPECT_FALSE(ctx.cancelled());
  EXPECT_FALSE(ctx.expired());
  EXPECT_FALSE(ctx.deadline().has_value());
  EXPECT_OUTCOME_SUCCESS(ctx.check());
}

TEST(ContextTest, StopRequestCancelsCopies) {
  std::stop_source stop_source;
  auto ctx = Context::background().withStopToken(stop_source.get_token());
  auto copy = ctx;
  EXPECT_FALSE(copy.done());

  stop_source.request_stop();

  EXPECT_TRUE(ctx.cancelled());
  EXPECT_TRUE(copy.cancelled());
  auto res = copy.check();
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), std::error_code{ContextError::CANCELLED});
}

TEST(ContextTest, PastDeadlineExpires) {
  auto ctx = Context::background().withDeadline(Context::Clock::now() - 1ms);
  EXPECT_TRUE(ctx.expired());
  EXPECT_TRUE(ctx.done());
  auto res = ctx.check();
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), std::error_code{ContextError::DEADLINE_EXCEEDED});
}

TEST(ContextTest, EarlierDeadlineWins) {
  auto now = Context::Clock::now();
  auto ctx = Context::background().withDeadline(now + 10s);
  EXPECT_EQ(ctx.withDeadline(now + 1h).deadline(), now + 10s);
  EXPECT_EQ(ctx.withDeadline(now + 1s).deadline(), now + 1s);
}

TEST(ContextTest, TimeoutInTheFuture) {
  auto ctx = Context::background().withTimeout(1h);
  ASSERT_TRUE(ctx.deadline().has_value());
  EXPECT_FALSE(ctx.expired());
  EXPECT_OUTCOME_SUCCESS(ctx.check());
}

TEST(ContextTest, CancellationReportedBeforeExpiry) {
  std::stop_source stop_source;
  stop_source.request_stop();
  auto ctx = Context::background()
                 .withDeadline(Context::Clock::now() - 1s)
                 .withStopToken(stop_source.get_token());
  auto res = ctx.check();
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(), std::error_code{ContextError::CANCELLED});
}
