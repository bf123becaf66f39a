/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/context.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rollnode, ContextError, e) {
  using E = rollnode::ContextError;
  switch (e) {
    case E::CANCELLED:
      return "Context cancelled";
    case E::DEADLINE_EXCEEDED:
      return "Context deadline exceeded";
  }
  return "Unknown ContextError";
}

namespace rollnode {

  Context Context::withStopToken(std::stop_token stop_token) const {
    auto ctx = *this;
    ctx.stop_token_ = std::move(stop_token);
    return ctx;
  }

  Context Context::withDeadline(Clock::time_point deadline) const {
    auto ctx = *this;
    if (not ctx.deadline_.has_value() or deadline < ctx.deadline_.value()) {
      ctx.deadline_ = deadline;
    }
    return ctx;
  }

  Context Context::withTimeout(Clock::duration timeout) const {
    return withDeadline(Clock::now() + timeout);
  }

  bool Context::cancelled() const {
    return stop_token_.stop_requested();
  }

  bool Context::expired() const {
    return deadline_.has_value() and Clock::now() >= deadline_.value();
  }

  outcome::result<void> Context::check() const {
    if (cancelled()) {
      return ContextError::CANCELLED;
    }
    if (expired()) {
      return ContextError::DEADLINE_EXCEEDED;
    }
    return outcome::success();
  }

}  // namespace rollnode
