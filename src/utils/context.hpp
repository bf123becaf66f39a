/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace rollnode {

  enum class ContextError : uint8_t {
    CANCELLED = 1,
    DEADLINE_EXCEEDED,
  };

  /**
   * Cancellation and deadline carried by a caller into blocking calls.
   * Copies share the stop state of the token they were built from.
   */
  class Context {
   public:
    using Clock = std::chrono::steady_clock;

    /// Context which is never cancelled and has no deadline
    static Context background() {
      return Context{};
    }

    [[nodiscard]] Context withStopToken(std::stop_token stop_token) const;

    /// Earlier of the existing deadline and `deadline` wins
    [[nodiscard]] Context withDeadline(Clock::time_point deadline) const;

    [[nodiscard]] Context withTimeout(Clock::duration timeout) const;

    bool cancelled() const;
    bool expired() const;

    bool done() const {
      return cancelled() or expired();
    }

    /// Error describing why the context is done, success otherwise
    outcome::result<void> check() const;

    const std::optional<Clock::time_point> &deadline() const {
      return deadline_;
    }

   private:
    std::stop_token stop_token_;
    std::optional<Clock::time_point> deadline_;
  };

}  // namespace rollnode

OUTCOME_HPP_DECLARE_ERROR(rollnode, ContextError);
