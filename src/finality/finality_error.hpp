/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <system_error>

#include <qtils/enum_error_code.hpp>

namespace rollnode::finality {

  /**
   * L1 data could not be obtained right now. Nothing was committed, so the
   * caller just retries on a later derivation boundary.
   */
  enum class TemporaryError : uint8_t {
    SIGNAL_BLOCK_UNAVAILABLE = 1,
    DERIVED_FROM_UNAVAILABLE,
    FETCH_CANCELLED,
    FETCH_DEADLINE_EXCEEDED,
  };

  /**
   * Local view disagrees with the canonical L1 chain. The owner has to drop
   * its derivation state and restart from a safe point.
   */
  enum class ResetError : uint8_t {
    SIGNAL_NOT_CANONICAL = 1,
    DERIVED_FROM_NOT_CANONICAL,
  };

  enum class ErrorKind : uint8_t {
    TEMPORARY,
    RESET,
    OTHER,
  };

  ErrorKind errorKind(const std::error_code &ec);

  inline bool isTemporary(const std::error_code &ec) {
    return errorKind(ec) == ErrorKind::TEMPORARY;
  }

  inline bool isResetRequired(const std::error_code &ec) {
    return errorKind(ec) == ErrorKind::RESET;
  }

}  // namespace rollnode::finality

OUTCOME_HPP_DECLARE_ERROR(rollnode::finality, TemporaryError);
OUTCOME_HPP_DECLARE_ERROR(rollnode::finality, ResetError);
