/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "finality/finality_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rollnode::finality, TemporaryError, e) {
  using E = rollnode::finality::TemporaryError;
  switch (e) {
    case E::SIGNAL_BLOCK_UNAVAILABLE:
      return "Temporary: could not fetch the signaled finalized L1 block";
    case E::DERIVED_FROM_UNAVAILABLE:
      return "Temporary: could not fetch the L1 block the finalized L2 block "
             "was derived from";
    case E::FETCH_CANCELLED:
      return "Temporary: L1 fetch cancelled";
    case E::FETCH_DEADLINE_EXCEEDED:
      return "Temporary: L1 fetch deadline exceeded";
  }
  return "Unknown finality::TemporaryError";
}

OUTCOME_CPP_DEFINE_CATEGORY(rollnode::finality, ResetError, e) {
  using E = rollnode::finality::ResetError;
  switch (e) {
    case E::SIGNAL_NOT_CANONICAL:
      return "Reset required: signaled finalized L1 block is not canonical";
    case E::DERIVED_FROM_NOT_CANONICAL:
      return "Reset required: derivation is not on the finalizing L1 chain";
  }
  return "Unknown finality::ResetError";
}

namespace rollnode::finality {

  ErrorKind errorKind(const std::error_code &ec) {
    static const std::error_code temporary =
        TemporaryError::SIGNAL_BLOCK_UNAVAILABLE;
    static const std::error_code reset = ResetError::SIGNAL_NOT_CANONICAL;
    if (not ec) {
      return ErrorKind::OTHER;
    }
    if (ec.category() == temporary.category()) {
      return ErrorKind::TEMPORARY;
    }
    if (ec.category() == reset.category()) {
      return ErrorKind::RESET;
    }
    return ErrorKind::OTHER;
  }

}  // namespace rollnode::finality
