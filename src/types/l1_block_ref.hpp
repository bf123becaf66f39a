/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/block_id.hpp"

namespace rollnode {

  /**
   * Reference to a block of the settlement (L1) chain.
   * Default constructed value means "no block", e.g. no finality signal yet.
   */
  struct L1BlockRef {
    BlockHash hash;
    BlockNumber number = 0;
    BlockHash parent_hash;
    TimestampSeconds timestamp = 0;

    BlockId id() const {
      return BlockId{.hash = hash, .number = number};
    }

    bool operator==(const L1BlockRef &other) const = default;
  };

}  // namespace rollnode

template <>
struct fmt::formatter<rollnode::L1BlockRef>
    : fmt::formatter<rollnode::BlockIdRef> {
  template <typename FormatContext>
  auto format(const rollnode::L1BlockRef &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<rollnode::BlockIdRef>::format(
        rollnode::BlockIdRef{v.number, v.hash}, ctx);
  }
};
