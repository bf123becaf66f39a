/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/block_id.hpp"

namespace rollnode {

  /**
   * Reference to a block of the rollup (L2) chain.
   * `l1_origin` is the L1 block the L2 block's epoch belongs to and
   * `sequence_number` its position inside that epoch.
   */
  struct L2BlockRef {
    BlockHash hash;
    BlockNumber number = 0;
    BlockHash parent_hash;
    TimestampSeconds timestamp = 0;
    BlockId l1_origin;
    uint64_t sequence_number = 0;

    bool operator==(const L2BlockRef &other) const = default;
  };

}  // namespace rollnode

template <>
struct fmt::formatter<rollnode::L2BlockRef>
    : fmt::formatter<rollnode::BlockIdRef> {
  template <typename FormatContext>
  auto format(const rollnode::L2BlockRef &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<rollnode::BlockIdRef>::format(
        rollnode::BlockIdRef{v.number, v.hash}, ctx);
  }
};
