/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "log/formatters/block_id_ref.hpp"

namespace rollnode {

  /// Number and hash of a block, enough to identify it on either chain.
  struct BlockId {
    BlockHash hash;
    BlockNumber number = 0;

    bool operator==(const BlockId &other) const = default;
  };

}  // namespace rollnode

template <>
struct fmt::formatter<rollnode::BlockId> : fmt::formatter<rollnode::BlockIdRef> {
  template <typename FormatContext>
  auto format(const rollnode::BlockId &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<rollnode::BlockIdRef>::format(
        rollnode::BlockIdRef{v.number, v.hash}, ctx);
  }
};
