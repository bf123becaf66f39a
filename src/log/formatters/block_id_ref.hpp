/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "types/block_hash.hpp"
#include "types/block_number.hpp"

namespace rollnode {
  struct BlockIdRef {
    BlockNumber number;
    const BlockHash &hash;
  };
}  // namespace rollnode

template <>
struct fmt::formatter<rollnode::BlockIdRef> {
  // Presentation format
  bool long_form = false;

  // Parses format specifications of the form ['s' | 'l'].
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end) {
      if (*it == 'l' or *it == 's') {
        long_form = *it == 'l';
        ++it;
      }
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  // Formats the block id using the parsed format specification (presentation)
  // stored in this formatter.
  template <typename FormatContext>
  auto format(const rollnode::BlockIdRef &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    [[unlikely]] if (long_form) {
      return fmt::format_to(ctx.out(), "{:0xx} @ {}", v.hash, v.number);
    }
    return fmt::format_to(ctx.out(), "{:0x} @ {}", v.hash, v.number);
  }
};
