/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "types/l1_block_ref.hpp"
#include "utils/context.hpp"

namespace rollnode::finality {

  class L1BlockSource {
   public:
    virtual ~L1BlockSource() = default;

    /**
     * Currently canonical L1 block at height `number`
     * @param ctx cancellation and deadline of the caller
     * @return block or error; any error is treated as transient
     */
    virtual outcome::result<L1BlockRef> blockByNumber(const Context &ctx,
                                                      BlockNumber number) = 0;
  };

}  // namespace rollnode::finality
