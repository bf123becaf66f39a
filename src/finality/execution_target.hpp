/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/l2_block_ref.hpp"

namespace rollnode::finality {

  /// Holder of the node's finalized L2 head (the execution engine side)
  class ExecutionTarget {
   public:
    virtual ~ExecutionTarget() = default;

    [[nodiscard]] virtual L2BlockRef currentFinalized() const = 0;

    virtual void setFinalized(const L2BlockRef &block) = 0;
  };

}  // namespace rollnode::finality
