/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "finality/execution_target.hpp"

namespace rollnode::finality {

  class ExecutionTargetMock : public ExecutionTarget {
   public:
    MOCK_METHOD(L2BlockRef, currentFinalized, (), (const, override));

    MOCK_METHOD(void, setFinalized, (const L2BlockRef &block), (override));
  };

}  // namespace rollnode::finality
