/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace rollnode {
  using BlockNumber = uint64_t;
  using TimestampSeconds = uint64_t;
}  // namespace rollnode
