/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "types/l2_block_ref.hpp"

namespace rollnode::finality {

  struct ProvenanceLink {
    /// Last L2 block fully derived and inserted while processing `l1_block`
    L2BlockRef l2_block;
    /// Once this L1 block is finalized, L2 chain up to `l2_block` can be
    /// fully reproduced from finalized L1 data
    BlockId l1_block;

    bool operator==(const ProvenanceLink &) const = default;
  };

  /**
   * Fixed-capacity ring of provenance links, oldest first.
   * Appending to a full buffer drops the oldest link.
   */
  class ProvenanceBuffer {
   public:
    explicit ProvenanceBuffer(size_t capacity);

    size_t size() const {
      return size_;
    }

    size_t capacity() const {
      return slots_.size();
    }

    bool empty() const {
      return size_ == 0;
    }

    /// Link at logical position `index`, 0 is the oldest
    const ProvenanceLink &operator[](size_t index) const;

    const ProvenanceLink &front() const;
    const ProvenanceLink &back() const;
    ProvenanceLink &back();

    /**
     * Appends `link` as the newest entry.
     * @return evicted oldest link if buffer was full
     */
    std::optional<ProvenanceLink> push(ProvenanceLink link);

    void clear();

    template <typename F>
    void forEach(F &&f) const {
      for (size_t i = 0; i < size_; ++i) {
        f((*this)[i]);
      }
    }

    std::vector<ProvenanceLink> toVector() const;

   private:
    size_t physical(size_t index) const {
      return (start_ + index) % slots_.size();
    }

    std::vector<ProvenanceLink> slots_;
    size_t start_ = 0;
    size_t size_ = 0;
  };

}  // namespace rollnode::finality

template <>
struct fmt::formatter<rollnode::finality::ProvenanceLink> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const rollnode::finality::ProvenanceLink &v,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "L1 {} -> L2 {}", v.l1_block, v.l2_block);
  }
};
