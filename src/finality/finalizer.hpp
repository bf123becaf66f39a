/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "types/l1_block_ref.hpp"
#include "types/l2_block_ref.hpp"
#include "utils/context.hpp"

namespace rollnode::finality {

  /**
   * Maps L1 finality signals onto the L2 chain.
   *
   * Remembers which L2 blocks were derived from which L1 blocks, and
   * finalizes an L2 block only once its L1 provenance is final and still
   * canonical.
   */
  class Finalizer {
   public:
    virtual ~Finalizer() = default;

    /**
     * L1 chain (incl.) that included or produced all finalized L2 blocks.
     * Zeroed if no finality signal has been seen yet.
     */
    [[nodiscard]] virtual L1BlockRef currentFinalizedL1() const = 0;

    /**
     * Applies an L1 finality signal and tries to finalize L2 blocks.
     * Signals older than the current one are ignored. Failures are logged,
     * the signal itself is kept anyway.
     */
    virtual void finalize(const Context &ctx, const L1BlockRef &l1_origin) = 0;

    /**
     * Called when L1 block `derived_from` has been fully exhausted, i.e. no
     * more L2 blocks will be derived from it.
     * @return TemporaryError if L1 could not be checked, ResetError if the
     * local view is off the finalizing L1 chain. The code carries no cause:
     * the L1 source's own error, or the expected and fetched blocks, are
     * logged as a warning by the `Finalizer` logger before returning.
     */
    virtual outcome::result<void> onDerivationBoundary(
        const Context &ctx, const L1BlockRef &derived_from) = 0;

    /**
     * Remembers that `l2_safe` is the last L2 block fully derived from
     * `derived_from`, to finalize it once that L1 block finalizes.
     */
    virtual void recordProvenance(const L2BlockRef &l2_safe,
                                  const L1BlockRef &derived_from) = 0;

    /**
     * Forgets recent provenance so reorged-out L2 blocks never get
     * finalized. Finalized L1 is kept.
     */
    virtual void reset() = 0;
  };

}  // namespace rollnode::finality
