/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <optional>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "finality/execution_target.hpp"
#include "finality/finality_config.hpp"
#include "finality/finality_error.hpp"
#include "finality/finalizer.hpp"
#include "finality/l1_block_source.hpp"
#include "finality/provenance_buffer.hpp"
#include "log/logger.hpp"

namespace rollnode::finality {

  /**
   * Every public call holds `mutex_` for its whole duration, including the
   * L1 fetches done while finalizing, so concurrent callers are serialized.
   */
  class FinalizerImpl final : public Finalizer, NonCopyable, NonMovable {
   public:
    FinalizerImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                  const FinalityConfig &config,
                  qtils::SharedRef<L1BlockSource> l1_source,
                  qtils::SharedRef<ExecutionTarget> execution_target);

    L1BlockRef currentFinalizedL1() const override;

    void finalize(const Context &ctx, const L1BlockRef &l1_origin) override;

    outcome::result<void> onDerivationBoundary(
        const Context &ctx, const L1BlockRef &derived_from) override;

    void recordProvenance(const L2BlockRef &l2_safe,
                          const L1BlockRef &derived_from) override;

    void reset() override;

    uint64_t lookback() const {
      return lookback_;
    }

    /// Copy of the buffered provenance, oldest first
    std::vector<ProvenanceLink> provenanceSnapshot() const;

   private:
    // Both expect `mutex_` to be held by the caller
    outcome::result<void> tryFinalize(const Context &ctx);
    outcome::result<L1BlockRef> fetchL1(const Context &ctx,
                                        BlockNumber number,
                                        TemporaryError unavailable);

    log::Logger logger_;
    const uint64_t lookback_;
    const uint64_t finality_delay_;
    qtils::SharedRef<L1BlockSource> l1_source_;
    qtils::SharedRef<ExecutionTarget> execution_target_;

    mutable std::mutex mutex_;

    // May be ahead of the currently traversed L1 origin while syncing
    L1BlockRef finalized_l1_;

    // L1 number at which finalization was last tried during traversal
    BlockNumber tried_finalize_at_ = 0;

    ProvenanceBuffer provenance_;
  };

}  // namespace rollnode::finality
