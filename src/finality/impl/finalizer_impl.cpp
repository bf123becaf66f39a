/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "finality/impl/finalizer_impl.hpp"

namespace rollnode::finality {

  FinalizerImpl::FinalizerImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      const FinalityConfig &config,
      qtils::SharedRef<L1BlockSource> l1_source,
      qtils::SharedRef<ExecutionTarget> execution_target)
      : logger_(logsys->getLogger("Finalizer", "finality")),
        lookback_(calcFinalityLookback(config)),
        finality_delay_(config.finality_delay),
        l1_source_(std::move(l1_source)),
        execution_target_(std::move(execution_target)),
        provenance_(lookback_) {
    SL_DEBUG(logger_,
             "Finalizer created: lookback={}, delay={}",
             lookback_,
             finality_delay_);
  }

  L1BlockRef FinalizerImpl::currentFinalizedL1() const {
    std::lock_guard lock(mutex_);
    return finalized_l1_;
  }

  void FinalizerImpl::finalize(const Context &ctx,
                               const L1BlockRef &l1_origin) {
    std::lock_guard lock(mutex_);
    if (l1_origin.number < finalized_l1_.number) {
      SL_ERROR(logger_,
               "Ignoring old L1 finalized block signal! "
               "Is the L1 provider corrupted? prev={}, signaled={}",
               finalized_l1_,
               l1_origin);
      return;
    }

    if (finalized_l1_ != l1_origin) {
      // give finalization a shot with the new signal right away
      tried_finalize_at_ = 0;
      finalized_l1_ = l1_origin;
      SL_DEBUG(logger_, "Accepted L1 finality signal {}", finalized_l1_);
    }

    if (auto res = tryFinalize(ctx); res.has_error()) {
      SL_WARN(logger_,
              "Received L1 finalization signal {}, but was unable to "
              "determine and apply L2 finality: {}",
              l1_origin,
              res.error());
    }
  }

  outcome::result<void> FinalizerImpl::onDerivationBoundary(
      const Context &ctx, const L1BlockRef &derived_from) {
    std::lock_guard lock(mutex_);
    if (finalized_l1_ == L1BlockRef{}) {
      // no L1 finality information yet
      return outcome::success();
    }
    // Tried recently; traverse more of L1 first
    if (tried_finalize_at_ != 0
        and (derived_from.number <= tried_finalize_at_
             or derived_from.number - tried_finalize_at_ <= finality_delay_)) {
      return outcome::success();
    }
    SL_INFO(logger_,
            "Processing L1 finality information: "
            "l1_finalized={}, derived_from={}, previous={}",
            finalized_l1_,
            derived_from,
            tried_finalize_at_);
    tried_finalize_at_ = derived_from.number;
    return tryFinalize(ctx);
  }

  void FinalizerImpl::recordProvenance(const L2BlockRef &l2_safe,
                                       const L1BlockRef &derived_from) {
    std::lock_guard lock(mutex_);
    if (provenance_.empty()
        or provenance_.back().l1_block.number < derived_from.number) {
      auto evicted = provenance_.push(ProvenanceLink{
          .l2_block = l2_safe,
          .l1_block = derived_from.id(),
      });
      if (evicted.has_value()) {
        SL_TRACE(logger_, "Pruned finality data {}", evicted.value());
      }
      SL_DEBUG(logger_, "Extended finality data: {}", provenance_.back());
      return;
    }

    // Another L2 block derived from the same latest L1 block
    auto &last = provenance_.back();
    if (last.l2_block != l2_safe) {
      last.l2_block = l2_safe;
      SL_DEBUG(logger_, "Updated finality data: {}", last);
    }
  }

  void FinalizerImpl::reset() {
    std::lock_guard lock(mutex_);
    provenance_.clear();
    tried_finalize_at_ = 0;
    // finalized L1 stays, it is final after all
    SL_DEBUG(logger_,
             "Finality data reset, finalized L1 kept at {}",
             finalized_l1_);
  }

  std::vector<ProvenanceLink> FinalizerImpl::provenanceSnapshot() const {
    std::lock_guard lock(mutex_);
    return provenance_.toVector();
  }

  outcome::result<void> FinalizerImpl::tryFinalize(const Context &ctx) {
    auto finalized_l2 = execution_target_->currentFinalized();
    std::optional<BlockId> finalized_derived_from;

    // Last L2 block derived from a finalized L1 block. Later links may
    // extend finality further, so the whole buffer is scanned.
    provenance_.forEach([&](const ProvenanceLink &link) {
      if (link.l2_block.number > finalized_l2.number
          and link.l1_block.number <= finalized_l1_.number) {
        finalized_l2 = link.l2_block;
        finalized_derived_from = link.l1_block;
      }
    });

    if (not finalized_derived_from.has_value()) {
      return outcome::success();
    }

    // The signal itself has to be canonical to proceed
    OUTCOME_TRY(signal_ref,
                fetchL1(ctx,
                        finalized_l1_.number,
                        TemporaryError::SIGNAL_BLOCK_UNAVAILABLE));
    if (signal_ref.hash != finalized_l1_.hash) {
      SL_WARN(logger_,
              "Need to reset: assumed {} is finalized, "
              "but canonical chain has {}",
              finalized_l1_,
              signal_ref);
      return ResetError::SIGNAL_NOT_CANONICAL;
    }

    // Derivation has to be on the finalizing chain too
    const auto &derived_from = finalized_derived_from.value();
    OUTCOME_TRY(derived_ref,
                fetchL1(ctx,
                        derived_from.number,
                        TemporaryError::DERIVED_FROM_UNAVAILABLE));
    if (derived_ref.hash != derived_from.hash) {
      SL_WARN(logger_,
              "Need to reset: derived from {}, which is not on "
              "the finalizing L1 chain {} (towards {})",
              derived_from,
              derived_ref,
              finalized_l1_);
      return ResetError::DERIVED_FROM_NOT_CANONICAL;
    }

    execution_target_->setFinalized(finalized_l2);
    SL_INFO(logger_,
            "Finalized L2 block {} derived from L1 {}",
            finalized_l2,
            derived_from);
    return outcome::success();
  }

  outcome::result<L1BlockRef> FinalizerImpl::fetchL1(
      const Context &ctx, BlockNumber number, TemporaryError unavailable) {
    if (auto res = ctx.check(); res.has_error()) {
      SL_WARN(logger_,
              "Not checking L1 block {} for finality: {}",
              number,
              res.error());
      if (res.error() == ContextError::DEADLINE_EXCEEDED) {
        return TemporaryError::FETCH_DEADLINE_EXCEEDED;
      }
      return TemporaryError::FETCH_CANCELLED;
    }
    auto res = l1_source_->blockByNumber(ctx, number);
    if (res.has_error()) {
      SL_WARN(logger_,
              "Failed to check if on finalizing L1 chain, "
              "could not fetch block {}: {}",
              number,
              res.error());
      return unavailable;
    }
    return res.value();
  }

}  // namespace rollnode::finality
