/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/aura/lifecycle_reconciler.hpp"

#include <limits>

#include <boost/assert.hpp>

#include "consensus/aura/aura_digest.hpp"
#include "consensus/aura/reconcile_error.hpp"
#include "consensus/aura/schedule_computer.hpp"

namespace slotwatch::consensus::aura {

  LifecycleReconciler::LifecycleReconciler(
      std::shared_ptr<api::ChainRpc> rpc,
      std::shared_ptr<storage::ScheduleStore> store,
      std::shared_ptr<clock::SystemClock> clock,
      primitives::AuthorityId identity)
      : rpc_{std::move(rpc)},
        store_{std::move(store)},
        clock_{std::move(clock)},
        identity_{identity},
        log_{log::createLogger("Reconciler", "reconciler")} {
    BOOST_ASSERT(rpc_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
  }

  outcome::result<void> LifecycleReconciler::onBestHead(
      PollState &state,
      const primitives::BlockHash &head_hash,
      const primitives::BlockHeader &head,
      const primitives::AuthorityList &authorities) {
    if (state.best_hash == head_hash) {
      return outcome::success();
    }
    state.best_hash = head_hash;

    const primitives::BlockInfo block{head.number, head_hash};
    auto slot = getAuraSlot(head);
    if (not slot.has_value()) {
      SL_DEBUG(log_, "Best block {} has no aura slot digest", block);
      return outcome::success();
    }

    // the author is checked against the set known now, not at the block
    auto expected = ScheduleComputer::expectedAuthor(authorities, *slot);
    if (not expected.has_value() or expected.value() != identity_) {
      SL_TRACE(log_, "Best block {} in slot {} is not ours", block, *slot);
      return outcome::success();
    }

    SL_INFO(log_, "Own slot {} minted block {}", *slot, block);
    return promote(*slot, head.number, head_hash, SlotStatus::Minted);
  }

  outcome::result<void> LifecycleReconciler::onFinalizedHead(
      PollState &state, uint64_t finalized_number) {
    if (finalized_number <= state.last_finalized) {
      return outcome::success();
    }
    SL_DEBUG(log_,
             "Finality advanced from #{} to #{}",
             state.last_finalized,
             finalized_number);

    for (auto n = state.last_finalized + 1; n <= finalized_number; ++n) {
      if (n > std::numeric_limits<primitives::BlockNumber>::max()) {
        SL_ERROR(log_, "Finalized block number {} is out of range", n);
        return ReconcileError::BLOCK_NUMBER_OVERFLOW;
      }
      const auto number = static_cast<primitives::BlockNumber>(n);

      auto hash_res = rpc_->blockHash(number);
      if (hash_res.has_error()) {
        SL_WARN(log_,
                "Can't get hash of finalized block #{}: {}; skip",
                number,
                hash_res.error());
        continue;
      }
      if (not hash_res.value().has_value()) {
        SL_WARN(log_, "Node has no finalized block #{}; skip", number);
        continue;
      }
      const auto &hash = hash_res.value().value();
      const primitives::BlockInfo block{number, hash};

      auto header_res = rpc_->header(hash);
      if (header_res.has_error()) {
        SL_WARN(log_,
                "Can't get header of finalized block {}: {}; skip",
                block,
                header_res.error());
        continue;
      }
      if (not header_res.value().has_value()) {
        SL_WARN(log_, "Node has no header of block {}; skip", block);
        continue;
      }

      auto slot = getAuraSlot(header_res.value().value());
      if (not slot.has_value()) {
        SL_WARN(log_, "Finalized block {} has no aura slot; skip", block);
        continue;
      }

      OUTCOME_TRY(promote(*slot, number, hash, SlotStatus::Finalized));
    }

    // TODO: stop at the first skipped number so it is retried next pass
    state.last_finalized = finalized_number;
    return outcome::success();
  }

  TimestampMs LifecycleReconciler::producedTime(
      const primitives::BlockHash &hash) const {
    auto ts_res = rpc_->timestamp(hash);
    if (ts_res.has_value() and ts_res.value().has_value()) {
      return static_cast<TimestampMs>(ts_res.value().value());
    }
    if (ts_res.has_error()) {
      SL_WARN(log_,
              "Can't get timestamp of block {:l}: {}; use local time",
              hash,
              ts_res.error());
    }
    return static_cast<TimestampMs>(clock_->nowMillis());
  }

  outcome::result<void> LifecycleReconciler::promote(
      SlotNumber slot,
      primitives::BlockNumber number,
      const primitives::BlockHash &hash,
      SlotStatus status) {
    if (store_ == nullptr) {
      return outcome::success();
    }
    OUTCOME_TRY(changed,
                store_->updateBlockStatus(
                    slot, number, hash, producedTime(hash), status));
    if (changed) {
      SL_DEBUG(log_, "Slot {} is now in status {}", slot, status);
    }
    return outcome::success();
  }

}  // namespace slotwatch::consensus::aura
