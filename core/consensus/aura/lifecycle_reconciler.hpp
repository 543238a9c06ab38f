/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "api/chain_rpc.hpp"
#include "clock/clock.hpp"
#include "consensus/aura/types.hpp"
#include "log/logger.hpp"
#include "primitives/authority.hpp"
#include "primitives/block_header.hpp"
#include "storage/schedule_store.hpp"

namespace slotwatch::consensus::aura {

  /**
   * Promotes own slots along Scheduled -> Minted -> Finalized as blocks
   * appear at the best head and become finalized.
   */
  class LifecycleReconciler {
   public:
    /**
     * @param store - schedule storage, may be null when nothing is persisted
     */
    LifecycleReconciler(std::shared_ptr<api::ChainRpc> rpc,
                        std::shared_ptr<storage::ScheduleStore> store,
                        std::shared_ptr<clock::SystemClock> clock,
                        primitives::AuthorityId identity);

    /**
     * Handles best head observed in this iteration. If the head is new and
     * its slot is ours according to the current authority set, the slot is
     * marked as minted.
     */
    outcome::result<void> onBestHead(
        PollState &state,
        const primitives::BlockHash &head_hash,
        const primitives::BlockHeader &head,
        const primitives::AuthorityList &authorities);

    /**
     * Marks as finalized the slots of every block numbered in
     * (state.last_finalized, finalized_number]. Blocks which can't be
     * resolved are skipped. The marker then moves to finalized_number.
     */
    outcome::result<void> onFinalizedHead(PollState &state,
                                          uint64_t finalized_number);

   private:
    /// Timestamp.Now of the block, local time if it is unavailable
    TimestampMs producedTime(const primitives::BlockHash &hash) const;

    outcome::result<void> promote(SlotNumber slot,
                                  primitives::BlockNumber number,
                                  const primitives::BlockHash &hash,
                                  SlotStatus status);

    std::shared_ptr<api::ChainRpc> rpc_;
    std::shared_ptr<storage::ScheduleStore> store_;
    std::shared_ptr<clock::SystemClock> clock_;
    const primitives::AuthorityId identity_;
    log::Logger log_;
  };

}  // namespace slotwatch::consensus::aura
