/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "api/chain_rpc.hpp"
#include "clock/clock.hpp"
#include "consensus/aura/authority_set_tracker.hpp"
#include "consensus/aura/lifecycle_reconciler.hpp"
#include "consensus/aura/types.hpp"
#include "log/logger.hpp"
#include "storage/schedule_store.hpp"

namespace slotwatch::consensus::aura {

  struct PollSchedulerConfig {
    /// slots per epoch
    EpochLength epoch_size{};
    /// pinned epoch; derived from the latest slot if none
    std::optional<EpochNumber> epoch;
    /// number of slots to scan from epoch start; whole epoch if none
    std::optional<SlotNumber> slots;
    /// longest sleep between iterations
    std::chrono::seconds watch_interval{};
  };

  /**
   * One observation pass over the chain: authority set, own schedule of the
   * current epoch, best and finalized heads. Also decides how long to wait
   * before the next pass.
   */
  class PollScheduler {
   public:
    /**
     * @param store - schedule storage, may be null when nothing is persisted
     */
    PollScheduler(PollSchedulerConfig config,
                  std::shared_ptr<api::ChainRpc> rpc,
                  std::shared_ptr<AuthoritySetTracker> tracker,
                  std::shared_ptr<LifecycleReconciler> reconciler,
                  std::shared_ptr<storage::ScheduleStore> store,
                  std::shared_ptr<clock::SystemClock> clock,
                  primitives::AuthorityId identity);

    /**
     * Runs one iteration
     * @param state - observations of the previous iteration
     * @return updated state and facts needed to plan the next iteration
     */
    outcome::result<IterationReport> runOnce(PollState state);

    /**
     * Pinned epoch polls at the fixed interval. Otherwise waits until just
     * after the next epoch boundary, but not longer than the fixed interval.
     */
    std::chrono::seconds nextSleep(const IterationReport &report) const;

   private:
    outcome::result<void> updateSchedule(
        PollState &state,
        const EpochWindow &window,
        bool epoch_switched,
        const primitives::AuthorityList &authorities,
        SlotNumber latest_slot,
        TimestampMs latest_time_ms,
        uint64_t slot_duration_ms);

    const PollSchedulerConfig config_;
    std::shared_ptr<api::ChainRpc> rpc_;
    std::shared_ptr<AuthoritySetTracker> tracker_;
    std::shared_ptr<LifecycleReconciler> reconciler_;
    std::shared_ptr<storage::ScheduleStore> store_;
    std::shared_ptr<clock::SystemClock> clock_;
    const primitives::AuthorityId identity_;
    log::Logger log_;
  };

}  // namespace slotwatch::consensus::aura
