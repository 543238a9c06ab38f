/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "consensus/aura/types.hpp"
#include "outcome/outcome.hpp"

namespace slotwatch::storage {

  using consensus::aura::EpochInfo;
  using consensus::aura::EpochNumber;
  using consensus::aura::PlannedSlot;
  using consensus::aura::SlotNumber;
  using consensus::aura::SlotRecord;
  using consensus::aura::SlotStatus;
  using consensus::aura::TimestampMs;

  /**
   * @return true if a slot in status `from` may be moved to status `to`.
   * Only forward moves to Minted or Finalized are allowed.
   */
  inline bool isStatusUpgrade(SlotStatus from, SlotStatus to) {
    switch (to) {
      case SlotStatus::Minted:
        return from == SlotStatus::Scheduled;
      case SlotStatus::Finalized:
        return from == SlotStatus::Scheduled or from == SlotStatus::Minted;
      case SlotStatus::Scheduled:
        break;
    }
    return false;
  }

  /**
   * Durable record of epochs and own slots lifecycle
   */
  class ScheduleStore {
   public:
    virtual ~ScheduleStore() = default;

    /**
     * Inserts epoch info or overwrites the one stored for the same epoch
     */
    virtual outcome::result<void> upsertEpochInfo(const EpochInfo &info) = 0;

    /**
     * Writes all planned slots of an epoch in a single atomic batch.
     * New slots are stored as Scheduled; Scheduled slots get epoch and
     * planned time overwritten; Minted and Finalized slots stay as they are.
     */
    virtual outcome::result<void> insertSchedule(
        EpochNumber epoch, const std::vector<PlannedSlot> &planned) = 0;

    /**
     * Moves a stored slot to `status` and records the block, if the move is
     * an upgrade (see isStatusUpgrade). Missing slots are ignored.
     * @return true if the slot was changed
     */
    virtual outcome::result<bool> updateBlockStatus(
        SlotNumber slot,
        primitives::BlockNumber number,
        const primitives::BlockHash &hash,
        TimestampMs produced_time_ms,
        SlotStatus status) = 0;

    virtual outcome::result<std::optional<EpochInfo>> getEpochInfo(
        EpochNumber epoch) const = 0;

    virtual outcome::result<std::optional<SlotRecord>> getSlot(
        SlotNumber slot) const = 0;

    /**
     * @return stored slots of the epoch in ascending slot order
     */
    virtual outcome::result<std::vector<SlotRecord>> slotsOfEpoch(
        EpochNumber epoch) const = 0;
  };

}  // namespace slotwatch::storage
