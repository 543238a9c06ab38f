/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "consensus/aura/types.hpp"
#include "primitives/authority.hpp"

namespace slotwatch::consensus::aura {

  /**
   * Round-robin slot assignment of Aura: slot `s` belongs to
   * `authorities[s % authorities.size()]`.
   */
  class ScheduleComputer {
   public:
    /**
     * @return slots in [start_slot, start_slot + window_len) assigned to
     * identity, ascending; empty if there are no authorities
     */
    static std::vector<SlotNumber> ownSlots(
        const primitives::AuthorityList &authorities,
        const primitives::AuthorityId &identity,
        SlotNumber start_slot,
        SlotNumber window_len);

    /**
     * SHA-256 over little-endian u64 encodings of the slots in given order
     */
    static common::Hash256 scheduleFingerprint(
        const std::vector<SlotNumber> &slots);

    /**
     * Extrapolates wall-clock time of a slot from a reference slot whose
     * time is known
     */
    static TimestampMs projectTime(SlotNumber slot,
                                   SlotNumber ref_slot,
                                   TimestampMs ref_time_ms,
                                   uint64_t slot_duration_ms);

    /**
     * @param scan_override - number of slots to scan instead of whole epoch
     */
    static EpochWindow epochWindow(EpochNumber epoch,
                                   EpochLength epoch_size,
                                   std::optional<SlotNumber> scan_override);

    /// @return authority the slot is assigned to, none for empty set
    static std::optional<primitives::AuthorityId> expectedAuthor(
        const primitives::AuthorityList &authorities, SlotNumber slot);
  };

}  // namespace slotwatch::consensus::aura
