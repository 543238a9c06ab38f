/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/aura/schedule_computer.hpp"

#include <array>

#include <boost/endian/conversion.hpp>

#include "common/buffer.hpp"
#include "crypto/sha/sha256.hpp"

namespace slotwatch::consensus::aura {

  std::vector<SlotNumber> ScheduleComputer::ownSlots(
      const primitives::AuthorityList &authorities,
      const primitives::AuthorityId &identity,
      SlotNumber start_slot,
      SlotNumber window_len) {
    std::vector<SlotNumber> slots;
    if (authorities.empty()) {
      return slots;
    }
    const auto n = static_cast<SlotNumber>(authorities.size());
    for (SlotNumber i = 0; i < window_len; ++i) {
      const auto slot = start_slot + i;
      if (authorities[slot % n] == identity) {
        slots.push_back(slot);
      }
    }
    return slots;
  }

  common::Hash256 ScheduleComputer::scheduleFingerprint(
      const std::vector<SlotNumber> &slots) {
    common::Buffer encoded;
    encoded.reserve(slots.size() * sizeof(SlotNumber));
    for (auto slot : slots) {
      std::array<uint8_t, sizeof(SlotNumber)> le{};
      boost::endian::store_little_u64(le.data(), slot);
      encoded.insert(encoded.end(), le.begin(), le.end());
    }
    return crypto::sha256(encoded.view());
  }

  TimestampMs ScheduleComputer::projectTime(SlotNumber slot,
                                            SlotNumber ref_slot,
                                            TimestampMs ref_time_ms,
                                            uint64_t slot_duration_ms) {
    const auto delta =
        static_cast<int64_t>(slot) - static_cast<int64_t>(ref_slot);
    return ref_time_ms + delta * static_cast<int64_t>(slot_duration_ms);
  }

  EpochWindow ScheduleComputer::epochWindow(
      EpochNumber epoch,
      EpochLength epoch_size,
      std::optional<SlotNumber> scan_override) {
    EpochWindow window;
    window.epoch = epoch;
    window.start_slot = epoch * epoch_size;
    window.end_slot = window.start_slot + (epoch_size > 0 ? epoch_size - 1 : 0);
    window.scan_len = scan_override.value_or(epoch_size);
    return window;
  }

  std::optional<primitives::AuthorityId> ScheduleComputer::expectedAuthor(
      const primitives::AuthorityList &authorities, SlotNumber slot) {
    if (authorities.empty()) {
      return std::nullopt;
    }
    return authorities[slot % authorities.size()];
  }

}  // namespace slotwatch::consensus::aura
