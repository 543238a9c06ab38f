/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/format.h>

#include "common/blob.hpp"
#include "primitives/common.hpp"

namespace slotwatch::consensus::aura {

  /// slot number of the block production
  using SlotNumber = uint64_t;

  /// number of the epoch, i.e. slot / epoch length
  using EpochNumber = uint64_t;

  // number of slots in a single epoch
  using EpochLength = SlotNumber;

  /// unix time in milliseconds; signed, projected times may precede the
  /// reference point
  using TimestampMs = int64_t;

  /// Lifecycle of an own slot. Order of enumerators is the order of progress.
  enum class SlotStatus : uint8_t {
    Scheduled = 0,
    Minted = 1,
    Finalized = 2,
  };

  /// textual form used in logs: "schedule", "mint", "finality"
  std::string_view toString(SlotStatus status);

  std::optional<SlotStatus> slotStatusFromString(std::string_view str);

  /// Content digest of an ordered authority set plus its size
  struct AuthoritySetFingerprint {
    common::Hash256 digest;
    size_t length{};

    bool operator==(const AuthoritySetFingerprint &) const = default;
  };

  /// Slot range of one epoch and the authority set it was computed for
  struct EpochInfo {
    EpochNumber epoch{};
    SlotNumber start_slot{};
    SlotNumber end_slot{};
    common::Hash256 authority_set_hash;
    uint64_t authority_set_len{};
    TimestampMs created_at_ms{};

    bool operator==(const EpochInfo &) const = default;
  };

  /// Persisted state of an own slot
  struct SlotRecord {
    SlotNumber slot{};
    EpochNumber epoch{};
    TimestampMs planned_time_ms{};
    std::optional<primitives::BlockNumber> block_number;
    std::optional<primitives::BlockHash> block_hash;
    std::optional<TimestampMs> produced_time_ms;
    SlotStatus status{SlotStatus::Scheduled};

    bool operator==(const SlotRecord &) const = default;
  };

  /// Own slot with its projected wall-clock time
  struct PlannedSlot {
    SlotNumber slot{};
    TimestampMs planned_time_ms{};

    bool operator==(const PlannedSlot &) const = default;
  };

  /// Bounds of the epoch being observed and the part of it that is scanned
  struct EpochWindow {
    EpochNumber epoch{};
    SlotNumber start_slot{};
    SlotNumber end_slot{};
    SlotNumber scan_len{};

    bool operator==(const EpochWindow &) const = default;
  };

  /**
   * Observations carried from one poll iteration to the next
   */
  struct PollState {
    std::optional<AuthoritySetFingerprint> authorities;
    std::optional<EpochNumber> epoch;
    std::optional<common::Hash256> own_schedule;
    std::optional<bool> author_present;
    bool identity_reported = false;
    std::optional<primitives::BlockHash> best_hash;
    uint64_t last_finalized = 0;

    bool operator==(const PollState &) const = default;
  };

  /// Outcome of one poll iteration
  struct IterationReport {
    PollState state;
    EpochNumber epoch{};
    SlotNumber latest_slot{};
    uint64_t slot_duration_ms{};
  };

}  // namespace slotwatch::consensus::aura

template <>
struct fmt::formatter<slotwatch::consensus::aura::SlotStatus>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(slotwatch::consensus::aura::SlotStatus status,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        slotwatch::consensus::aura::toString(status), ctx);
  }
};
