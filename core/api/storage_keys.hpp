/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

namespace slotwatch::api::storage_keys {

  /// twox128("Aura") ++ twox128("Authorities")
  constexpr std::string_view kAuraAuthorities =
      "0x57f8dc2f5ab09467896f47300f0424385e0621c4869aa60c02be9adcc98a0d1d";

  /// twox128("Timestamp") ++ twox128("Now")
  constexpr std::string_view kTimestampNow =
      "0xf0c365c3cf59d671eb72da0e7a4113c49f1f0515f462cdcf84e0f1d6045dfcbb";

  /// Runtime API call returning slot duration in milliseconds
  constexpr std::string_view kAuraSlotDurationCall = "AuraApi_slot_duration";

}  // namespace slotwatch::api::storage_keys
