/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/aura/types.hpp"

namespace slotwatch::consensus::aura {

  std::string_view toString(SlotStatus status) {
    switch (status) {
      case SlotStatus::Scheduled:
        return "schedule";
      case SlotStatus::Minted:
        return "mint";
      case SlotStatus::Finalized:
        return "finality";
    }
    return "unknown";
  }

  std::optional<SlotStatus> slotStatusFromString(std::string_view str) {
    for (auto status :
         {SlotStatus::Scheduled, SlotStatus::Minted, SlotStatus::Finalized}) {
      if (toString(status) == str) {
        return status;
      }
    }
    return std::nullopt;
  }

}  // namespace slotwatch::consensus::aura
