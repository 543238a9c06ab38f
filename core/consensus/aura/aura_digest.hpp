/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "consensus/aura/types.hpp"
#include "primitives/block_header.hpp"

namespace slotwatch::consensus::aura {

  /**
   * Finds the slot a block was authored in. Aura puts it into the first
   * pre-runtime digest tagged with its engine id, as little-endian u64.
   * @return slot number or none if header carries no such digest
   */
  std::optional<SlotNumber> getAuraSlot(const primitives::BlockHeader &header);

}  // namespace slotwatch::consensus::aura
