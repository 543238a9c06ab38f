/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/aura/aura_digest.hpp"

#include <algorithm>

#include <boost/endian/conversion.hpp>

namespace slotwatch::consensus::aura {

  std::optional<SlotNumber> getAuraSlot(const primitives::BlockHeader &header) {
    for (const auto &item : header.digest) {
      if (item.type != primitives::DigestItem::Type::PreRuntime
          or item.engine_id != primitives::kAuraEngineId) {
        continue;
      }
      if (item.data.size() < sizeof(SlotNumber)) {
        return std::nullopt;
      }
      SlotNumber slot = 0;
      std::copy_n(item.data.begin(),
                  sizeof(SlotNumber),
                  reinterpret_cast<uint8_t *>(&slot));  // NOLINT
      return boost::endian::little_to_native(slot);
    }
    return std::nullopt;
  }

}  // namespace slotwatch::consensus::aura
