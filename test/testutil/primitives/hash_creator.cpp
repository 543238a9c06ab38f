/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/primitives/mp_utils.hpp"

#include <boost/endian/conversion.hpp>

namespace testutil {
  slotwatch::common::Hash256 createHash256(std::initializer_list<uint8_t> bytes) {
    slotwatch::common::Hash256 h;
    h.fill(0u);
    std::copy_n(bytes.begin(), bytes.size(), h.begin());
    return h;
  }

  slotwatch::primitives::AuthorityId createAuthority(uint8_t byte) {
    slotwatch::primitives::AuthorityId id;
    id.fill(byte);
    return id;
  }

  slotwatch::primitives::BlockHeader makeAuraHeader(
      slotwatch::primitives::BlockNumber number,
      slotwatch::consensus::aura::SlotNumber slot) {
    using slotwatch::primitives::DigestItem;
    slotwatch::primitives::BlockHeader header;
    header.number = number;
    header.parent_hash = createHash256({0xfe, static_cast<uint8_t>(number)});

    DigestItem pre_runtime;
    pre_runtime.type = DigestItem::Type::PreRuntime;
    pre_runtime.engine_id = slotwatch::primitives::kAuraEngineId;
    pre_runtime.data.resize(sizeof(slot));
    boost::endian::store_little_u64(pre_runtime.data.data(), slot);
    header.digest.push_back(std::move(pre_runtime));
    return header;
  }
}  // namespace testutil
