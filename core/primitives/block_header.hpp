/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/common.hpp"
#include "primitives/digest.hpp"

namespace slotwatch::primitives {
  /**
   * @struct BlockHeader represents header of a block as reported by the node
   */
  struct BlockHeader {
    BlockNumber number{};              ///< Block number (height)
    BlockHash parent_hash{};           ///< Parent block hash
    common::Hash256 state_root{};      ///< Merkle tree root of state
    common::Hash256 extrinsics_root{};  ///< Hash of included extrinsics
    Digest digest{};                   ///< Chain-specific auxiliary data

    bool operator==(const BlockHeader &) const = default;
  };

}  // namespace slotwatch::primitives
