/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "common/buffer_view.hpp"
#include "outcome/outcome.hpp"
#include "primitives/authority.hpp"
#include "primitives/block_header.hpp"

namespace slotwatch::api {

  /**
   * Read access to the chain a node follows, plus the keystore query needed
   * to confirm validator identity. Every call is a blocking round trip.
   */
  class ChainRpc {
   public:
    virtual ~ChainRpc() = default;

    /**
     * @param at - block to read state at, best block if none
     * @return Timestamp.Now in milliseconds, none if storage has no value
     */
    virtual outcome::result<std::optional<uint64_t>> timestamp(
        const std::optional<primitives::BlockHash> &at) = 0;

    /**
     * @return Aura slot duration in milliseconds
     */
    virtual outcome::result<uint64_t> slotDuration() = 0;

    /**
     * @return current Aura authorities at best block, empty if storage has
     * no value
     */
    virtual outcome::result<primitives::AuthorityList> authorities() = 0;

    /**
     * @return hash of the best block
     */
    virtual outcome::result<primitives::BlockHash> bestHead() = 0;

    /**
     * @return hash of the last finalized block
     */
    virtual outcome::result<primitives::BlockHash> finalizedHead() = 0;

    virtual outcome::result<std::optional<primitives::BlockHash>> blockHash(
        primitives::BlockNumber number) = 0;

    virtual outcome::result<std::optional<primitives::BlockHeader>> header(
        const primitives::BlockHash &hash) = 0;

    /**
     * Checks if node keystore has a key
     * @param public_key - public key bytes
     * @param key_type - four-character key type, i.e. "aura"
     */
    virtual outcome::result<bool> hasKey(common::BufferView public_key,
                                         std::string_view key_type) = 0;
  };

}  // namespace slotwatch::api
