/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "api/chain_rpc.hpp"
#include "consensus/aura/types.hpp"
#include "log/logger.hpp"
#include "primitives/authority.hpp"

namespace slotwatch::consensus::aura {

  /**
   * Reads the Aura authority set and detects when it changes
   */
  class AuthoritySetTracker {
   public:
    explicit AuthoritySetTracker(std::shared_ptr<api::ChainRpc> rpc);

    /**
     * @return authorities at the best block; empty if the chain has none
     */
    outcome::result<primitives::AuthorityList> fetch() const;

    /**
     * SHA-256 over the concatenation of keys in their order
     */
    static common::Hash256 fingerprint(
        const primitives::AuthorityList &authorities);

    /**
     * @return true if digest or length differs, or there was no previous
     * observation
     */
    static bool changed(const std::optional<AuthoritySetFingerprint> &prev,
                        const AuthoritySetFingerprint &current);

    static bool contains(const primitives::AuthorityList &authorities,
                         const primitives::AuthorityId &identity);

   private:
    std::shared_ptr<api::ChainRpc> rpc_;
    log::Logger log_;
  };

}  // namespace slotwatch::consensus::aura
