/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "api/chain_rpc.hpp"
#include "log/logger.hpp"
#include "primitives/authority.hpp"

namespace slotwatch::identity {

  /// Key type of Aura authority keys
  constexpr std::string_view kAuraKeyType = "aura";

  /**
   * Finds out which Aura authority the observed node runs as
   */
  class IdentityResolver {
   public:
    explicit IdentityResolver(std::shared_ptr<api::ChainRpc> rpc);

    /**
     * Picks the only Aura key among keystore file names. A name is trimmed,
     * lowercased and stripped of 0x, then must be the hex of "aura" followed
     * by 64 hex digits of public key.
     * @return public key, IdentityError::NO_KEY_FOUND if there is none,
     * IdentityError::AMBIGUOUS_IDENTITY if there are several distinct ones
     */
    static outcome::result<primitives::AuthorityId> resolve(
        const std::vector<std::string> &file_names);

    /**
     * Asks the node whether it holds the key for Aura
     * @return IdentityError::KEY_NOT_IN_NODE if it does not
     */
    outcome::result<void> confirm(
        const primitives::AuthorityId &identity) const;

   private:
    std::shared_ptr<api::ChainRpc> rpc_;
    log::Logger log_;
  };

}  // namespace slotwatch::identity
