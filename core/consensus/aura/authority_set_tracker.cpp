/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/aura/authority_set_tracker.hpp"

#include <algorithm>

#include <boost/assert.hpp>

#include "crypto/sha/sha256.hpp"

namespace slotwatch::consensus::aura {

  AuthoritySetTracker::AuthoritySetTracker(std::shared_ptr<api::ChainRpc> rpc)
      : rpc_{std::move(rpc)}, log_{log::createLogger("AuthoritySet", "aura")} {
    BOOST_ASSERT(rpc_ != nullptr);
  }

  outcome::result<primitives::AuthorityList> AuthoritySetTracker::fetch()
      const {
    OUTCOME_TRY(authorities, rpc_->authorities());
    SL_TRACE(log_, "Fetched {} authorities", authorities.size());
    return authorities;
  }

  common::Hash256 AuthoritySetTracker::fingerprint(
      const primitives::AuthorityList &authorities) {
    common::Buffer concatenated;
    concatenated.reserve(authorities.size() * primitives::AuthorityId::size());
    for (const auto &authority : authorities) {
      concatenated.put(authority.view());
    }
    return crypto::sha256(concatenated.view());
  }

  bool AuthoritySetTracker::changed(
      const std::optional<AuthoritySetFingerprint> &prev,
      const AuthoritySetFingerprint &current) {
    return not prev.has_value() or prev.value() != current;
  }

  bool AuthoritySetTracker::contains(
      const primitives::AuthorityList &authorities,
      const primitives::AuthorityId &identity) {
    return std::find(authorities.begin(), authorities.end(), identity)
        != authorities.end();
  }

}  // namespace slotwatch::consensus::aura
