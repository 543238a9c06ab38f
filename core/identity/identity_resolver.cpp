/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/identity_resolver.hpp"

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string/trim.hpp>
#include <boost/assert.hpp>

#include "common/buffer.hpp"
#include "common/hexutil.hpp"
#include "identity/identity_error.hpp"

namespace slotwatch::identity {

  namespace {
    constexpr size_t kPublicKeyHexLength =
        primitives::AuthorityId::size() * 2;

    std::string normalize(std::string_view name) {
      std::string normalized{boost::algorithm::trim_copy(std::string{name})};
      std::transform(normalized.begin(),
                     normalized.end(),
                     normalized.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      if (normalized.starts_with("0x")) {
        normalized.erase(0, 2);
      }
      return normalized;
    }

    bool isHex(std::string_view str) {
      return std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
      });
    }
  }  // namespace

  IdentityResolver::IdentityResolver(std::shared_ptr<api::ChainRpc> rpc)
      : rpc_{std::move(rpc)}, log_{log::createLogger("Identity", "identity")} {
    BOOST_ASSERT(rpc_ != nullptr);
  }

  outcome::result<primitives::AuthorityId> IdentityResolver::resolve(
      const std::vector<std::string> &file_names) {
    static const std::string key_type_tag =
        common::hex_lower(common::Buffer::fromString(kAuraKeyType));

    std::vector<std::string> found;
    for (const auto &name : file_names) {
      auto hex = normalize(name);
      if (hex.size() != key_type_tag.size() + kPublicKeyHexLength
          or not hex.starts_with(key_type_tag)) {
        continue;
      }
      auto public_key = hex.substr(key_type_tag.size());
      if (isHex(public_key)) {
        found.emplace_back(std::move(public_key));
      }
    }

    std::sort(found.begin(), found.end());
    found.erase(std::unique(found.begin(), found.end()), found.end());

    if (found.empty()) {
      return IdentityError::NO_KEY_FOUND;
    }
    if (found.size() > 1) {
      auto log = log::createLogger("Identity", "identity");
      for (const auto &key : found) {
        SL_ERROR(log, "Aura key candidate: 0x{}", key);
      }
      return IdentityError::AMBIGUOUS_IDENTITY;
    }
    return primitives::AuthorityId::fromHex(found.front());
  }

  outcome::result<void> IdentityResolver::confirm(
      const primitives::AuthorityId &identity) const {
    OUTCOME_TRY(has_key, rpc_->hasKey(identity.view(), kAuraKeyType));
    if (not has_key) {
      SL_ERROR(log_,
               "Refusing to run: aura key {} is not present in the keystore "
               "of the node",
               identity.toHex0x());
      return IdentityError::KEY_NOT_IN_NODE;
    }
    SL_INFO(log_, "Node holds aura key {}", identity.toHex0x());
    return outcome::success();
  }

}  // namespace slotwatch::identity
