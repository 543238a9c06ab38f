/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/identity_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slotwatch::identity, IdentityError, e) {
  using E = slotwatch::identity::IdentityError;
  switch (e) {
    case E::NO_KEY_FOUND:
      return "no aura key found in keystore: expected a file named like "
             "61757261<32 bytes of public key in hex>";
    case E::AMBIGUOUS_IDENTITY:
      return "multiple aura keys found in keystore; keep only one aura key "
             "or use a dedicated keystore path";
    case E::KEYSTORE_UNREADABLE:
      return "keystore directory can not be read";
    case E::KEY_NOT_IN_NODE:
      return "aura key is not present in the keystore of the node";
  }
  return "unknown IdentityError";
}
