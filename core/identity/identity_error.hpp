/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace slotwatch::identity {

  enum class IdentityError {
    NO_KEY_FOUND = 1,
    AMBIGUOUS_IDENTITY,
    KEYSTORE_UNREADABLE,
    KEY_NOT_IN_NODE,
  };

}  // namespace slotwatch::identity

OUTCOME_HPP_DECLARE_ERROR(slotwatch::identity, IdentityError)
