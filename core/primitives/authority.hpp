/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/blob.hpp"

namespace slotwatch::primitives {

  /// Aura authority public key (sr25519)
  using AuthorityId = common::Blob<32>;

  /// Ordered authority set; position defines round-robin slot assignment
  using AuthorityList = std::vector<AuthorityId>;

}  // namespace slotwatch::primitives
