/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace slotwatch::consensus::aura {

  enum class ReconcileError {
    BLOCK_NUMBER_OVERFLOW = 1,
  };

}  // namespace slotwatch::consensus::aura

OUTCOME_HPP_DECLARE_ERROR(slotwatch::consensus::aura, ReconcileError)
