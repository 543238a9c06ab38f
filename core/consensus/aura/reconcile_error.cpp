/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/aura/reconcile_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slotwatch::consensus::aura, ReconcileError, e) {
  using E = slotwatch::consensus::aura::ReconcileError;
  switch (e) {
    case E::BLOCK_NUMBER_OVERFLOW:
      return "finalized block number does not fit 32-bit block number";
  }
  return "unknown error (slotwatch::consensus::aura::ReconcileError)";
}
