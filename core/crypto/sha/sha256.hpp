/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/blob.hpp"

namespace slotwatch::crypto {
  /// SHA-256 of the bytes of a string, used for text fingerprints in tests
  common::Hash256 sha256(std::string_view input);

  /**
   * SHA-256 of raw bytes. Fingerprints of authority sets and own schedules
   * are built with it.
   */
  common::Hash256 sha256(common::BufferView input);
}  // namespace slotwatch::crypto
