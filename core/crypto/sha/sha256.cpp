/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <openssl/sha.h>

namespace slotwatch::crypto {
  common::Hash256 sha256(std::string_view input) {
    return sha256(common::BufferView{
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<const uint8_t *>(input.data()),
        input.size()});
  }

  common::Hash256 sha256(common::BufferView input) {
    common::Hash256 out;
    SHA256(input.data(), input.size(), out.data());
    return out;
  }
}  // namespace slotwatch::crypto
