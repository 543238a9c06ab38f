/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"

namespace slotwatch::primitives {

  /// Consensus engine unique ID
  using ConsensusEngineId = common::Blob<4>;

  inline const auto kAuraEngineId =
      ConsensusEngineId{{'a', 'u', 'r', 'a'}};

  /**
   * Item of the block header digest. Only engine-tagged items carry an engine
   * id; the rest keep their payload in `data`.
   */
  struct DigestItem {
    /// SCALE variant indices of sp_runtime::DigestItem
    enum class Type : uint8_t {
      Other = 0,
      Consensus = 4,
      Seal = 5,
      PreRuntime = 6,
      RuntimeEnvironmentUpdated = 8,
    };

    Type type{Type::Other};
    ConsensusEngineId engine_id{};
    common::Buffer data{};

    bool operator==(const DigestItem &) const = default;
  };

  using Digest = std::vector<DigestItem>;

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const DigestItem &item) {
    s << static_cast<uint8_t>(item.type);
    switch (item.type) {
      case DigestItem::Type::Consensus:
      case DigestItem::Type::Seal:
      case DigestItem::Type::PreRuntime:
        for (auto byte : item.engine_id) {
          s << byte;
        }
        return s << static_cast<const std::vector<uint8_t> &>(item.data);
      case DigestItem::Type::Other:
        return s << static_cast<const std::vector<uint8_t> &>(item.data);
      case DigestItem::Type::RuntimeEnvironmentUpdated:
        return s;
    }
    return s;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, DigestItem &item) {
    uint8_t index = 0;
    s >> index;
    item.type = static_cast<DigestItem::Type>(index);
    switch (item.type) {
      case DigestItem::Type::Consensus:
      case DigestItem::Type::Seal:
      case DigestItem::Type::PreRuntime:
        for (auto &byte : item.engine_id) {
          s >> byte;
        }
        return s >> static_cast<std::vector<uint8_t> &>(item.data);
      case DigestItem::Type::Other:
        return s >> static_cast<std::vector<uint8_t> &>(item.data);
      case DigestItem::Type::RuntimeEnvironmentUpdated:
        return s;
    }
    ::scale::raise(::scale::DecodeError::WRONG_TYPE_INDEX);
    return s;
  }

}  // namespace slotwatch::primitives
