/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "consensus/aura/types.hpp"

/**
 * SCALE layout of stored schedule records. Hashes are written as raw 32
 * bytes, optional values with the usual one byte presence flag.
 */
namespace slotwatch::consensus::aura {

  namespace detail {
    template <class Stream>
    void encodeHash(Stream &s, const common::Hash256 &hash) {
      for (auto byte : hash) {
        s << byte;
      }
    }

    template <class Stream>
    void decodeHash(Stream &s, common::Hash256 &hash) {
      for (auto &byte : hash) {
        s >> byte;
      }
    }
  }  // namespace detail

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const EpochInfo &info) {
    s << info.epoch << info.start_slot << info.end_slot;
    detail::encodeHash(s, info.authority_set_hash);
    return s << info.authority_set_len << info.created_at_ms;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, EpochInfo &info) {
    s >> info.epoch >> info.start_slot >> info.end_slot;
    detail::decodeHash(s, info.authority_set_hash);
    return s >> info.authority_set_len >> info.created_at_ms;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const SlotRecord &record) {
    s << record.slot << record.epoch << record.planned_time_ms
      << record.block_number;
    s << static_cast<uint8_t>(record.block_hash.has_value() ? 1 : 0);
    if (record.block_hash.has_value()) {
      detail::encodeHash(s, record.block_hash.value());
    }
    return s << record.produced_time_ms
             << static_cast<uint8_t>(record.status);
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, SlotRecord &record) {
    s >> record.slot >> record.epoch >> record.planned_time_ms
        >> record.block_number;
    uint8_t has_hash = 0;
    s >> has_hash;
    if (has_hash == 1) {
      common::Hash256 hash;
      detail::decodeHash(s, hash);
      record.block_hash = hash;
    } else if (has_hash == 0) {
      record.block_hash.reset();
    } else {
      ::scale::raise(::scale::DecodeError::WRONG_TYPE_INDEX);
    }
    uint8_t status = 0;
    s >> record.produced_time_ms >> status;
    if (status > static_cast<uint8_t>(SlotStatus::Finalized)) {
      ::scale::raise(::scale::DecodeError::WRONG_TYPE_INDEX);
    }
    record.status = static_cast<SlotStatus>(status);
    return s;
  }

}  // namespace slotwatch::consensus::aura
