/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>

#include <boost/endian/conversion.hpp>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>

#include "common/buffer.hpp"
#include "log/logger.hpp"
#include "storage/database_error.hpp"

namespace slotwatch::storage {
  inline DatabaseError status_as_error(const rocksdb::Status &s) {
    if (s.IsNotFound()) {
      return DatabaseError::NOT_FOUND;
    }

    if (s.IsIOError()) {
      static log::Logger log = log::createLogger("RocksDb", "storage");
      SL_ERROR(log, ":{}", s.ToString());
      return DatabaseError::IO_ERROR;
    }

    if (s.IsInvalidArgument()) {
      return DatabaseError::INVALID_ARGUMENT;
    }

    if (s.IsCorruption()) {
      return DatabaseError::CORRUPTION;
    }

    if (s.IsNotSupported()) {
      return DatabaseError::NOT_SUPPORTED;
    }

    return DatabaseError::UNKNOWN;
  }

  inline rocksdb::Slice make_slice(const common::BufferView &buf) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *ptr = reinterpret_cast<const char *>(buf.data());
    return rocksdb::Slice{ptr, buf.size()};
  }

  inline common::BufferView make_span(const rocksdb::Slice &s) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return std::span<const uint8_t>{
        reinterpret_cast<const uint8_t *>(s.data()), s.size()};
  }

  /// Keys are big-endian so that iteration order follows numeric order
  using NumberKey = std::array<uint8_t, sizeof(uint64_t)>;

  inline NumberKey make_key(uint64_t number) {
    NumberKey key{};
    boost::endian::store_big_u64(key.data(), number);
    return key;
  }

  inline rocksdb::Slice make_slice(const NumberKey &key) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const char *>(key.data()), key.size()};
  }
}  // namespace slotwatch::storage
