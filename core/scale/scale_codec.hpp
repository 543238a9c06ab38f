/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>
#include <vector>

#include <scale/scale.hpp>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace slotwatch::scale {

  /**
   * @brief encodes all arguments one after another into a single byte vector
   * @return encoded data or encoder error
   */
  template <typename... Args>
  outcome::result<common::Buffer> encode(const Args &...args) {
    try {
      ::scale::ScaleEncoderStream s{};
      (s << ... << args);
      return common::Buffer{s.to_vector()};
    } catch (const std::system_error &e) {
      return e.code();
    }
  }

  /**
   * @brief decodes a value of type T from the whole of provided bytes
   * @return decoded value or decoder error
   */
  template <typename T>
  outcome::result<T> decode(common::BufferView bytes) {
    try {
      ::scale::ScaleDecoderStream s(bytes);
      T value{};
      s >> value;
      return value;
    } catch (const std::system_error &e) {
      return e.code();
    }
  }

}  // namespace slotwatch::scale
