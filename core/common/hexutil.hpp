/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/hex.hpp>

#include "outcome/outcome.hpp"

namespace slotwatch::common {

  class BufferView;

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    VALUE_OUT_OF_RANGE,
    MISSING_0X_PREFIX,
    UNKNOWN
  };
}  // namespace slotwatch::common

OUTCOME_HPP_DECLARE_ERROR(slotwatch::common, UnhexError);

namespace slotwatch::common {
  /**
   * @brief Converts bytes to hex representation
   * @param bytes source bytes
   * @return hexstring
   */
  std::string hex_lower(BufferView bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   * @param bytes source bytes
   * @return hexstring
   */
  std::string hex_lower_0x(BufferView bytes);

  template <std::output_iterator<uint8_t> Iter>
  outcome::result<void> unhex_to(std::string_view hex, Iter out) {
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), out);
      return outcome::success();

    } catch (const boost::algorithm::not_enough_input &e) {
      return UnhexError::NOT_ENOUGH_INPUT;

    } catch (const boost::algorithm::non_hex_input &e) {
      return UnhexError::NON_HEX_INPUT;

    } catch (const std::exception &e) {
      return UnhexError::UNKNOWN;
    }
  }

  /**
   * @brief Converts hex representation to bytes
   * @param hex individual chars
   * @return result containing array of bytes if input string is hex encoded
   * and has even length
   *
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   * @param hex hex string with 0x in the beginning
   * @return unhexed buffer
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

  /**
   * @brief unhex hex-string with 0x in the beginning as big-endian number
   * @tparam T unsigned integer value type to decode
   * @param value source hex string
   * @return unhexed value
   */
  template <class T, typename = std::enable_if<std::is_unsigned_v<T>>>
  outcome::result<T> unhexNumber(std::string_view value) {
    constexpr std::string_view prefix = "0x";
    if (not value.starts_with(prefix)) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    value.remove_prefix(prefix.size());
    if (value.empty()) {
      return UnhexError::NOT_ENOUGH_INPUT;
    }
    // JSON-RPC quantities drop leading zero nibbles
    if (value.size() > sizeof(T) * 2) {
      return UnhexError::VALUE_OUT_OF_RANGE;
    }

    T result{0u};
    for (auto ch : value) {
      uint8_t nibble = 0;
      if (ch >= '0' and ch <= '9') {
        nibble = ch - '0';
      } else if (ch >= 'a' and ch <= 'f') {
        nibble = ch - 'a' + 10;
      } else if (ch >= 'A' and ch <= 'F') {
        nibble = ch - 'A' + 10;
      } else {
        return UnhexError::NON_HEX_INPUT;
      }
      if constexpr (sizeof(T) > 1) {
        result <<= 4u;
      } else {
        result = static_cast<T>(result << 4u);
      }
      result += nibble;
    }

    return result;
  }

}  // namespace slotwatch::common
