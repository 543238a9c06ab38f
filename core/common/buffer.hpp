/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace slotwatch::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    Buffer(Base &&other) : Base(std::move(other)) {}

    explicit Buffer(const Base &other) : Base(other) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end) {}

    using Base::Base;
    using Base::operator=;

    operator BufferView() const {
      return view();
    }

    BufferView view() const {
      return {data(), size()};
    }

    Buffer &put(BufferView view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    std::string toHex() const {
      return hex_lower(view());
    }

    std::string_view toStringView() const {
      return view().toStringView();
    }

    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return Buffer{std::move(bytes)};
    }

    static Buffer fromString(std::string_view str) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      const auto *ptr = reinterpret_cast<const uint8_t *>(str.data());
      return {ptr, ptr + str.size()};  // NOLINT
    }
  };

}  // namespace slotwatch::common

template <>
struct fmt::formatter<slotwatch::common::Buffer>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const slotwatch::common::Buffer &buffer, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "0x{}", buffer.toHex());
  }
};
