/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <fmt/format.h>

#include "common/blob.hpp"

namespace slotwatch::primitives {
  using BlockNumber = uint32_t;
  using BlockHash = common::Hash256;

  struct BlockInfo {
    BlockNumber number{};
    BlockHash hash{};

    bool operator==(const BlockInfo &) const = default;
  };

}  // namespace slotwatch::primitives

template <>
struct fmt::formatter<slotwatch::primitives::BlockInfo> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const slotwatch::primitives::BlockInfo &block,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "#{} ({:s})", block.number, block.hash);
  }
};
