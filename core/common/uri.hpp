/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace slotwatch::common {

  /**
   * Parsed form of a node endpoint like ws://127.0.0.1:9944/path
   */
  struct Uri final {
   public:
    std::string Schema;
    std::string Host;
    std::string Port;
    std::string Path;

    static Uri parse(std::string_view uri);

    std::string toString() const;

    const std::optional<std::string_view> &error() const {
      return error_;
    }

   private:
    std::optional<std::string_view> error_;
  };

}  // namespace slotwatch::common
