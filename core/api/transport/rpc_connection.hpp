/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "outcome/outcome.hpp"

namespace slotwatch::api {

  /**
   * Blocking request/response channel to the node. One request is in flight
   * at a time; the call returns the raw text of the matching response.
   */
  class RpcConnection {
   public:
    virtual ~RpcConnection() = default;

    virtual outcome::result<void> connect() = 0;

    virtual outcome::result<std::string> request(std::string_view payload) = 0;

    virtual void close() = 0;
  };

}  // namespace slotwatch::api
