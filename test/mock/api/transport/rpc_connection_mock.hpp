/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "api/transport/rpc_connection.hpp"

#include <gmock/gmock.h>

namespace slotwatch::api {

  class RpcConnectionMock : public RpcConnection {
   public:
    MOCK_METHOD(outcome::result<void>, connect, (), (override));

    MOCK_METHOD(outcome::result<std::string>,
                request,
                (std::string_view),
                (override));

    MOCK_METHOD(void, close, (), (override));
  };

}  // namespace slotwatch::api
