/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "api/chain_rpc.hpp"

#include <memory>
#include <vector>

#include "api/jrpc/jrpc_codec.hpp"
#include "api/transport/rpc_connection.hpp"
#include "log/logger.hpp"

namespace slotwatch::api {

  /**
   * ChainRpc speaking Substrate JSON-RPC through a request/response
   * connection
   */
  class ChainRpcImpl final : public ChainRpc {
   public:
    explicit ChainRpcImpl(std::shared_ptr<RpcConnection> connection);

    outcome::result<std::optional<uint64_t>> timestamp(
        const std::optional<primitives::BlockHash> &at) override;

    outcome::result<uint64_t> slotDuration() override;

    outcome::result<primitives::AuthorityList> authorities() override;

    outcome::result<primitives::BlockHash> bestHead() override;

    outcome::result<primitives::BlockHash> finalizedHead() override;

    outcome::result<std::optional<primitives::BlockHash>> blockHash(
        primitives::BlockNumber number) override;

    outcome::result<std::optional<primitives::BlockHeader>> header(
        const primitives::BlockHash &hash) override;

    outcome::result<bool> hasKey(common::BufferView public_key,
                                 std::string_view key_type) override;

   private:
    outcome::result<jrpc::Response> call(std::string_view method,
                                         std::vector<jrpc::Param> params);

    outcome::result<std::optional<common::Buffer>> getStorage(
        std::string_view key, const std::optional<primitives::BlockHash> &at);

    std::shared_ptr<RpcConnection> connection_;
    jrpc::RequestId next_id_ = 1;
    log::Logger log_;
  };

  /**
   * Decodes SCALE Vec<[u8; 32]> of Aura authorities
   */
  outcome::result<primitives::AuthorityList> decodeAuthorities(
      common::BufferView bytes);

}  // namespace slotwatch::api
