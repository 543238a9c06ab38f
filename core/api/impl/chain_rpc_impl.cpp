/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/impl/chain_rpc_impl.hpp"

#include <boost/assert.hpp>
#include <scale/scale.hpp>

#include "api/storage_keys.hpp"
#include "api/transport/error.hpp"
#include "common/hexutil.hpp"
#include "scale/scale_codec.hpp"

namespace slotwatch::api {

  namespace {
    outcome::result<primitives::BlockHash> toHash(std::string_view hex) {
      return primitives::BlockHash::fromHexWithPrefix(hex);
    }
  }  // namespace

  ChainRpcImpl::ChainRpcImpl(std::shared_ptr<RpcConnection> connection)
      : connection_{std::move(connection)},
        log_{log::createLogger("ChainRpc", "rpc")} {
    BOOST_ASSERT(connection_ != nullptr);
  }

  outcome::result<jrpc::Response> ChainRpcImpl::call(
      std::string_view method, std::vector<jrpc::Param> params) {
    const auto id = next_id_++;
    auto payload = jrpc::makeRequest(id, method, params);
    OUTCOME_TRY(text, connection_->request(payload));
    auto response_res = jrpc::Response::parse(text, id);
    if (response_res.has_error()) {
      SL_ERROR(log_,
               "Bad response to {} (id {}): {}",
               method,
               id,
               response_res.error());
      return response_res.as_failure();
    }
    auto &response = response_res.value();
    if (const auto &err = response.error()) {
      SL_ERROR(log_,
               "Node returned error for {}: {} (code {})",
               method,
               err->message,
               err->code);
      return TransportError::RPC_ERROR;
    }
    return std::move(response);
  }

  outcome::result<std::optional<common::Buffer>> ChainRpcImpl::getStorage(
      std::string_view key, const std::optional<primitives::BlockHash> &at) {
    std::vector<jrpc::Param> params{std::string{key}};
    if (at.has_value()) {
      params.emplace_back(at->toHex0x());
    }
    OUTCOME_TRY(response, call("state_getStorage", std::move(params)));
    OUTCOME_TRY(value, response.asOptionalString());
    if (not value.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(bytes, common::unhexWith0x(value.value()));
    return common::Buffer{std::move(bytes)};
  }

  outcome::result<std::optional<uint64_t>> ChainRpcImpl::timestamp(
      const std::optional<primitives::BlockHash> &at) {
    OUTCOME_TRY(value, getStorage(storage_keys::kTimestampNow, at));
    if (not value.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(ts, scale::decode<uint64_t>(value->view()));
    return ts;
  }

  outcome::result<uint64_t> ChainRpcImpl::slotDuration() {
    OUTCOME_TRY(response,
                call("state_call",
                     {std::string{storage_keys::kAuraSlotDurationCall},
                      std::string{"0x"}}));
    OUTCOME_TRY(hex, response.asString());
    OUTCOME_TRY(bytes, common::unhexWith0x(hex));
    OUTCOME_TRY(duration,
                scale::decode<uint64_t>(common::Buffer{std::move(bytes)}));
    if (duration == 0) {
      SL_ERROR(log_, "Node reported zero slot duration");
      return TransportError::UNEXPECTED_RESULT;
    }
    return duration;
  }

  outcome::result<primitives::AuthorityList> ChainRpcImpl::authorities() {
    OUTCOME_TRY(value, getStorage(storage_keys::kAuraAuthorities, std::nullopt));
    if (not value.has_value()) {
      return primitives::AuthorityList{};
    }
    return decodeAuthorities(value->view());
  }

  outcome::result<primitives::BlockHash> ChainRpcImpl::bestHead() {
    OUTCOME_TRY(response, call("chain_getBlockHash", {}));
    OUTCOME_TRY(hex, response.asString());
    return toHash(hex);
  }

  outcome::result<primitives::BlockHash> ChainRpcImpl::finalizedHead() {
    OUTCOME_TRY(response, call("chain_getFinalizedHead", {}));
    OUTCOME_TRY(hex, response.asString());
    return toHash(hex);
  }

  outcome::result<std::optional<primitives::BlockHash>> ChainRpcImpl::blockHash(
      primitives::BlockNumber number) {
    OUTCOME_TRY(response,
                call("chain_getBlockHash", {static_cast<uint64_t>(number)}));
    OUTCOME_TRY(hex, response.asOptionalString());
    if (not hex.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(hash, toHash(hex.value()));
    return hash;
  }

  outcome::result<std::optional<primitives::BlockHeader>> ChainRpcImpl::header(
      const primitives::BlockHash &hash) {
    OUTCOME_TRY(response, call("chain_getHeader", {hash.toHex0x()}));
    return response.asHeader();
  }

  outcome::result<bool> ChainRpcImpl::hasKey(common::BufferView public_key,
                                             std::string_view key_type) {
    OUTCOME_TRY(response,
                call("author_hasKey",
                     {common::hex_lower_0x(public_key), std::string{key_type}}));
    return response.asBool();
  }

  outcome::result<primitives::AuthorityList> decodeAuthorities(
      common::BufferView bytes) {
    constexpr size_t kKeySize = primitives::AuthorityId::size();
    try {
      ::scale::ScaleDecoderStream s(bytes);
      ::scale::CompactInteger count;
      s >> count;
      if (count > bytes.size() / kKeySize) {
        return TransportError::UNEXPECTED_RESULT;
      }

      primitives::AuthorityList list;
      list.resize(count.convert_to<size_t>());
      for (auto &authority : list) {
        for (auto &byte : authority) {
          s >> byte;
        }
      }
      if (s.hasMore(1)) {
        return TransportError::UNEXPECTED_RESULT;
      }
      return list;
    } catch (const std::system_error &e) {
      return e.code();
    }
  }

}  // namespace slotwatch::api
