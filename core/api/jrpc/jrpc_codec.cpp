/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/jrpc/jrpc_codec.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "api/transport/error.hpp"
#include "common/hexutil.hpp"
#include "scale/scale_codec.hpp"

namespace slotwatch::api::jrpc {

  namespace {
    template <typename... Ts>
    struct overloaded : Ts... {
      using Ts::operator()...;
    };

    outcome::result<common::Hash256> decodeHash(const rapidjson::Value &obj,
                                                const char *name) {
      auto it = obj.FindMember(name);
      if (it == obj.MemberEnd() or not it->value.IsString()) {
        return TransportError::UNEXPECTED_RESULT;
      }
      return common::Hash256::fromHexWithPrefix(
          {it->value.GetString(), it->value.GetStringLength()});
    }
  }  // namespace

  std::string makeRequest(RequestId id,
                          std::string_view method,
                          const std::vector<Param> &params) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer writer(buffer);
    writer.StartObject();
    writer.Key("jsonrpc");
    writer.String("2.0");
    writer.Key("id");
    writer.Uint64(id);
    writer.Key("method");
    writer.String(method.data(), method.size());
    writer.Key("params");
    writer.StartArray();
    for (const auto &param : params) {
      std::visit(overloaded{
                     [&](std::nullptr_t) { writer.Null(); },
                     [&](const std::string &str) {
                       writer.String(str.data(), str.size());
                     },
                     [&](uint64_t number) { writer.Uint64(number); },
                 },
                 param);
    }
    writer.EndArray();
    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
  }

  outcome::result<Response> Response::parse(std::string_view text,
                                            RequestId id) {
    Response response;
    auto &doc = response.document_;
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError() or not doc.IsObject()) {
      return TransportError::MALFORMED_RESPONSE;
    }

    auto version = doc.FindMember("jsonrpc");
    if (version == doc.MemberEnd() or not version->value.IsString()
        or std::string_view{version->value.GetString()} != "2.0") {
      return TransportError::MALFORMED_RESPONSE;
    }

    auto id_it = doc.FindMember("id");
    if (id_it == doc.MemberEnd() or not id_it->value.IsUint64()) {
      return TransportError::MALFORMED_RESPONSE;
    }
    if (id_it->value.GetUint64() != id) {
      return TransportError::UNEXPECTED_RESPONSE_ID;
    }

    if (auto err = doc.FindMember("error"); err != doc.MemberEnd()) {
      const auto &obj = err->value;
      if (not obj.IsObject()) {
        return TransportError::MALFORMED_RESPONSE;
      }
      RpcError rpc_error;
      if (auto code = obj.FindMember("code");
          code != obj.MemberEnd() and code->value.IsInt64()) {
        rpc_error.code = code->value.GetInt64();
      }
      if (auto msg = obj.FindMember("message");
          msg != obj.MemberEnd() and msg->value.IsString()) {
        rpc_error.message.assign(msg->value.GetString(),
                                 msg->value.GetStringLength());
      }
      response.error_ = std::move(rpc_error);
      return response;
    }

    if (not doc.HasMember("result")) {
      return TransportError::MALFORMED_RESPONSE;
    }
    return response;
  }

  outcome::result<std::optional<std::string>> Response::asOptionalString()
      const {
    if (error_) {
      return TransportError::RPC_ERROR;
    }
    const auto &result = document_["result"];
    if (result.IsNull()) {
      return std::nullopt;
    }
    if (not result.IsString()) {
      return TransportError::UNEXPECTED_RESULT;
    }
    return std::string{result.GetString(), result.GetStringLength()};
  }

  outcome::result<std::string> Response::asString() const {
    OUTCOME_TRY(str, asOptionalString());
    if (not str.has_value()) {
      return TransportError::UNEXPECTED_RESULT;
    }
    return std::move(str.value());
  }

  outcome::result<bool> Response::asBool() const {
    if (error_) {
      return TransportError::RPC_ERROR;
    }
    const auto &result = document_["result"];
    if (not result.IsBool()) {
      return TransportError::UNEXPECTED_RESULT;
    }
    return result.GetBool();
  }

  outcome::result<std::optional<primitives::BlockHeader>> Response::asHeader()
      const {
    if (error_) {
      return TransportError::RPC_ERROR;
    }
    const auto &result = document_["result"];
    if (result.IsNull()) {
      return std::nullopt;
    }
    OUTCOME_TRY(header, decodeHeader(result));
    return header;
  }

  outcome::result<primitives::BlockHeader> decodeHeader(
      const rapidjson::Value &value) {
    if (not value.IsObject()) {
      return TransportError::UNEXPECTED_RESULT;
    }
    primitives::BlockHeader header;

    auto number = value.FindMember("number");
    if (number == value.MemberEnd() or not number->value.IsString()) {
      return TransportError::UNEXPECTED_RESULT;
    }
    OUTCOME_TRY(
        block_number,
        common::unhexNumber<primitives::BlockNumber>(
            {number->value.GetString(), number->value.GetStringLength()}));
    header.number = block_number;

    OUTCOME_TRY(parent_hash, decodeHash(value, "parentHash"));
    header.parent_hash = parent_hash;
    OUTCOME_TRY(state_root, decodeHash(value, "stateRoot"));
    header.state_root = state_root;
    OUTCOME_TRY(extrinsics_root, decodeHash(value, "extrinsicsRoot"));
    header.extrinsics_root = extrinsics_root;

    auto digest = value.FindMember("digest");
    if (digest == value.MemberEnd() or not digest->value.IsObject()) {
      return TransportError::UNEXPECTED_RESULT;
    }
    auto logs = digest->value.FindMember("logs");
    if (logs == digest->value.MemberEnd() or not logs->value.IsArray()) {
      return TransportError::UNEXPECTED_RESULT;
    }
    for (const auto &log : logs->value.GetArray()) {
      if (not log.IsString()) {
        return TransportError::UNEXPECTED_RESULT;
      }
      OUTCOME_TRY(bytes,
                  common::unhexWith0x({log.GetString(), log.GetStringLength()}));
      OUTCOME_TRY(item,
                  scale::decode<primitives::DigestItem>(common::BufferView{
                      std::span<const uint8_t>{bytes.data(), bytes.size()}}));
      header.digest.emplace_back(std::move(item));
    }
    return header;
  }

}  // namespace slotwatch::api::jrpc
