/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"

namespace slotwatch::api::jrpc {

  using RequestId = uint64_t;

  /// Positional parameter of a JSON-RPC call
  using Param = std::variant<std::nullptr_t, std::string, uint64_t>;

  /// Error object of a JSON-RPC 2.0 response
  struct RpcError {
    int64_t code{};
    std::string message;
  };

  /**
   * Serializes JSON-RPC 2.0 request
   * @param id - request id, echoed back by the node
   * @param method - rpc method name
   * @param params - positional parameters
   */
  std::string makeRequest(RequestId id,
                          std::string_view method,
                          const std::vector<Param> &params);

  /**
   * Parsed JSON-RPC 2.0 response. Owns the parsed document, result accessors
   * interpret the `result` member in the shape a particular method returns.
   */
  class Response {
   public:
    /**
     * Parses text of the response and checks that it answers request `id`
     */
    static outcome::result<Response> parse(std::string_view text,
                                           RequestId id);

    /// Error object, if node answered with one
    const std::optional<RpcError> &error() const {
      return error_;
    }

    /// `result` is a string or null
    outcome::result<std::optional<std::string>> asOptionalString() const;

    /// `result` is a string
    outcome::result<std::string> asString() const;

    /// `result` is a boolean
    outcome::result<bool> asBool() const;

    /// `result` is a header object or null
    outcome::result<std::optional<primitives::BlockHeader>> asHeader() const;

   private:
    Response() = default;

    rapidjson::Document document_;
    std::optional<RpcError> error_;
  };

  /**
   * Decodes a header object in the form chain_getHeader returns it
   */
  outcome::result<primitives::BlockHeader> decodeHeader(
      const rapidjson::Value &value);

}  // namespace slotwatch::api::jrpc
