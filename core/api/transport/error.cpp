/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/transport/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slotwatch::api, TransportError, e) {
  using slotwatch::api::TransportError;
  switch (e) {
    case TransportError::INVALID_ENDPOINT:
      return "invalid node endpoint, expected ws[s]://host[:port][/path]";
    case TransportError::CONNECTION_FAILED:
      return "cannot connect to the node";
    case TransportError::NOT_CONNECTED:
      return "connection to the node is not established";
    case TransportError::SEND_FAILED:
      return "cannot send request to the node";
    case TransportError::RECEIVE_FAILED:
      return "cannot receive response from the node";
    case TransportError::MALFORMED_RESPONSE:
      return "node response is not a valid JSON-RPC message";
    case TransportError::UNEXPECTED_RESPONSE_ID:
      return "node response id does not match the request";
    case TransportError::RPC_ERROR:
      return "node returned an error for the request";
    case TransportError::UNEXPECTED_RESULT:
      return "node returned a result of unexpected shape";
    case TransportError::MISSING_BEST_HEADER:
      return "node has no header for its best block";
  }
  return "unknown transport error";
}
