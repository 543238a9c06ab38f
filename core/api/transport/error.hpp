/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace slotwatch::api {
  enum class TransportError {
    INVALID_ENDPOINT = 1,  // endpoint uri can't be parsed or has bad schema
    CONNECTION_FAILED,     // resolve, connect or websocket handshake failed
    NOT_CONNECTED,         // request issued before connect() or after close
    SEND_FAILED,           // writing request frame failed
    RECEIVE_FAILED,        // reading response frame failed
    MALFORMED_RESPONSE,    // response is not a valid JSON-RPC 2.0 message
    UNEXPECTED_RESPONSE_ID,  // response id doesn't match the request id
    RPC_ERROR,             // node answered with an error object
    UNEXPECTED_RESULT,     // result has a shape the method doesn't produce
    MISSING_BEST_HEADER,   // node reported no header for its own best block
  };
}

OUTCOME_HPP_DECLARE_ERROR(slotwatch::api, TransportError)
