/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace slotwatch::storage {

  /**
   * @brief schedule database error
   */
  enum class DatabaseError : int {
    OK = 0,
    NOT_FOUND = 1,
    CORRUPTION = 2,
    NOT_SUPPORTED = 3,
    INVALID_ARGUMENT = 4,
    IO_ERROR = 5,
    DB_PATH_NOT_CREATED = 6,
    MALFORMED_RECORD = 7,

    UNKNOWN = 1000
  };
}  // namespace slotwatch::storage

OUTCOME_HPP_DECLARE_ERROR(slotwatch::storage, DatabaseError);
