/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace slotwatch::application {

  enum class AppConfigurationError {
    MISSING_KEYSTORE_PATH = 1,
    INVALID_NODE_ENDPOINT,
    ZERO_EPOCH_SIZE,
    ZERO_SLOTS_TO_SCAN,
    ZERO_WATCH_INTERVAL,
    EMPTY_DATABASE_PATH,
    CONFIG_FILE_UNREADABLE,
    CONFIG_FILE_MALFORMED,
  };

}  // namespace slotwatch::application

OUTCOME_HPP_DECLARE_ERROR(slotwatch::application, AppConfigurationError)
