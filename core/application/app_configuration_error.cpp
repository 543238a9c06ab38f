/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/app_configuration_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slotwatch::application, AppConfigurationError, e) {
  using E = slotwatch::application::AppConfigurationError;
  switch (e) {
    case E::MISSING_KEYSTORE_PATH:
      return "--keystore-path is required";
    case E::INVALID_NODE_ENDPOINT:
      return "--ws must be ws://host[:port][/path] or wss://...";
    case E::ZERO_EPOCH_SIZE:
      return "--epoch-size must be greater than zero";
    case E::ZERO_SLOTS_TO_SCAN:
      return "--slots must be greater than zero";
    case E::ZERO_WATCH_INTERVAL:
      return "--watch-seconds must be greater than zero";
    case E::EMPTY_DATABASE_PATH:
      return "--db must not be empty unless --no-store is given";
    case E::CONFIG_FILE_UNREADABLE:
      return "configuration file can not be opened";
    case E::CONFIG_FILE_MALFORMED:
      return "configuration file is not valid JSON";
  }
  return "unknown AppConfigurationError";
}
