/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/uri.hpp"
#include "filesystem/common.hpp"

namespace slotwatch::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return websocket endpoint of the observed node
     */
    virtual const common::Uri &nodeEndpoint() const = 0;

    /**
     * @return keystore directory of the observed node
     */
    virtual const filesystem::path &keystorePath() const = 0;

    /**
     * @return number of slots in an epoch
     */
    virtual uint32_t epochSize() const = 0;

    /**
     * @return epoch to observe instead of the current one
     */
    virtual std::optional<uint32_t> epoch() const = 0;

    /**
     * @return number of slots to scan from the epoch start instead of the
     * whole epoch
     */
    virtual std::optional<uint32_t> slotsToScan() const = 0;

    /**
     * @return upper bound of the pause between polls in watch mode
     */
    virtual std::chrono::seconds watchInterval() const = 0;

    /**
     * @return schedule database directory
     */
    virtual const filesystem::path &databasePath() const = 0;

    /**
     * @return false if nothing must be written to the database
     */
    virtual bool storeEnabled() const = 0;

    /**
     * @return true to keep polling, false for a single pass
     */
    virtual bool watchMode() const = 0;

    /**
     * @return logging tuning passed with --log, i.e. "debug" or
     * "storage=trace"
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace slotwatch::application
