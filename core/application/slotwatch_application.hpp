/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace slotwatch::application {

  /**
   * Validator slot monitor
   */
  class SlotwatchApplication {
   public:
    virtual ~SlotwatchApplication() = default;

    /**
     * Resolves identity, then polls the node once or until a fatal error,
     * depending on watch mode
     * @return process exit code
     */
    virtual int run() = 0;
  };

}  // namespace slotwatch::application
