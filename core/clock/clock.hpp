/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace slotwatch::clock {

  /**
   * Wall clock of the machine slotwatch runs on. Stamps stored epoch info and
   * stands in for the produced time when the chain can't tell it.
   */
  class SystemClock {
   public:
    virtual ~SystemClock() = default;

    /**
     * @return number of milliseconds since the beginning of epoch
     * (Jan 1, 1970)
     */
    virtual uint64_t nowMillis() const = 0;
  };

}  // namespace slotwatch::clock
