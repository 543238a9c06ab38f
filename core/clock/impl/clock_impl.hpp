/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace slotwatch::clock {

  class SystemClockImpl : public SystemClock {
   public:
    uint64_t nowMillis() const override;
  };

}  // namespace slotwatch::clock
