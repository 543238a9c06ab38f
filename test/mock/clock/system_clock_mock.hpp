/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

#include <gmock/gmock.h>

namespace slotwatch::clock {

  class SystemClockMock : public SystemClock {
   public:
    MOCK_METHOD(uint64_t, nowMillis, (), (const, override));
  };

}  // namespace slotwatch::clock
