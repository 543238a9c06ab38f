/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/schedule_store.hpp"

#include <gmock/gmock.h>

namespace slotwatch::storage {

  class ScheduleStoreMock : public ScheduleStore {
   public:
    MOCK_METHOD(outcome::result<void>,
                upsertEpochInfo,
                (const EpochInfo &),
                (override));

    MOCK_METHOD(outcome::result<void>,
                insertSchedule,
                (EpochNumber, const std::vector<PlannedSlot> &),
                (override));

    MOCK_METHOD(outcome::result<bool>,
                updateBlockStatus,
                (SlotNumber,
                 primitives::BlockNumber,
                 const primitives::BlockHash &,
                 TimestampMs,
                 SlotStatus),
                (override));

    MOCK_METHOD(outcome::result<std::optional<EpochInfo>>,
                getEpochInfo,
                (EpochNumber),
                (const, override));

    MOCK_METHOD(outcome::result<std::optional<SlotRecord>>,
                getSlot,
                (SlotNumber),
                (const, override));

    MOCK_METHOD(outcome::result<std::vector<SlotRecord>>,
                slotsOfEpoch,
                (EpochNumber),
                (const, override));
  };

}  // namespace slotwatch::storage
