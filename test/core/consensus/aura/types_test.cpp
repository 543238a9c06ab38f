/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/aura/types.hpp"

#include <gtest/gtest.h>

#include "storage/schedule_store.hpp"

using slotwatch::consensus::aura::SlotStatus;
using slotwatch::consensus::aura::slotStatusFromString;
using slotwatch::storage::isStatusUpgrade;

/**
 * @given slot statuses
 * @when they are printed and parsed back
 * @then log names are used
 */
TEST(SlotStatusTest, TextualForm) {
  EXPECT_EQ(fmt::format("{}", SlotStatus::Scheduled), "schedule");
  EXPECT_EQ(fmt::format("{}", SlotStatus::Minted), "mint");
  EXPECT_EQ(fmt::format("{}", SlotStatus::Finalized), "finality");

  EXPECT_EQ(slotStatusFromString("mint"), SlotStatus::Minted);
  EXPECT_FALSE(slotStatusFromString("minted").has_value());
}

/**
 * @given every pair of statuses
 * @when upgrade is checked
 * @then only forward moves are allowed
 */
TEST(SlotStatusTest, Upgrades) {
  EXPECT_TRUE(isStatusUpgrade(SlotStatus::Scheduled, SlotStatus::Minted));
  EXPECT_TRUE(isStatusUpgrade(SlotStatus::Scheduled, SlotStatus::Finalized));
  EXPECT_TRUE(isStatusUpgrade(SlotStatus::Minted, SlotStatus::Finalized));

  EXPECT_FALSE(isStatusUpgrade(SlotStatus::Minted, SlotStatus::Minted));
  EXPECT_FALSE(isStatusUpgrade(SlotStatus::Finalized, SlotStatus::Finalized));
  EXPECT_FALSE(isStatusUpgrade(SlotStatus::Finalized, SlotStatus::Minted));
  EXPECT_FALSE(isStatusUpgrade(SlotStatus::Minted, SlotStatus::Scheduled));
  EXPECT_FALSE(isStatusUpgrade(SlotStatus::Scheduled, SlotStatus::Scheduled));
}
