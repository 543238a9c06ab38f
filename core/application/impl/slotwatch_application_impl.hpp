/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/slotwatch_application.hpp"

#include <memory>

#include "application/app_configuration.hpp"
#include "consensus/aura/types.hpp"
#include "log/logger.hpp"
#include "storage/schedule_store.hpp"

namespace slotwatch::application {

  class SlotwatchApplicationImpl final : public SlotwatchApplication {
   public:
    explicit SlotwatchApplicationImpl(
        std::shared_ptr<AppConfiguration> app_config);

    int run() override;

   private:
    void logStoredSchedule(const storage::ScheduleStore &store,
                           consensus::aura::EpochNumber epoch) const;

    std::shared_ptr<AppConfiguration> app_config_;
    log::Logger logger_;
  };

}  // namespace slotwatch::application
