/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/slotwatch_application_impl.hpp"

#include <unistd.h>

#include <cstdlib>
#include <thread>

#include <boost/assert.hpp>

#include "api/impl/chain_rpc_impl.hpp"
#include "api/transport/impl/ws_connection.hpp"
#include "clock/impl/clock_impl.hpp"
#include "consensus/aura/authority_set_tracker.hpp"
#include "consensus/aura/lifecycle_reconciler.hpp"
#include "consensus/aura/poll_scheduler.hpp"
#include "identity/identity_resolver.hpp"
#include "identity/keystore_directory.hpp"
#include "storage/rocksdb/rocksdb_schedule_store.hpp"

namespace slotwatch::application {

  SlotwatchApplicationImpl::SlotwatchApplicationImpl(
      std::shared_ptr<AppConfiguration> app_config)
      : app_config_(std::move(app_config)),
        logger_(log::createLogger("Application", "application")) {
    BOOST_ASSERT(app_config_ != nullptr);
  }

  int SlotwatchApplicationImpl::run() {
    logger_->info("Start observing node {} with PID {}",
                  app_config_->nodeEndpoint().toString(),
                  getpid());

    std::shared_ptr<storage::ScheduleStore> store;
    if (app_config_->storeEnabled()) {
      auto store_res =
          storage::RocksDbScheduleStore::create(app_config_->databasePath());
      if (store_res.has_error()) {
        logger_->critical("Can't open schedule database {}: {}",
                          app_config_->databasePath().native(),
                          store_res.error());
        return EXIT_FAILURE;
      }
      store = std::move(store_res.value());
      logger_->info("Schedule database is {}",
                    app_config_->databasePath().native());
    } else {
      logger_->info("Storing is disabled, schedule is only logged");
    }

    auto names_res =
        identity::KeystoreDirectory::list(app_config_->keystorePath());
    if (names_res.has_error()) {
      logger_->critical("Can't read keystore {}: {}",
                        app_config_->keystorePath().native(),
                        names_res.error());
      return EXIT_FAILURE;
    }
    auto identity_res = identity::IdentityResolver::resolve(names_res.value());
    if (identity_res.has_error()) {
      logger_->critical("Can't detect aura key in keystore {}: {}",
                        app_config_->keystorePath().native(),
                        identity_res.error());
      return EXIT_FAILURE;
    }
    const auto &identity = identity_res.value();

    auto connection =
        std::make_shared<api::WsConnection>(app_config_->nodeEndpoint());
    if (auto res = connection->connect(); res.has_error()) {
      logger_->critical("Can't connect to node {}: {}",
                        app_config_->nodeEndpoint().toString(),
                        res.error());
      return EXIT_FAILURE;
    }
    auto rpc = std::make_shared<api::ChainRpcImpl>(connection);

    identity::IdentityResolver resolver{rpc};
    if (auto res = resolver.confirm(identity); res.has_error()) {
      logger_->critical("Can't confirm aura key {}: {}",
                        identity.toHex0x(),
                        res.error());
      return EXIT_FAILURE;
    }

    auto clock = std::make_shared<clock::SystemClockImpl>();
    auto tracker = std::make_shared<consensus::aura::AuthoritySetTracker>(rpc);
    auto reconciler = std::make_shared<consensus::aura::LifecycleReconciler>(
        rpc, store, clock, identity);

    consensus::aura::PollSchedulerConfig scheduler_config{
        .epoch_size = app_config_->epochSize(),
        .epoch = app_config_->epoch(),
        .slots = app_config_->slotsToScan(),
        .watch_interval = app_config_->watchInterval(),
    };
    consensus::aura::PollScheduler scheduler{std::move(scheduler_config),
                                             rpc,
                                             tracker,
                                             reconciler,
                                             store,
                                             clock,
                                             identity};

    consensus::aura::PollState state;
    bool summary_logged = false;
    while (true) {
      auto report_res = scheduler.runOnce(std::move(state));
      if (report_res.has_error()) {
        logger_->critical("Polling failed: {}", report_res.error());
        return EXIT_FAILURE;
      }
      auto &report = report_res.value();
      state = std::move(report.state);

      if (store != nullptr and not summary_logged) {
        summary_logged = true;
        logStoredSchedule(*store, report.epoch);
      }

      if (not app_config_->watchMode()) {
        break;
      }
      const auto pause = scheduler.nextSleep(report);
      SL_DEBUG(logger_, "Next poll in {} s", pause.count());
      std::this_thread::sleep_for(pause);
    }

    logger_->info("Done");
    return EXIT_SUCCESS;
  }

  void SlotwatchApplicationImpl::logStoredSchedule(
      const storage::ScheduleStore &store,
      consensus::aura::EpochNumber epoch) const {
    using consensus::aura::SlotStatus;

    auto info_res = store.getEpochInfo(epoch);
    auto slots_res = store.slotsOfEpoch(epoch);
    if (info_res.has_error() or slots_res.has_error()) {
      SL_WARN(logger_,
              "Can't read stored schedule of epoch {}: {}",
              epoch,
              info_res.has_error() ? info_res.error() : slots_res.error());
      return;
    }
    if (not info_res.value().has_value()) {
      SL_DEBUG(logger_, "No stored info of epoch {}", epoch);
      return;
    }
    const auto &info = info_res.value().value();
    size_t minted = 0;
    size_t finalized = 0;
    for (const auto &record : slots_res.value()) {
      if (record.status == SlotStatus::Minted) {
        ++minted;
      } else if (record.status == SlotStatus::Finalized) {
        ++finalized;
      }
    }
    logger_->info(
        "Stored epoch {} [{}..{}] of {} authorities: {} own slots, "
        "{} minted, {} finalized",
        info.epoch,
        info.start_slot,
        info.end_slot,
        info.authority_set_len,
        slots_res.value().size(),
        minted,
        finalized);
  }

}  // namespace slotwatch::application
