/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/aura/poll_scheduler.hpp"

#include <ctime>
#include <limits>

#include <boost/assert.hpp>
#include <fmt/chrono.h>

#include "api/transport/error.hpp"
#include "consensus/aura/aura_digest.hpp"
#include "consensus/aura/schedule_computer.hpp"

namespace slotwatch::consensus::aura {

  namespace {
    std::string formatTime(TimestampMs ms) {
      const auto seconds = static_cast<std::time_t>(ms / 1000);
      return fmt::format(
          "{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(seconds), ms % 1000);
    }
  }  // namespace

  PollScheduler::PollScheduler(
      PollSchedulerConfig config,
      std::shared_ptr<api::ChainRpc> rpc,
      std::shared_ptr<AuthoritySetTracker> tracker,
      std::shared_ptr<LifecycleReconciler> reconciler,
      std::shared_ptr<storage::ScheduleStore> store,
      std::shared_ptr<clock::SystemClock> clock,
      primitives::AuthorityId identity)
      : config_{std::move(config)},
        rpc_{std::move(rpc)},
        tracker_{std::move(tracker)},
        reconciler_{std::move(reconciler)},
        store_{std::move(store)},
        clock_{std::move(clock)},
        identity_{identity},
        log_{log::createLogger("PollScheduler", "schedule")} {
    BOOST_ASSERT(config_.epoch_size > 0);
    BOOST_ASSERT(rpc_ != nullptr);
    BOOST_ASSERT(tracker_ != nullptr);
    BOOST_ASSERT(reconciler_ != nullptr);
    BOOST_ASSERT(clock_ != nullptr);
  }

  outcome::result<IterationReport> PollScheduler::runOnce(PollState state) {
    OUTCOME_TRY(authorities, tracker_->fetch());
    const AuthoritySetFingerprint current{
        AuthoritySetTracker::fingerprint(authorities), authorities.size()};
    const bool set_changed =
        AuthoritySetTracker::changed(state.authorities, current);
    if (set_changed) {
      if (state.authorities.has_value()) {
        SL_INFO(log_,
                "Authority set changed (len {} -> {})",
                state.authorities->length,
                current.length);
      }
      state.authorities = current;
    }

    OUTCOME_TRY(slot_duration, rpc_->slotDuration());
    OUTCOME_TRY(timestamp, rpc_->timestamp(std::nullopt));
    const auto now_ms = timestamp.value_or(0);

    OUTCOME_TRY(best_hash, rpc_->bestHead());
    OUTCOME_TRY(best_header, rpc_->header(best_hash));
    if (not best_header.has_value()) {
      SL_ERROR(log_, "Node has no header of its best block {:l}", best_hash);
      return api::TransportError::MISSING_BEST_HEADER;
    }

    const auto latest_slot =
        getAuraSlot(*best_header).value_or(now_ms / slot_duration);
    const auto epoch =
        config_.epoch.value_or(latest_slot / config_.epoch_size);
    const auto window =
        ScheduleComputer::epochWindow(epoch, config_.epoch_size, config_.slots);
    const bool epoch_switched = state.epoch != epoch;

    if (set_changed or epoch_switched) {
      SL_INFO(log_,
              "epoch={} / start_slot={} / end_slot={}",
              window.epoch,
              window.start_slot,
              window.end_slot);
      if (store_ != nullptr) {
        OUTCOME_TRY(store_->upsertEpochInfo(
            EpochInfo{.epoch = window.epoch,
                      .start_slot = window.start_slot,
                      .end_slot = window.end_slot,
                      .authority_set_hash = current.digest,
                      .authority_set_len = current.length,
                      .created_at_ms =
                          static_cast<TimestampMs>(clock_->nowMillis())}));
      }
    }

    if (not state.identity_reported) {
      state.identity_reported = true;
      SL_INFO(log_, "author={}", identity_.toHex0x());
    }

    const bool present = AuthoritySetTracker::contains(authorities, identity_);
    const bool present_changed = state.author_present != present;
    state.author_present = present;

    if (present) {
      OUTCOME_TRY(updateSchedule(state,
                                 window,
                                 epoch_switched,
                                 authorities,
                                 latest_slot,
                                 static_cast<TimestampMs>(now_ms),
                                 slot_duration));
    } else {
      if (set_changed or present_changed or epoch_switched) {
        SL_WARN(log_,
                "epoch={}, authorities={}; "
                "author not in current authorities; skip.",
                epoch,
                authorities.size());
      }
      state.epoch = epoch;
    }

    OUTCOME_TRY(reconciler_->onBestHead(
        state, best_hash, *best_header, authorities));

    OUTCOME_TRY(finalized_hash, rpc_->finalizedHead());
    OUTCOME_TRY(finalized_header, rpc_->header(finalized_hash));
    if (finalized_header.has_value()) {
      OUTCOME_TRY(
          reconciler_->onFinalizedHead(state, finalized_header->number));
    }

    return IterationReport{.state = std::move(state),
                           .epoch = epoch,
                           .latest_slot = latest_slot,
                           .slot_duration_ms = slot_duration};
  }

  outcome::result<void> PollScheduler::updateSchedule(
      PollState &state,
      const EpochWindow &window,
      bool epoch_switched,
      const primitives::AuthorityList &authorities,
      SlotNumber latest_slot,
      TimestampMs latest_time_ms,
      uint64_t slot_duration_ms) {
    auto slots = ScheduleComputer::ownSlots(
        authorities, identity_, window.start_slot, window.scan_len);
    auto schedule = ScheduleComputer::scheduleFingerprint(slots);
    if (state.own_schedule == schedule and not epoch_switched) {
      return outcome::success();
    }
    state.own_schedule = schedule;
    state.epoch = window.epoch;

    std::vector<PlannedSlot> planned;
    planned.reserve(slots.size());
    for (auto slot : slots) {
      planned.push_back(PlannedSlot{
          .slot = slot,
          .planned_time_ms = ScheduleComputer::projectTime(
              slot, latest_slot, latest_time_ms, slot_duration_ms)});
    }

    if (store_ != nullptr) {
      OUTCOME_TRY(store_->insertSchedule(window.epoch, planned));
    }

    SL_INFO(log_,
            "{} own slots in epoch {}",
            planned.size(),
            window.epoch);
    for (const auto &item : planned) {
      SL_INFO(log_,
              "slot {}: {}",
              item.slot,
              formatTime(item.planned_time_ms));
    }
    return outcome::success();
  }

  std::chrono::seconds PollScheduler::nextSleep(
      const IterationReport &report) const {
    if (config_.epoch.has_value()) {
      return config_.watch_interval;
    }

    const auto next_epoch_start = (report.epoch + 1) * config_.epoch_size;
    const SlotNumber delta_slots =
        next_epoch_start > report.latest_slot
            ? next_epoch_start - report.latest_slot
            : 1;
    const auto cap_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            config_.watch_interval)
            .count());
    if (report.slot_duration_ms != 0
        and delta_slots > std::numeric_limits<uint64_t>::max()
                              / report.slot_duration_ms) {
      return config_.watch_interval;
    }
    const auto delta_ms = delta_slots * report.slot_duration_ms;
    if (delta_ms > cap_ms) {
      return config_.watch_interval;
    }
    return std::chrono::seconds{delta_ms / 1000 + 1};
  }

}  // namespace slotwatch::consensus::aura
