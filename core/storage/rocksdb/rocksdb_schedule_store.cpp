/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_schedule_store.hpp"

#include <memory>

#include <boost/assert.hpp>
#include <rocksdb/write_batch.h>

#include "scale/scale_codec.hpp"
#include "storage/database_error.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/schedule_codec.hpp"

namespace slotwatch::storage {
  namespace fs = std::filesystem;

  namespace {
    template <typename T>
    outcome::result<T> decodeRecord(const std::string &value,
                                    const log::Logger &log) {
      auto res = scale::decode<T>(make_span(rocksdb::Slice{value}));
      if (res.has_error()) {
        SL_ERROR(log, "Can't decode stored record: {}", res.error());
        return DatabaseError::MALFORMED_RECORD;
      }
      return std::move(res.value());
    }
  }  // namespace

  RocksDbScheduleStore::RocksDbScheduleStore()
      : logger_(log::createLogger("ScheduleStore", "storage")) {
    ro_.fill_cache = false;
    wo_.sync = true;
  }

  RocksDbScheduleStore::~RocksDbScheduleStore() {
    for (auto *handle : column_family_handles_) {
      db_->DestroyColumnFamilyHandle(handle);
    }
    delete db_;
  }

  outcome::result<std::shared_ptr<RocksDbScheduleStore>>
  RocksDbScheduleStore::create(const filesystem::path &path,
                               rocksdb::Options options) {
    auto log = log::createLogger("ScheduleStore", "storage");
    auto absolute_path = fs::absolute(path);

    OUTCOME_TRY(createDirectory(absolute_path, log));

    std::vector<rocksdb::ColumnFamilyDescriptor> column_family_descriptors{
        {rocksdb::kDefaultColumnFamilyName, rocksdb::ColumnFamilyOptions{}},
        {kEpochInfoColumn, rocksdb::ColumnFamilyOptions{}},
        {kBlocksColumn, rocksdb::ColumnFamilyOptions{}},
    };

    options.create_if_missing = true;
    options.create_missing_column_families = true;
    auto store =
        std::shared_ptr<RocksDbScheduleStore>(new RocksDbScheduleStore);
    const auto status = rocksdb::DB::Open(options,
                                          absolute_path.native(),
                                          column_family_descriptors,
                                          &store->column_family_handles_,
                                          &store->db_);
    if (not status.ok()) {
      SL_ERROR(log,
               "Can't open database in {}: {}",
               absolute_path.native(),
               status.ToString());
      return status_as_error(status);
    }
    for (auto *handle : store->column_family_handles_) {
      if (handle->GetName() == kEpochInfoColumn) {
        store->epoch_info_ = handle;
      } else if (handle->GetName() == kBlocksColumn) {
        store->blocks_ = handle;
      }
    }
    BOOST_ASSERT(store->epoch_info_ != nullptr);
    BOOST_ASSERT(store->blocks_ != nullptr);

    SL_DEBUG(log, "Schedule database opened in {}", absolute_path.native());
    return store;
  }

  outcome::result<void> RocksDbScheduleStore::createDirectory(
      const filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    if (not fs::create_directories(absolute_path, ec) and ec.value()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec.message());
      return DatabaseError::DB_PATH_NOT_CREATED;
    }
    if (not fs::is_directory(absolute_path)) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return DatabaseError::IO_ERROR;
    }
    return outcome::success();
  }

  outcome::result<std::optional<std::string>> RocksDbScheduleStore::read(
      rocksdb::ColumnFamilyHandle *column, uint64_t key) const {
    std::string value;
    const auto k = make_key(key);
    auto status = db_->Get(ro_, column, make_slice(k), &value);
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    if (not status.ok()) {
      return status_as_error(status);
    }
    return value;
  }

  outcome::result<void> RocksDbScheduleStore::upsertEpochInfo(
      const EpochInfo &info) {
    OUTCOME_TRY(encoded, scale::encode(info));
    const auto key = make_key(info.epoch);
    auto status =
        db_->Put(wo_, epoch_info_, make_slice(key), make_slice(encoded));
    if (not status.ok()) {
      SL_ERROR(logger_,
               "Can't store info of epoch {}: {}",
               info.epoch,
               status.ToString());
      return status_as_error(status);
    }
    SL_DEBUG(logger_,
             "Stored epoch {} [{}..{}] with {} authorities",
             info.epoch,
             info.start_slot,
             info.end_slot,
             info.authority_set_len);
    return outcome::success();
  }

  outcome::result<void> RocksDbScheduleStore::insertSchedule(
      EpochNumber epoch, const std::vector<PlannedSlot> &planned) {
    rocksdb::WriteBatch batch;
    size_t written = 0;
    for (const auto &item : planned) {
      OUTCOME_TRY(stored, read(blocks_, item.slot));
      SlotRecord record;
      if (stored.has_value()) {
        OUTCOME_TRY(existing, decodeRecord<SlotRecord>(*stored, logger_));
        if (existing.status != SlotStatus::Scheduled) {
          SL_TRACE(logger_,
                   "Slot {} is already in status {}, keep it",
                   item.slot,
                   existing.status);
          continue;
        }
        record = std::move(existing);
      } else {
        record.slot = item.slot;
        record.status = SlotStatus::Scheduled;
      }
      record.epoch = epoch;
      record.planned_time_ms = item.planned_time_ms;

      OUTCOME_TRY(encoded, scale::encode(record));
      const auto key = make_key(item.slot);
      auto status = batch.Put(blocks_, make_slice(key), make_slice(encoded));
      if (not status.ok()) {
        return status_as_error(status);
      }
      ++written;
    }

    auto status = db_->Write(wo_, &batch);
    if (not status.ok()) {
      SL_ERROR(logger_,
               "Can't store schedule of epoch {}: {}",
               epoch,
               status.ToString());
      return status_as_error(status);
    }
    SL_DEBUG(logger_,
             "Stored {} of {} planned slots of epoch {}",
             written,
             planned.size(),
             epoch);
    return outcome::success();
  }

  outcome::result<bool> RocksDbScheduleStore::updateBlockStatus(
      SlotNumber slot,
      primitives::BlockNumber number,
      const primitives::BlockHash &hash,
      TimestampMs produced_time_ms,
      SlotStatus status) {
    OUTCOME_TRY(stored, read(blocks_, slot));
    if (not stored.has_value()) {
      return false;
    }
    OUTCOME_TRY(record, decodeRecord<SlotRecord>(*stored, logger_));
    if (not isStatusUpgrade(record.status, status)) {
      SL_TRACE(logger_,
               "Slot {} stays in status {}, {} is not an upgrade",
               slot,
               record.status,
               status);
      return false;
    }

    record.block_number = number;
    record.block_hash = hash;
    record.produced_time_ms = produced_time_ms;
    record.status = status;

    OUTCOME_TRY(encoded, scale::encode(record));
    const auto key = make_key(slot);
    auto put_status =
        db_->Put(wo_, blocks_, make_slice(key), make_slice(encoded));
    if (not put_status.ok()) {
      SL_ERROR(logger_,
               "Can't update slot {}: {}",
               slot,
               put_status.ToString());
      return status_as_error(put_status);
    }
    return true;
  }

  outcome::result<std::optional<EpochInfo>> RocksDbScheduleStore::getEpochInfo(
      EpochNumber epoch) const {
    OUTCOME_TRY(stored, read(epoch_info_, epoch));
    if (not stored.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(info, decodeRecord<EpochInfo>(*stored, logger_));
    return info;
  }

  outcome::result<std::optional<SlotRecord>> RocksDbScheduleStore::getSlot(
      SlotNumber slot) const {
    OUTCOME_TRY(stored, read(blocks_, slot));
    if (not stored.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(record, decodeRecord<SlotRecord>(*stored, logger_));
    return record;
  }

  outcome::result<std::vector<SlotRecord>> RocksDbScheduleStore::slotsOfEpoch(
      EpochNumber epoch) const {
    std::vector<SlotRecord> records;
    std::unique_ptr<rocksdb::Iterator> it{db_->NewIterator(ro_, blocks_)};
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      OUTCOME_TRY(record,
                  decodeRecord<SlotRecord>(it->value().ToString(), logger_));
      if (record.epoch == epoch) {
        records.emplace_back(std::move(record));
      }
    }
    if (not it->status().ok()) {
      return status_as_error(it->status());
    }
    return records;
  }

}  // namespace slotwatch::storage
