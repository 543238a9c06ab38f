/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/schedule_store.hpp"

#include <memory>
#include <vector>

#include <rocksdb/db.h>

#include "filesystem/common.hpp"
#include "log/logger.hpp"

namespace slotwatch::storage {

  /**
   * ScheduleStore kept in RocksDB. Epoch infos and slot records live in
   * separate column families, keyed by big-endian epoch and slot numbers,
   * values are SCALE encoded.
   */
  class RocksDbScheduleStore final : public ScheduleStore {
   public:
    static constexpr auto kEpochInfoColumn = "epoch_info";
    static constexpr auto kBlocksColumn = "blocks";

    ~RocksDbScheduleStore() override;

    RocksDbScheduleStore(const RocksDbScheduleStore &) = delete;
    RocksDbScheduleStore(RocksDbScheduleStore &&) = delete;
    RocksDbScheduleStore &operator=(const RocksDbScheduleStore &) = delete;
    RocksDbScheduleStore &operator=(RocksDbScheduleStore &&) = delete;

    /**
     * @brief Opens (creating if missing) schedule database at `path`
     * @param path - database directory
     * @param options - rocksdb options
     * @return store or database error
     */
    static outcome::result<std::shared_ptr<RocksDbScheduleStore>> create(
        const filesystem::path &path,
        rocksdb::Options options = rocksdb::Options());

    outcome::result<void> upsertEpochInfo(const EpochInfo &info) override;

    outcome::result<void> insertSchedule(
        EpochNumber epoch, const std::vector<PlannedSlot> &planned) override;

    outcome::result<bool> updateBlockStatus(SlotNumber slot,
                                            primitives::BlockNumber number,
                                            const primitives::BlockHash &hash,
                                            TimestampMs produced_time_ms,
                                            SlotStatus status) override;

    outcome::result<std::optional<EpochInfo>> getEpochInfo(
        EpochNumber epoch) const override;

    outcome::result<std::optional<SlotRecord>> getSlot(
        SlotNumber slot) const override;

    outcome::result<std::vector<SlotRecord>> slotsOfEpoch(
        EpochNumber epoch) const override;

   private:
    RocksDbScheduleStore();

    static outcome::result<void> createDirectory(
        const filesystem::path &absolute_path, log::Logger &log);

    outcome::result<std::optional<std::string>> read(
        rocksdb::ColumnFamilyHandle *column, uint64_t key) const;

    rocksdb::DB *db_{};
    rocksdb::ColumnFamilyHandle *epoch_info_{};
    rocksdb::ColumnFamilyHandle *blocks_{};
    std::vector<rocksdb::ColumnFamilyHandle *> column_family_handles_;
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    log::Logger logger_;
  };

}  // namespace slotwatch::storage
