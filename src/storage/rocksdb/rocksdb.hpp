/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <mutex>

#include <boost/container/flat_map.hpp>
#include <qtils/shared_ref.hpp>
#include <rocksdb/db.h>
#include <rocksdb/table.h>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/spaced_storage.hpp"

namespace dataworker::app {
  class Configuration;
}

namespace dataworker::storage {

  /**
   * Durable storage: one RocksDB database, one column family per Space.
   * Throws on construction if the database can't be opened.
   */
  class RocksDb : public SpacedStorage,
                  public std::enable_shared_from_this<RocksDb> {
    using ColumnFamilyHandlePtr = rocksdb::ColumnFamilyHandle *;

   public:
    RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
            qtils::SharedRef<app::Configuration> app_config);

    RocksDb(const RocksDb &) = delete;
    RocksDb &operator=(const RocksDb &) = delete;
    RocksDb(RocksDb &&) = delete;
    RocksDb &operator=(RocksDb &&) = delete;

    ~RocksDb() override;

    static constexpr uint32_t kDefaultLruCacheSizeMiB = 64;
    static constexpr uint32_t kDefaultBlockSizeKiB = 16;

    std::shared_ptr<BufferStorage> getSpace(Space space) override;

    std::unique_ptr<SpacedBatch> createBatch() override;

    /**
     * Prepare block-based table options
     * @param lru_cache_size_mib - LRU rocksdb cache in MiB
     * @param block_size_kib - internal rocksdb block size in KiB
     * @return options structure
     */
    static rocksdb::BlockBasedTableOptions tableOptionsConfiguration(
        uint32_t lru_cache_size_mib = kDefaultLruCacheSizeMiB,
        uint32_t block_size_kib = kDefaultBlockSizeKiB);

    friend class RocksDbSpace;
    friend class RocksDbBatch;
    friend class RocksDbSpacedBatch;

   private:
    ColumnFamilyHandlePtr columnOf(Space space) const;

    static outcome::result<void> createDirectory(
        const std::filesystem::path &absolute_path, log::Logger &log);

    rocksdb::DB *db_{};
    std::vector<ColumnFamilyHandlePtr> column_family_handles_;
    std::mutex spaces_mutex_;
    boost::container::flat_map<Space, std::shared_ptr<BufferStorage>> spaces_;
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    log::Logger logger_;
  };

  class RocksDbSpace : public BufferStorage {
   public:
    ~RocksDbSpace() override = default;

    RocksDbSpace(std::weak_ptr<RocksDb> storage,
                 rocksdb::ColumnFamilyHandle *column,
                 log::Logger logger);

    std::unique_ptr<BufferBatch> batch() override;

    std::optional<size_t> byteSizeHint() const override;

    outcome::result<bool> contains(const ByteView &key) const override;

    outcome::result<ByteVecOrView> get(const ByteView &key) const override;

    outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(const ByteView &key) override;

    friend class RocksDbBatch;
    friend class RocksDbSpacedBatch;

   private:
    ColumnFamilyHandlePtr columnOf(Space space) const;

    // gather storage instance from weak ptr
    outcome::result<std::shared_ptr<RocksDb>> use() const;

    std::weak_ptr<RocksDb> storage_;
    rocksdb::ColumnFamilyHandle *column_;
    log::Logger logger_;
  };
}  // namespace dataworker::storage
