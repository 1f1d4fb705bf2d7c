/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/write_batch.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace dataworker::storage {

  /**
   * Writes into one column family, committed by a single atomic DB::Write
   */
  class RocksDbBatch : public BufferBatch {
   public:
    ~RocksDbBatch() override = default;

    RocksDbBatch(RocksDbSpace &db, log::Logger logger);

    outcome::result<void> commit() override;

    void clear() override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(const ByteView &key) override;

   private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    RocksDbSpace &db_;
    log::Logger logger_;
    rocksdb::WriteBatch batch_;
  };

  /**
   * Writes into several column families, committed by one DB::Write
   */
  class RocksDbSpacedBatch : public SpacedBatch {
   public:
    RocksDbSpacedBatch(std::weak_ptr<RocksDb> db, log::Logger logger);

    outcome::result<void> put(Space space,
                              const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(Space space, const ByteView &key) override;

    outcome::result<void> commit() override;

    void clear() override;

   private:
    outcome::result<rocksdb::ColumnFamilyHandle *> column(Space space) const;

    std::weak_ptr<RocksDb> db_;
    log::Logger logger_;
    rocksdb::WriteBatch batch_;
  };
}  // namespace dataworker::storage
