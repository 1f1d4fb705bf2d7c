/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "storage/storage_error.hpp"
#include "testutil/storage/base_rocksdb_test.hpp"

using dataworker::storage::Space;
using dataworker::storage::StorageError;
using qtils::ByteVec;
using qtils::ByteView;

struct RocksDbSpacesTest : public test::BaseRocksDB_Test {
  RocksDbSpacesTest()
      : BaseRocksDB_Test("/tmp/dataworker-test-rocksdb-spaces") {}

  ByteVec key{1, 2, 3};
  ByteVec value{4, 5, 6};
};

/**
 * @given an open database
 * @when a value is put, read and removed
 * @then each step is visible to the next one
 */
TEST_F(RocksDbSpacesTest, PutGetRemove) {
  ASSERT_OUTCOME_ERROR(db_->get(key), StorageError::NOT_FOUND);
  ASSERT_OUTCOME_SUCCESS(absent, db_->tryGet(key));
  EXPECT_FALSE(absent.has_value());

  ASSERT_OUTCOME_SUCCESS(db_->put(key, ByteVec{value}));
  ASSERT_OUTCOME_SUCCESS(found, db_->get(key));
  EXPECT_EQ(found.view(), ByteView{value});
  ASSERT_OUTCOME_SUCCESS(contains, db_->contains(key));
  EXPECT_TRUE(contains);

  ASSERT_OUTCOME_SUCCESS(db_->remove(key));
  ASSERT_OUTCOME_SUCCESS(removed, db_->contains(key));
  EXPECT_FALSE(removed);
}

/**
 * @given the same key in two spaces
 * @when values are put
 * @then spaces don't see each other's values
 */
TEST_F(RocksDbSpacesTest, SpacesAreIsolated) {
  auto bundles = rocks_->getSpace(Space::Bundles);
  ASSERT_OUTCOME_SUCCESS(bundles->put(key, ByteVec{value}));
  ASSERT_OUTCOME_SUCCESS(in_default, db_->tryGet(key));
  EXPECT_FALSE(in_default.has_value());
  ASSERT_OUTCOME_SUCCESS(in_bundles, bundles->tryGet(key));
  EXPECT_TRUE(in_bundles.has_value());
}

/**
 * @given writes to several spaces staged in one batch
 * @when the batch is committed
 * @then all writes appear together and survive reopening
 */
TEST_F(RocksDbSpacesTest, SpacedBatchCommitsTogether) {
  auto batch = rocks_->createBatch();
  ASSERT_OUTCOME_SUCCESS(batch->put(Space::Bundles, key, ByteVec{value}));
  ASSERT_OUTCOME_SUCCESS(
      batch->put(Space::RunningBalances, key, ByteVec{7, 8}));

  ASSERT_OUTCOME_SUCCESS(before,
                         rocks_->getSpace(Space::Bundles)->tryGet(key));
  EXPECT_FALSE(before.has_value());

  ASSERT_OUTCOME_SUCCESS(batch->commit());
  batch.reset();

  open();

  ASSERT_OUTCOME_SUCCESS(bundle, rocks_->getSpace(Space::Bundles)->get(key));
  EXPECT_EQ(bundle.view(), ByteView{value});
  ASSERT_OUTCOME_SUCCESS(balance,
                         rocks_->getSpace(Space::RunningBalances)->get(key));
  EXPECT_EQ(balance.view(), ByteView{ByteVec{7, 8}});
}

/**
 * @given a batch with a put and a remove of another key
 * @when the batch is cleared before commit
 * @then nothing changes
 */
TEST_F(RocksDbSpacesTest, ClearedBatchWritesNothing) {
  ASSERT_OUTCOME_SUCCESS(db_->put(key, ByteVec{value}));

  auto batch = rocks_->createBatch();
  ASSERT_OUTCOME_SUCCESS(batch->remove(Space::Default, key));
  ASSERT_OUTCOME_SUCCESS(batch->put(Space::Default, value, ByteVec{key}));
  batch->clear();
  ASSERT_OUTCOME_SUCCESS(batch->commit());

  ASSERT_OUTCOME_SUCCESS(kept, db_->contains(key));
  EXPECT_TRUE(kept);
  ASSERT_OUTCOME_SUCCESS(added, db_->contains(value));
  EXPECT_FALSE(added);
}
