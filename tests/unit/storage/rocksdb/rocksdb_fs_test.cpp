/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <mock/app/configuration_mock.hpp>
#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "storage/storage_error.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/storage/base_fs_test.hpp"

using dataworker::app::ConfigurationMock;
using dataworker::log::LoggingSystem;
using dataworker::storage::RocksDb;
using dataworker::storage::StorageError;
using DatabaseConfig = dataworker::app::Configuration::DatabaseConfig;
using namespace testing;

struct RocksDb_Open : public test::BaseFS_Test {
  RocksDb_Open() : test::BaseFS_Test("/tmp/dataworker-test-rocksdb-open") {}

  void SetUp() override {
    BaseFS_Test::SetUp();

    logsys = testutil::prepareLoggers();
    app_config = std::make_shared<ConfigurationMock>();

    db_config.directory = getPathString() + "/db";
    db_config.cache_size = 8 << 20;  // 8Mb
    EXPECT_CALL(*app_config, database()).WillRepeatedly(ReturnRef(db_config));
  };

  void TearDown() override {
    app_config.reset();
    BaseFS_Test::TearDown();
  }

  std::shared_ptr<LoggingSystem> logsys;
  std::shared_ptr<ConfigurationMock> app_config;
  DatabaseConfig db_config;
};

/**
 * @given a database directory below a character device
 * @when open database
 * @then database can not be opened since the directory can't be created
 */
TEST_F(RocksDb_Open, OpenNonExistingDB) {
  db_config.directory = "/dev/zero/impossible/path";

  ASSERT_THROW_OUTCOME(RocksDb(logsys, app_config),
                       StorageError::DB_PATH_NOT_CREATED);
}

/**
 * @given a database directory that doesn't exist yet
 * @when open database
 * @then database is created and opened
 */
TEST_F(RocksDb_Open, OpenExistingDB) {
  ASSERT_NO_THROW(RocksDb(logsys, app_config));
  EXPECT_TRUE(std::filesystem::is_directory(db_config.directory));
}

/**
 * @given a database created before
 * @when it is opened again
 * @then it opens with all column families
 */
TEST_F(RocksDb_Open, ReopenDB) {
  ASSERT_NO_THROW(RocksDb(logsys, app_config));
  ASSERT_NO_THROW(RocksDb(logsys, app_config));
}
