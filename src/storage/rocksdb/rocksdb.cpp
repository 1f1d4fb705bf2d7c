/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <algorithm>
#include <cstring>
#include <ranges>

#include <qtils/error_throw.hpp>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <sys/resource.h>

#include "app/configuration.hpp"
#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_spaces.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace dataworker::storage {
  namespace fs = std::filesystem;

  namespace {
    // Half of the soft limit of open descriptors, or RocksDB's default
    int maxOpenFiles(const log::Logger &logger) {
      rlimit r{};
      if (getrlimit(RLIMIT_NOFILE, &r) != 0) {
        SL_WARN(logger,
                "getrlimit(RLIMIT_NOFILE) failed: errno={} {}",
                errno,
                strerror(errno));
        return -1;
      }
      if (r.rlim_cur == RLIM_INFINITY) {
        return -1;
      }
      return static_cast<int>(r.rlim_cur / 2);
    }

    rocksdb::ColumnFamilyOptions configureColumn(uint64_t memory_budget) {
      rocksdb::ColumnFamilyOptions options;
      options.OptimizeLevelStyleCompaction(memory_budget);
      options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(
          RocksDb::tableOptionsConfiguration()));
      return options;
    }
  }  // namespace

  RocksDb::RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> app_config)
      : logger_(logsys->getLogger("RocksDB", "storage")) {
    ro_.fill_cache = false;

    const auto &path = app_config->database().directory;

    rocksdb::Options options;
    options.create_if_missing = true;
    options.create_missing_column_families = true;
    options.optimize_filters_for_hits = true;
    options.max_open_files = maxOpenFiles(logger_);
    options.table_factory.reset(
        rocksdb::NewBlockBasedTableFactory(tableOptionsConfiguration()));

    if (auto res = createDirectory(path, logger_); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't create DB directory ({}): {}",
                  path.native(),
                  res.error());
      qtils::raise(res.error());
    }

    std::vector<std::string> existing_families;
    auto status = rocksdb::DB::ListColumnFamilies(
        options, path.native(), &existing_families);
    if (not status.ok() and not status.IsPathNotFound()
        and not status.IsIOError()) {
      SL_ERROR(logger_,
               "Can't list column families in {}: {}",
               path.native(),
               status.ToString());
      qtils::raise(status_as_error(status, logger_));
    }
    for (const auto &family : existing_families) {
      if (not spaceFromString(family).has_value()) {
        SL_WARN(logger_,
                "Column family '{}' present in database but not used by "
                "dataworker; probably obsolete",
                family);
      }
    }

    // Cache is split evenly between spaces
    const auto memory_budget = app_config->database().cache_size / SpacesCount;

    std::vector<rocksdb::ColumnFamilyDescriptor> column_family_descriptors;
    for (size_t i = 0; i < SpacesCount; ++i) {
      auto name = std::string(spaceName(static_cast<Space>(i)));
      column_family_descriptors.emplace_back(name,
                                             configureColumn(memory_budget));
      SL_DEBUG(logger_,
               "Column family '{}' configured with cache_size={:.0f}Mb",
               name,
               static_cast<double>(memory_budget) / 1024.0 / 1024.0);
    }
    // Unknown families must be opened too, otherwise RocksDB refuses to open
    for (const auto &family : existing_families) {
      if (not spaceFromString(family).has_value()) {
        column_family_descriptors.emplace_back(family,
                                               rocksdb::ColumnFamilyOptions{});
      }
    }

    status = rocksdb::DB::Open(options,
                               path.native(),
                               column_family_descriptors,
                               &column_family_handles_,
                               &db_);
    if (not status.ok()) {
      SL_CRITICAL(logger_,
                  "Can't open database in {}: {}",
                  path.native(),
                  status.ToString());
      qtils::raise(status_as_error(status, logger_));
    }
    SL_VERBOSE(logger_, "Database opened in {}", path.native());
  }

  RocksDb::~RocksDb() {
    if (db_ == nullptr) {
      return;
    }
    for (auto *handle : column_family_handles_) {
      auto status = db_->DestroyColumnFamilyHandle(handle);
      if (not status.ok()) {
        SL_ERROR(logger_,
                 "Can't destroy column family handle: {}",
                 status.ToString());
      }
    }
    auto status = db_->Close();
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't close database: {}", status.ToString());
    }
    delete db_;
  }

  outcome::result<void> RocksDb::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    if (not fs::create_directory(absolute_path.native(), ec) and ec.value()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec);
      return StorageError::DB_PATH_NOT_CREATED;
    }
    if (not fs::is_directory(absolute_path.native())) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return StorageError::DB_PATH_NOT_CREATED;
    }
    return outcome::success();
  }

  RocksDb::ColumnFamilyHandlePtr RocksDb::columnOf(Space space) const {
    auto space_name = spaceName(space);
    auto column = std::ranges::find_if(
        column_family_handles_,
        [&space_name](const ColumnFamilyHandlePtr &handle) {
          return handle->GetName() == space_name;
        });
    if (column_family_handles_.end() == column) {
      return nullptr;
    }
    return *column;
  }

  std::shared_ptr<BufferStorage> RocksDb::getSpace(Space space) {
    std::lock_guard lock{spaces_mutex_};
    if (auto it = spaces_.find(space); it != spaces_.end()) {
      return it->second;
    }
    auto *column = columnOf(space);
    if (column == nullptr) {
      qtils::raise(StorageError::INVALID_ARGUMENT);
    }
    auto space_ptr =
        std::make_shared<RocksDbSpace>(weak_from_this(), column, logger_);
    spaces_[space] = space_ptr;
    return space_ptr;
  }

  std::unique_ptr<SpacedBatch> RocksDb::createBatch() {
    return std::make_unique<RocksDbSpacedBatch>(weak_from_this(), logger_);
  }

  rocksdb::BlockBasedTableOptions RocksDb::tableOptionsConfiguration(
      uint32_t lru_cache_size_mib, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(
        static_cast<uint64_t>(lru_cache_size_mib) * 1024 * 1024);
    table_options.block_size = static_cast<size_t>(block_size_kib) * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  RocksDbSpace::RocksDbSpace(std::weak_ptr<RocksDb> storage,
                             rocksdb::ColumnFamilyHandle *column,
                             log::Logger logger)
      : storage_{std::move(storage)},
        column_{column},
        logger_{std::move(logger)} {}

  std::unique_ptr<BufferBatch> RocksDbSpace::batch() {
    return std::make_unique<RocksDbBatch>(*this, logger_);
  }

  std::optional<size_t> RocksDbSpace::byteSizeHint() const {
    auto rocks = storage_.lock();
    if (not rocks) {
      return std::nullopt;
    }
    uint64_t usage_bytes = 0;
    if (not rocks->db_->GetIntProperty(
            column_, "rocksdb.cur-size-all-mem-tables", &usage_bytes)) {
      SL_WARN(logger_, "Unable to retrieve memory usage value");
      return std::nullopt;
    }
    return usage_bytes;
  }

  outcome::result<bool> RocksDbSpace::contains(const ByteView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    return value.has_value();
  }

  outcome::result<ByteVecOrView> RocksDbSpace::get(const ByteView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (not value.has_value()) {
      return StorageError::NOT_FOUND;
    }
    return std::move(value.value());
  }

  outcome::result<std::optional<ByteVecOrView>> RocksDbSpace::tryGet(
      const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return std::make_optional(ByteVecOrView(make_buffer(value)));
    }
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    OUTCOME_TRY(rocks, use());
    auto status =
        rocks->db_->Put(rocks->wo_, column_, make_slice(key), make_slice(value));
    if (status.ok()) {
      return outcome::success();
    }
    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::remove(const ByteView &key) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Delete(rocks->wo_, column_, make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }
    return status_as_error(status, logger_);
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDbSpace::use() const {
    auto rocks = storage_.lock();
    if (not rocks) {
      return StorageError::STORAGE_GONE;
    }
    return rocks;
  }

}  // namespace dataworker::storage
