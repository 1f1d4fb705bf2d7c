/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "types/bundle_scope.hpp"
#include "types/constants.hpp"
#include "types/primitives.hpp"
#include "types/root_type.hpp"

namespace dataworker::app {

  /// Operation requested on the command line
  enum class Command : uint8_t {
    ROOTS,
    PROPOSE,
    VALIDATE,
    EXECUTE,
  };

  class Configuration {
   public:
    enum class DatabaseBackend : uint8_t {
      ROCKSDB,
      MEMORY,
    };

    struct DatabaseConfig {
      std::filesystem::path directory = "db";
      size_t cache_size = 1 << 30;  // 1GiB
      DatabaseBackend backend = DatabaseBackend::ROCKSDB;
    };

    struct DataworkerConfig {
      std::filesystem::path snapshot;
      std::filesystem::path outbox = "outbox.yaml";
      size_t max_l1_tokens_per_leaf = MAX_L1_TOKENS_PER_LEAF;
      std::map<Address, Amount> transfer_thresholds;
    };

    Configuration();
    Configuration(const Configuration &) = delete;
    Configuration &operator=(const Configuration &) = delete;
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;

    [[nodiscard]] virtual Command command() const;
    /// Bundle to validate or execute
    [[nodiscard]] virtual std::optional<BundleId> bundleId() const;
    /// Root to execute; all of them when absent
    [[nodiscard]] virtual std::optional<RootType> rootType() const;
    /// Block ranges given on the command line, if any
    [[nodiscard]] virtual const std::optional<BundleScope> &blockRanges()
        const;

    [[nodiscard]] virtual const DatabaseConfig &database() const;
    [[nodiscard]] virtual const DataworkerConfig &dataworker() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path base_path_;

    Command command_ = Command::ROOTS;
    std::optional<BundleId> bundle_id_;
    std::optional<RootType> root_type_;
    std::optional<BundleScope> block_ranges_;

    DatabaseConfig database_;
    DataworkerConfig dataworker_;
  };

}  // namespace dataworker::app
