/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace dataworker::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        database_{
            .directory = "db",
            .cache_size = 1 << 30,
            .backend = DatabaseBackend::ROCKSDB,
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  Command Configuration::command() const {
    return command_;
  }

  std::optional<BundleId> Configuration::bundleId() const {
    return bundle_id_;
  }

  std::optional<RootType> Configuration::rootType() const {
    return root_type_;
  }

  const std::optional<BundleScope> &Configuration::blockRanges() const {
    return block_ranges_;
  }

  const Configuration::DatabaseConfig &Configuration::database() const {
    return database_;
  }

  const Configuration::DataworkerConfig &Configuration::dataworker() const {
    return dataworker_;
  }

}  // namespace dataworker::app
