/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include <qtils/outcome.hpp>

#include "bundle/bundle_record.hpp"
#include "storage/spaced_storage.hpp"

namespace dataworker::bundle {

  /**
   * Durable bundle records and per-leaf execution statuses.
   * Writes that must land together go through a batch.
   */
  class BundleStorage {
   public:
    virtual ~BundleStorage() = default;

    /// Id of the most recently proposed bundle, std::nullopt if none
    virtual outcome::result<std::optional<BundleId>> lastBundleId() const = 0;

    virtual outcome::result<std::optional<BundleRecord>> getBundle(
        BundleId bundle_id) const = 0;

    /// Stages the record; also advances the counter if it is the newest
    virtual outcome::result<void> stageBundle(
        const BundleRecord &record, storage::SpacedBatch &batch) const = 0;

    virtual outcome::result<LeafStatus> getLeafStatus(BundleId bundle_id,
                                                      RootType root_type,
                                                      LeafId leaf_id) const = 0;

    virtual outcome::result<void> putLeafStatus(BundleId bundle_id,
                                                RootType root_type,
                                                LeafId leaf_id,
                                                LeafStatus status) = 0;

    virtual std::unique_ptr<storage::SpacedBatch> createBatch() = 0;
  };

}  // namespace dataworker::bundle
