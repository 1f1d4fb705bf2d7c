/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "bundle/bundle_storage.hpp"
#include "log/logger.hpp"

namespace dataworker::bundle {

  class BundleStorageImpl : public BundleStorage {
   public:
    BundleStorageImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                      qtils::SharedRef<storage::SpacedStorage> storage);

    outcome::result<std::optional<BundleId>> lastBundleId() const override;

    outcome::result<std::optional<BundleRecord>> getBundle(
        BundleId bundle_id) const override;

    outcome::result<void> stageBundle(
        const BundleRecord &record,
        storage::SpacedBatch &batch) const override;

    outcome::result<LeafStatus> getLeafStatus(BundleId bundle_id,
                                              RootType root_type,
                                              LeafId leaf_id) const override;

    outcome::result<void> putLeafStatus(BundleId bundle_id,
                                        RootType root_type,
                                        LeafId leaf_id,
                                        LeafStatus status) override;

    std::unique_ptr<storage::SpacedBatch> createBatch() override;

   private:
    log::Logger logger_;
    qtils::SharedRef<storage::SpacedStorage> storage_;
  };

}  // namespace dataworker::bundle
