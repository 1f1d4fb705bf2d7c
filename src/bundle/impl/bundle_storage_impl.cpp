/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "bundle/impl/bundle_storage_impl.hpp"

#include "bundle/impl/storage_keys.hpp"
#include "serde/serialization.hpp"
#include "storage/predefined_keys.hpp"
#include "storage/storage_error.hpp"

namespace dataworker::bundle {

  BundleStorageImpl::BundleStorageImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::SpacedStorage> storage)
      : logger_(logsys->getLogger("BundleStorage", "storage")),
        storage_(std::move(storage)) {}

  outcome::result<std::optional<BundleId>> BundleStorageImpl::lastBundleId()
      const {
    auto default_space = storage_->getSpace(storage::Space::Default);
    OUTCOME_TRY(raw, default_space->tryGet(storage::kLastBundleIdLookupKey));
    if (not raw.has_value()) {
      return std::nullopt;
    }
    auto id = storage::readBigEndian<BundleId>(raw.value());
    if (not id) {
      SL_ERROR(logger_, "Last bundle id is corrupted");
      return storage::StorageError::CORRUPTION;
    }
    return *id;
  }

  outcome::result<std::optional<BundleRecord>> BundleStorageImpl::getBundle(
      BundleId bundle_id) const {
    auto space = storage_->getSpace(storage::Space::Bundles);
    OUTCOME_TRY(raw, space->tryGet(bundleKey(bundle_id)));
    if (not raw.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(record, decode<BundleRecord>(raw.value()));
    return record;
  }

  outcome::result<void> BundleStorageImpl::stageBundle(
      const BundleRecord &record, storage::SpacedBatch &batch) const {
    OUTCOME_TRY(encoded, encode(record));
    OUTCOME_TRY(batch.put(storage::Space::Bundles,
                          bundleKey(record.bundle_id),
                          std::move(encoded)));

    OUTCOME_TRY(last, lastBundleId());
    if (not last.has_value() or last.value() < record.bundle_id) {
      qtils::ByteVec counter;
      storage::appendBigEndian(counter, record.bundle_id);
      OUTCOME_TRY(batch.put(storage::Space::Default,
                            storage::kLastBundleIdLookupKey,
                            std::move(counter)));
    }
    SL_TRACE(logger_,
             "Bundle {} staged in state {}",
             record.bundle_id,
             record.bundleState());
    return outcome::success();
  }

  outcome::result<LeafStatus> BundleStorageImpl::getLeafStatus(
      BundleId bundle_id, RootType root_type, LeafId leaf_id) const {
    auto space = storage_->getSpace(storage::Space::LeafStatus);
    OUTCOME_TRY(raw, space->tryGet(leafStatusKey(bundle_id, root_type, leaf_id)));
    if (not raw.has_value()) {
      return LeafStatus::Pending;
    }
    qtils::BytesIn bytes = raw.value();
    if (bytes.size() != 1 or bytes[0] > 1) {
      SL_ERROR(logger_,
               "Status of leaf {} of {} root of bundle {} is corrupted",
               leaf_id,
               root_type,
               bundle_id);
      return storage::StorageError::CORRUPTION;
    }
    return static_cast<LeafStatus>(bytes[0]);
  }

  outcome::result<void> BundleStorageImpl::putLeafStatus(BundleId bundle_id,
                                                         RootType root_type,
                                                         LeafId leaf_id,
                                                         LeafStatus status) {
    auto space = storage_->getSpace(storage::Space::LeafStatus);
    return space->put(leafStatusKey(bundle_id, root_type, leaf_id),
                      qtils::ByteVec{static_cast<uint8_t>(status)});
  }

  std::unique_ptr<storage::SpacedBatch> BundleStorageImpl::createBatch() {
    return storage_->createBatch();
  }

}  // namespace dataworker::bundle
