/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>

#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/spaced_storage.hpp"

namespace dataworker::storage {

  /**
   * @class InMemorySpacedStorage
   * @brief One InMemoryStorage per space, created on first access.
   * Nothing survives the process; used by the `memory` backend and in tests.
   */
  class InMemorySpacedStorage : public SpacedStorage {
   public:
    std::shared_ptr<BufferStorage> getSpace(Space space) override {
      return spaceStorage(space);
    }

    std::unique_ptr<SpacedBatch> createBatch() override;

   private:
    friend class InMemorySpacedBatch;

    std::shared_ptr<InMemoryStorage> spaceStorage(Space space) {
      std::lock_guard lock{mutex_};
      auto it = spaces_.find(space);
      if (it != spaces_.end()) {
        return it->second;
      }
      return spaces_.emplace(space, std::make_shared<InMemoryStorage>())
          .first->second;
    }

    std::mutex mutex_;
    // Serializes commits of spaced batches
    std::mutex commit_mutex_;
    std::map<Space, std::shared_ptr<InMemoryStorage>> spaces_;
  };

  class InMemorySpacedBatch : public SpacedBatch {
   public:
    explicit InMemorySpacedBatch(InMemorySpacedStorage &db) : db_{db} {}

    outcome::result<void> put(Space space,
                              const ByteView &key,
                              ByteVecOrView &&value) override {
      writes_[space][key.toHex()] = std::move(value).intoByteVec();
      return outcome::success();
    }

    outcome::result<void> remove(Space space, const ByteView &key) override {
      writes_[space][key.toHex()] = std::nullopt;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      std::lock_guard lock{db_.commit_mutex_};
      for (auto &[space, writes] : writes_) {
        db_.spaceStorage(space)->applyBatch(std::move(writes));
      }
      writes_.clear();
      return outcome::success();
    }

    void clear() override {
      writes_.clear();
    }

   private:
    std::map<Space, InMemoryStorage::Writes> writes_;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    InMemorySpacedStorage &db_;
  };

  inline std::unique_ptr<SpacedBatch> InMemorySpacedStorage::createBatch() {
    return std::make_unique<InMemorySpacedBatch>(*this);
  }

}  // namespace dataworker::storage
