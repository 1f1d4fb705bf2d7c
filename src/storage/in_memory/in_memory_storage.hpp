/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "storage/buffer_map_types.hpp"

namespace dataworker::storage {

  /**
   * Byte map kept in process memory.
   * Backs the `memory` database backend and storage-level tests.
   * Lookups return owned copies, so concurrent writers never invalidate a
   * value held by a reader.
   */
  class InMemoryStorage : public BufferStorage {
   public:
    ~InMemoryStorage() override = default;

    [[nodiscard]] outcome::result<ByteVecOrView> get(
        const ByteView &key) const override;

    [[nodiscard]] outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    [[nodiscard]] outcome::result<bool> contains(
        const ByteView &key) const override;

    outcome::result<void> remove(const ByteView &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    [[nodiscard]] std::optional<size_t> byteSizeHint() const override;

   private:
    friend class InMemoryBatch;
    friend class InMemorySpacedBatch;

    using Writes = std::map<std::string, std::optional<ByteVec>>;

    // Applies all writes under one lock; std::nullopt means removal
    void applyBatch(Writes &&writes);

    void putUnsafe(std::string key, ByteVec value);
    void removeUnsafe(const std::string &key);

    mutable std::shared_mutex mutex_;
    std::map<std::string, ByteVec> storage_;
    size_t size_ = 0;
  };

}  // namespace dataworker::storage
