/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>

#include "storage/in_memory/in_memory_storage.hpp"

namespace dataworker::storage {

  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db_{db} {}

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override {
      writes_[key.toHex()] = std::move(value).intoByteVec();
      return outcome::success();
    }

    outcome::result<void> remove(const ByteView &key) override {
      writes_[key.toHex()] = std::nullopt;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      db_.applyBatch(std::move(writes_));
      writes_.clear();
      return outcome::success();
    }

    void clear() override {
      writes_.clear();
    }

   private:
    InMemoryStorage::Writes writes_;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    InMemoryStorage &db_;
  };
}  // namespace dataworker::storage
