/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include <mutex>

#include <boost/assert.hpp>

#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/storage_error.hpp"

namespace dataworker::storage {

  outcome::result<ByteVecOrView> InMemoryStorage::get(
      const ByteView &key) const {
    OUTCOME_TRY(value_opt, tryGet(key));
    if (not value_opt.has_value()) {
      return StorageError::NOT_FOUND;
    }
    return std::move(value_opt.value());
  }

  outcome::result<std::optional<ByteVecOrView>> InMemoryStorage::tryGet(
      const ByteView &key) const {
    std::shared_lock lock{mutex_};
    auto it = storage_.find(key.toHex());
    if (it == storage_.end()) {
      return std::nullopt;
    }
    return ByteVecOrView{ByteVec{it->second}};
  }

  outcome::result<void> InMemoryStorage::put(const ByteView &key,
                                             ByteVecOrView &&value) {
    std::unique_lock lock{mutex_};
    putUnsafe(key.toHex(), std::move(value).intoByteVec());
    return outcome::success();
  }

  outcome::result<bool> InMemoryStorage::contains(const ByteView &key) const {
    std::shared_lock lock{mutex_};
    return storage_.contains(key.toHex());
  }

  outcome::result<void> InMemoryStorage::remove(const ByteView &key) {
    std::unique_lock lock{mutex_};
    removeUnsafe(key.toHex());
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }

  std::optional<size_t> InMemoryStorage::byteSizeHint() const {
    std::shared_lock lock{mutex_};
    return size_;
  }

  void InMemoryStorage::applyBatch(Writes &&writes) {
    std::unique_lock lock{mutex_};
    for (auto &[key, value] : writes) {
      if (value.has_value()) {
        putUnsafe(key, std::move(value.value()));
      } else {
        removeUnsafe(key);
      }
    }
  }

  void InMemoryStorage::putUnsafe(std::string key, ByteVec value) {
    auto it = storage_.find(key);
    if (it != storage_.end()) {
      BOOST_ASSERT(size_ >= it->second.size());
      size_ -= it->second.size();
    }
    size_ += value.size();
    storage_[std::move(key)] = std::move(value);
  }

  void InMemoryStorage::removeUnsafe(const std::string &key) {
    auto it = storage_.find(key);
    if (it != storage_.end()) {
      size_ -= it->second.size();
      storage_.erase(it);
    }
  }
}  // namespace dataworker::storage
