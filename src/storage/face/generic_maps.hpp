/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include <qtils/outcome.hpp>

#include "storage/face/view.hpp"

namespace dataworker::storage::face {

  template <typename K, typename V>
  struct Readable {
    virtual ~Readable() = default;

    [[nodiscard]] virtual outcome::result<bool> contains(
        const View<K> &key) const = 0;

    /// Value by key, StorageError::NOT_FOUND if absent
    [[nodiscard]] virtual outcome::result<OwnedOrView<V>> get(
        const View<K> &key) const = 0;

    /// Value by key, std::nullopt if absent
    [[nodiscard]] virtual outcome::result<std::optional<OwnedOrView<V>>> tryGet(
        const View<K> &key) const = 0;
  };

  template <typename K, typename V>
  struct Writeable {
    virtual ~Writeable() = default;

    virtual outcome::result<void> put(const View<K> &key,
                                      OwnedOrView<V> &&value) = 0;

    virtual outcome::result<void> remove(const View<K> &key) = 0;
  };

  /**
   * @brief Collects writes and applies all of them or none on commit().
   */
  template <typename K, typename V>
  struct WriteBatch : public Writeable<K, V> {
    virtual outcome::result<void> commit() = 0;

    /// Drops pending writes so the batch can be reused
    virtual void clear() = 0;
  };

  /**
   * @brief Key-value map with point reads, writes and atomic batches.
   */
  template <typename K, typename V>
  struct GenericStorage : Readable<K, V>, Writeable<K, V> {
    virtual std::unique_ptr<WriteBatch<K, V>> batch() = 0;

    /// Approximate memory usage in bytes, if the backend knows it
    [[nodiscard]] virtual std::optional<size_t> byteSizeHint() const {
      return std::nullopt;
    }
  };

}  // namespace dataworker::storage::face
