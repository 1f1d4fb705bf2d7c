/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "storage/buffer_map_types.hpp"
#include "storage/spaces.hpp"

namespace dataworker::storage {

  /**
   * @class SpacedBatch
   * @brief Writes to several spaces that are committed all or none.
   */
  class SpacedBatch {
   public:
    virtual ~SpacedBatch() = default;

    virtual outcome::result<void> put(Space space,
                                      const ByteView &key,
                                      ByteVecOrView &&value) = 0;

    virtual outcome::result<void> remove(Space space, const ByteView &key) = 0;

    virtual outcome::result<void> commit() = 0;

    virtual void clear() = 0;
  };

  /**
   * @class SpacedStorage
   * @brief Gives access to the byte maps of the logical storage spaces.
   */
  class SpacedStorage {
   public:
    virtual ~SpacedStorage() = default;

    /**
     * Retrieve the map of a storage space
     * @param space - identifier of required space
     * @return buffer storage of the space
     */
    virtual std::shared_ptr<BufferStorage> getSpace(Space space) = 0;

    /// Batch spanning all spaces
    virtual std::unique_ptr<SpacedBatch> createBatch() = 0;
  };

}  // namespace dataworker::storage
