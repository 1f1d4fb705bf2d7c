/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace dataworker::storage {

  /**
   * @enum Space
   * @brief Logical key spaces of the dataworker database.
   *
   * Every space is a separate column family in RocksDB and a separate map in
   * the in-memory backend.
   */
  enum class Space : uint8_t {
    Default = 0,      ///< Counters and other singletons
    Bundles,          ///< Bundle id → bundle record
    LeafStatus,       ///< (bundle, root type, leaf) → execution status
    RunningBalances,  ///< (chain, l1 token) → running balance entry

    Total  ///< Total number of defined spaces (must be last)
  };

  constexpr size_t SpacesCount = static_cast<size_t>(Space::Total);
}  // namespace dataworker::storage
