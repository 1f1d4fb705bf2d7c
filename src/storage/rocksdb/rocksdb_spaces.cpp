/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <array>

#include <boost/assert.hpp>
#include <rocksdb/db.h>

#include "storage/rocksdb/rocksdb_spaces.hpp"

namespace dataworker::storage {

  // Column family names of non-default spaces, in Space order
  static constexpr std::array<std::string_view, SpacesCount - 1> kNames{
      "bundles",
      "leaf_status",
      "running_balances",
  };

  std::string_view spaceName(Space space) {
    if (space != Space::Default) {
      BOOST_ASSERT(space < Space::Total);
      return kNames[static_cast<size_t>(space) - 1];
    }
    return rocksdb::kDefaultColumnFamilyName;
  }

  std::optional<Space> spaceFromString(std::string_view string) {
    if (string == rocksdb::kDefaultColumnFamilyName) {
      return Space::Default;
    }
    const auto it = std::ranges::find(kNames, string);
    if (it == kNames.end()) {
      return std::nullopt;
    }
    return static_cast<Space>(std::distance(kNames.begin(), it) + 1);
  }

}  // namespace dataworker::storage
