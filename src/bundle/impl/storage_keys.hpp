/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/key_encoding.hpp"
#include "types/primitives.hpp"
#include "types/root_type.hpp"

namespace dataworker::bundle {

  /// Key of a bundle record: big-endian bundle id
  inline qtils::ByteVec bundleKey(BundleId bundle_id) {
    qtils::ByteVec key;
    storage::appendBigEndian(key, bundle_id);
    return key;
  }

  /// Key of a leaf status: bundle id, root type byte, leaf id
  inline qtils::ByteVec leafStatusKey(BundleId bundle_id,
                                      RootType root_type,
                                      LeafId leaf_id) {
    qtils::ByteVec key;
    storage::appendBigEndian(key, bundle_id);
    key.push_back(static_cast<uint8_t>(root_type));
    storage::appendBigEndian(key, leaf_id);
    return key;
  }

}  // namespace dataworker::bundle
