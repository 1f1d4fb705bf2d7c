/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/byte_vec_or_view.hpp>

#include "storage/face/generic_maps.hpp"

namespace dataworker::storage::face {

  template <>
  struct OwnedOrViewTrait<qtils::ByteVec> {
    using type = qtils::ByteVecOrView;
  };

  template <>
  struct ViewTrait<qtils::ByteVec> {
    using type = qtils::ByteView;
  };

}  // namespace dataworker::storage::face

namespace dataworker::storage {

  using qtils::ByteVec;
  using qtils::ByteVecOrView;
  using qtils::ByteView;

  using BufferBatch = face::WriteBatch<ByteVec, ByteVec>;

  using BufferStorage = face::GenericStorage<ByteVec, ByteVec>;

}  // namespace dataworker::storage
