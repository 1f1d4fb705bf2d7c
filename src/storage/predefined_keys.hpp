/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/literals.hpp>

namespace dataworker::storage {

  using qtils::literals::operator""_vec;

  /// Id of the most recently proposed bundle, in Space::Default
  inline const qtils::ByteVec kLastBundleIdLookupKey =
      ":dataworker:last_bundle_id"_vec;

}  // namespace dataworker::storage
