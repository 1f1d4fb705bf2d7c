/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <boost/endian/conversion.hpp>
#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>

namespace dataworker::storage {

  /// Big-endian integers keep the byte order of keys equal to numeric order
  template <typename T>
  void appendBigEndian(qtils::ByteVec &out, T value) {
    auto be = boost::endian::native_to_big(value);
    auto *bytes = reinterpret_cast<const uint8_t *>(&be);
    out.insert(out.end(), bytes, bytes + sizeof(be));
  }

  template <typename T>
  std::optional<T> readBigEndian(qtils::BytesIn bytes) {
    if (bytes.size() != sizeof(T)) {
      return std::nullopt;
    }
    T value = 0;
    for (auto byte : bytes) {
      value = static_cast<T>((value << 8) | byte);
    }
    return value;
  }

}  // namespace dataworker::storage
