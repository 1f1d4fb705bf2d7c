/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/bytes.hpp>

#include "types/primitives.hpp"

namespace dataworker::crypto {

  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(qtils::ByteView input);

  /**
   * SHA-256 of the concatenation `left ‖ right`
   */
  Hash256 sha256(const Hash256 &left, const Hash256 &right);

}  // namespace dataworker::crypto
