/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace dataworker {

  // Upper bounds of SSZ lists in leaves and persisted records
  constexpr size_t MAX_CHAINS = 256;
  constexpr size_t MAX_LEAVES = 1 << 16;
  constexpr size_t MAX_REFUNDS_PER_LEAF = 1 << 12;
  constexpr size_t MAX_FILLS_PER_REFUND = 1 << 12;
  constexpr size_t MAX_L1_TOKENS_PER_LEAF = 256;
  constexpr size_t MAX_RUNNING_BALANCE_TRANSITIONS = 1 << 16;
  constexpr size_t MAX_PROOF_DEPTH = 64;

  /// Protocol version of leaf encoding and running-balance formula
  constexpr uint32_t PROTOCOL_VERSION = 1;

}  // namespace dataworker
