/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "types/amount_word.hpp"
#include "types/constants.hpp"

namespace dataworker {

  /**
   * @struct PoolRebalanceLeaf
   * Hub pool settlement for one chain. Lists are parallel and indexed by
   * `l1_tokens`, which is sorted ascending. A chain with many tokens is split
   * into several leaves distinguished by `group_index`.
   */
  struct PoolRebalanceLeaf : ssz::ssz_variable_size_container {
    LeafId leaf_id = 0;
    ChainId chain_id = 0;
    uint32_t group_index = 0;
    ssz::list<Address, MAX_L1_TOKENS_PER_LEAF> l1_tokens;
    ssz::list<AmountWord, MAX_L1_TOKENS_PER_LEAF> bundle_lp_fees;
    /// Signed: amount sent from the hub pool to the chain
    ssz::list<AmountWord, MAX_L1_TOKENS_PER_LEAF> net_send_amounts;
    /// Signed: balance carried to the next bundle
    ssz::list<AmountWord, MAX_L1_TOKENS_PER_LEAF> running_balances;

    SSZ_CONT(leaf_id,
             chain_id,
             group_index,
             l1_tokens,
             bundle_lp_fees,
             net_send_amounts,
             running_balances);

    bool operator==(const PoolRebalanceLeaf &) const = default;
  };

}  // namespace dataworker
