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
   * @struct RelayerRefund
   * Refund owed to one relayer in one token on the leaf's chain.
   * `fill_amounts` are sorted ascending and `amount` is their sum.
   */
  struct RelayerRefund : ssz::ssz_variable_size_container {
    Address relayer;
    Address refund_token;
    AmountWord amount;
    ssz::list<AmountWord, MAX_FILLS_PER_REFUND> fill_amounts;

    SSZ_CONT(relayer, refund_token, amount, fill_amounts);

    bool operator==(const RelayerRefund &) const = default;
  };

  /**
   * @struct RelayerRefundLeaf
   * All relayer refunds paid out on one repayment chain
   */
  struct RelayerRefundLeaf : ssz::ssz_variable_size_container {
    LeafId leaf_id = 0;
    ChainId chain_id = 0;
    ssz::list<RelayerRefund, MAX_REFUNDS_PER_LEAF> refunds;

    SSZ_CONT(leaf_id, chain_id, refunds);

    bool operator==(const RelayerRefundLeaf &) const = default;
  };

}  // namespace dataworker
