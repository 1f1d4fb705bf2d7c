/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "types/amount_word.hpp"
#include "types/deposit.hpp"

namespace dataworker {

  /**
   * @struct RelayData
   * Slow-relay leaf: everything the destination spoke needs to pay out an
   * unfilled deposit without reading deposit history.
   */
  struct RelayData : ssz::ssz_container {
    Address depositor;
    Address recipient;
    Address destination_token;
    AmountWord amount;
    ChainId origin_chain_id = 0;
    ChainId destination_chain_id = 0;
    FeePct realized_lp_fee_pct = 0;
    FeePct relayer_fee_pct = 0;
    DepositId deposit_id = 0;

    SSZ_CONT(depositor,
             recipient,
             destination_token,
             amount,
             origin_chain_id,
             destination_chain_id,
             realized_lp_fee_pct,
             relayer_fee_pct,
             deposit_id);

    bool operator==(const RelayData &) const = default;

    static RelayData from(const Deposit &deposit) {
      return RelayData{
          .depositor = deposit.depositor,
          .recipient = deposit.recipient,
          .destination_token = deposit.destination_token,
          .amount = toWord(deposit.amount),
          .origin_chain_id = deposit.origin_chain_id,
          .destination_chain_id = deposit.destination_chain_id,
          .realized_lp_fee_pct = deposit.realized_lp_fee_pct,
          .relayer_fee_pct = deposit.relayer_fee_pct,
          .deposit_id = deposit.deposit_id,
      };
    }
  };

}  // namespace dataworker
