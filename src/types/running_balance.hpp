/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "types/amount_word.hpp"

namespace dataworker {

  /**
   * @struct RunningBalanceEntry
   * Ledger entry of one (chain, l1 token) pair.
   * `version` is the id of the bundle that wrote it, 0 if never written.
   */
  struct RunningBalanceEntry : ssz::ssz_container {
    ChainId chain_id = 0;
    Address l1_token;
    AmountWord balance;
    BundleId version = 0;

    SSZ_CONT(chain_id, l1_token, balance, version);

    bool operator==(const RunningBalanceEntry &) const = default;
  };

  /**
   * @struct RunningBalanceTransition
   * One carry-forward step: previous → previous + delta − net_send
   */
  struct RunningBalanceTransition : ssz::ssz_container {
    ChainId chain_id = 0;
    Address l1_token;
    BundleId previous_version = 0;
    AmountWord previous_balance;
    AmountWord delta;
    AmountWord net_send;
    AmountWord next_balance;

    SSZ_CONT(chain_id,
             l1_token,
             previous_version,
             previous_balance,
             delta,
             net_send,
             next_balance);

    bool operator==(const RunningBalanceTransition &) const = default;
  };

}  // namespace dataworker
